/**
 * Copyright (c) 2011-2025 libbitcoin developers (see AUTHORS)
 *
 * This file is part of blockperf.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include <blockperf/chasers/chaser.hpp>

#include <blockperf/collector.hpp>
#include <blockperf/configuration.hpp>
#include <blockperf/define.hpp>

namespace blockperf {

using namespace network;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

chaser::chaser(collector& collector) NOEXCEPT
  : reporter(collector.log),
    collector_(collector),
    strand_(collector.service().get_executor())
{
}

// Methods.
// ----------------------------------------------------------------------------

void chaser::stopping(const code&) NOEXCEPT
{
}

void chaser::stop() NOEXCEPT
{
}

bool chaser::closed() const NOEXCEPT
{
    return collector_.closed();
}

// Strand.
// ----------------------------------------------------------------------------

asio::strand& chaser::strand() NOEXCEPT
{
    return strand_;
}

bool chaser::stranded() const NOEXCEPT
{
    return strand_.running_in_this_thread();
}

// Properties.
// ----------------------------------------------------------------------------

const configuration& chaser::config() const NOEXCEPT
{
    return collector_.config();
}

const genesis& chaser::chain() const NOEXCEPT
{
    return collector_.chain();
}

collector& chaser::owner() const NOEXCEPT
{
    return collector_;
}

BC_POP_WARNING()

} // namespace blockperf
