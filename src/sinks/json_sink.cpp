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
#include <blockperf/sinks/json_sink.hpp>

#include <blockperf/define.hpp>

namespace blockperf {

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

json_sink::json_sink(std::ostream& stream) NOEXCEPT
  : stream_(stream)
{
}

code json_sink::submit(const block_sample& sample) NOEXCEPT
{
    if (!stream_.good())
        return error::sink_unavailable;

    stream_ << serialize(sample) << '\n';
    stream_.flush();
    return stream_.good() ? error::success : error::sink_unavailable;
}

std::string json_sink::serialize(const block_sample& sample) NOEXCEPT
{
    return boost::json::serialize(boost::json::value_from(sample));
}

BC_POP_WARNING()

} // namespace blockperf
