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
#include <blockperf/utility/genesis.hpp>

#include <blockperf/define.hpp>

namespace blockperf {

using namespace bc::system;
using namespace std::chrono;

// Shelley-era slots are one second.
constexpr seconds slot_second{ 1 };

std::optional<genesis> genesis::preset(const std::string& network) NOEXCEPT
{
    if (network == "mainnet")
        return genesis{ 764'824'073, instant{ seconds{ 1'591'566'291 } },
            slot_second };

    if (network == "preprod")
        return genesis{ 1, instant{ seconds{ 1'654'041'600 } }, slot_second };

    if (network == "preview")
        return genesis{ 2, instant{ seconds{ 1'666'656'000 } }, slot_second };

    return {};
}

genesis::genesis(uint32_t magic, const instant& start,
    const span& slot_length) NOEXCEPT
  : magic_(magic), start_(start), slot_length_(slot_length)
{
}

uint32_t genesis::magic() const NOEXCEPT
{
    return magic_;
}

const instant& genesis::start() const NOEXCEPT
{
    return start_;
}

const span& genesis::slot_length() const NOEXCEPT
{
    return slot_length_;
}

instant genesis::slot_time(uint64_t slot) const NOEXCEPT
{
    return start_ + slot_length_ * static_cast<int64_t>(slot);
}

} // namespace blockperf
