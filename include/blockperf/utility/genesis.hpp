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
#ifndef BLOCKPERF_UTILITY_GENESIS_HPP
#define BLOCKPERF_UTILITY_GENESIS_HPP

#include <blockperf/define.hpp>

namespace blockperf {

/// Network parameters of the monitored chain, thread safe.
/// Slot times are relative to a genesis start and a fixed slot length.
class BP_API genesis
{
public:
    DEFAULT_COPY_MOVE_DESTRUCT(genesis);

    /// Presets by network name (mainnet, preprod, preview).
    static std::optional<genesis> preset(const std::string& network) NOEXCEPT;

    genesis(uint32_t magic, const instant& start,
        const span& slot_length) NOEXCEPT;

    /// Network magic.
    uint32_t magic() const NOEXCEPT;

    /// Genesis start time.
    const instant& start() const NOEXCEPT;

    /// Duration of one slot.
    const span& slot_length() const NOEXCEPT;

    /// Time at which the given slot begins.
    instant slot_time(uint64_t slot) const NOEXCEPT;

private:
    uint32_t magic_;
    instant start_;
    span slot_length_;
};

} // namespace blockperf

#endif
