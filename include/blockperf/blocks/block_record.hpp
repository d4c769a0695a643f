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
#ifndef BLOCKPERF_BLOCKS_BLOCK_RECORD_HPP
#define BLOCKPERF_BLOCKS_BLOCK_RECORD_HPP

#include <blockperf/define.hpp>
#include <blockperf/utility/endpoint.hpp>

namespace blockperf {

/// An in-flight block, keyed by hash.
/// Each milestone is set at most once (first writer wins).
struct BP_API block_record
{
    struct sighting
    {
        instant at{};
        endpoint remote{};
    };

    std::string hash{};
    uint64_t block_no{};
    uint64_t slot_no{};
    uint64_t size{};

    /// Time of the first milestone, for staleness.
    instant created{};

    std::optional<sighting> header{};
    std::optional<instant> requested{};
    std::optional<sighting> downloaded{};
    std::optional<instant> adopted{};

    /// All four milestones are set.
    bool is_complete() const NOEXCEPT;
};

} // namespace blockperf

#endif
