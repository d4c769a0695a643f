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
#ifndef BLOCKPERF_BLOCKS_BLOCK_SAMPLE_HPP
#define BLOCKPERF_BLOCKS_BLOCK_SAMPLE_HPP

#include <blockperf/define.hpp>
#include <blockperf/utility/endpoint.hpp>

namespace blockperf {

/// Configured values stamped on each sample.
struct BP_API sample_metadata
{
    uint32_t magic{};
    std::string version{};
    endpoint local{};
};

/// Finalized propagation timing of one block, not mutated once emitted.
struct BP_API block_sample
{
    uint32_t magic{};
    std::string bp_version{};
    uint64_t block_no{};
    uint64_t slot_no{};
    std::string block_hash{};
    uint64_t block_size{};

    endpoint header_remote{};
    endpoint block_remote{};
    endpoint block_local{};

    /// Header seen relative to slot time.
    span header_delta{};

    /// Fetch request relative to header seen.
    span request_delta{};

    /// Download completed relative to fetch request.
    span response_delta{};

    /// Adoption relative to download completed.
    span adopt_delta{};

    /// Header seen to adoption (request + response + adopt).
    span block_g{};

    /// Any delta is negative (clock skew or reordering).
    bool is_skewed() const NOEXCEPT;
};

/// Json model of a sample (backend field names, deltas in seconds text).
BP_API void tag_invoke(const boost::json::value_from_tag&,
    boost::json::value& value, const block_sample& sample) NOEXCEPT;

} // namespace blockperf

#endif
