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
#ifndef BLOCKPERF_ERROR_HPP
#define BLOCKPERF_ERROR_HPP

#include <bitcoin/system.hpp>
#include <blockperf/version.hpp>

namespace blockperf {

/// Alias system code.
/// std::error_code "blockperf" category holds blockperf::error::error_t.
typedef std::error_code code;

namespace error {

/// Trace, peer and block failures are normalized to the error codes below.
/// Discards are not fatal, each is counted by its code and the stream goes on.
enum error_t : uint8_t
{
    /// general
    success,

    /// events
    unrecognized_event,
    malformed_event,
    malformed_payload,
    invalid_status_change,

    /// peers
    transition_mismatch,
    snapshot_unavailable,

    /// blocks
    unknown_block,
    incomplete_block,
    duplicate_sample,

    /// sources
    source_empty,
    source_exhausted,
    source_unavailable,

    /// sinks
    sink_unavailable
};

// No current need for error_code equivalence mapping.
DECLARE_ERROR_T_CODE_CATEGORY(error);

} // namespace error
} // namespace blockperf

DECLARE_STD_ERROR_REGISTRATION(blockperf::error::error)

#endif
