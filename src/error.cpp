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
#include <blockperf/error.hpp>

#include <bitcoin/system.hpp>

namespace blockperf {
namespace error {

DEFINE_ERROR_T_MESSAGE_MAP(error)
{
    // general
    { success, "success" },

    // events
    { unrecognized_event, "unrecognized event" },
    { malformed_event, "malformed event" },
    { malformed_payload, "malformed payload" },
    { invalid_status_change, "invalid status change" },

    // peers
    { transition_mismatch, "transition mismatch" },
    { snapshot_unavailable, "connection snapshot unavailable" },

    // blocks
    { unknown_block, "unknown block" },
    { incomplete_block, "incomplete block" },
    { duplicate_sample, "duplicate sample" },

    // sources
    { source_empty, "source empty" },
    { source_exhausted, "source exhausted" },
    { source_unavailable, "source unavailable" },

    // sinks
    { sink_unavailable, "sink unavailable" }
};

DEFINE_ERROR_T_CATEGORY(error, "blockperf", "blockperf code")

} // namespace error
} // namespace blockperf
