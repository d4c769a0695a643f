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
#ifndef BLOCKPERF_INTERFACES_EVENT_SOURCE_HPP
#define BLOCKPERF_INTERFACES_EVENT_SOURCE_HPP

#include <blockperf/define.hpp>
#include <blockperf/trace/trace_event.hpp>

namespace blockperf {

/// Ordered stream of decoded trace records.
/// Called only from the dispatch strand, implementations need not be thread
/// safe.
class BP_API event_source
{
public:
    virtual ~event_source() NOEXCEPT = default;

    /// Read the next record.
    /// success: out is populated.
    /// source_empty: no record is currently available (poll again).
    /// source_exhausted: no further records will be available.
    /// malformed_event: a line was consumed but could not be decoded.
    /// source_unavailable: the underlying stream cannot be read.
    virtual code read(trace_event& out) NOEXCEPT = 0;
};

} // namespace blockperf

#endif
