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
#ifndef BLOCKPERF_EVENTS_HPP
#define BLOCKPERF_EVENTS_HPP

#include <bitcoin/system.hpp>
#include <blockperf/error.hpp>

namespace blockperf {

/// Reporting events.
enum events : uint8_t
{
    /// Ingestion.
    event_discarded,     // malformed trace record or payload ignored

    /// Peers.
    peer_transition,     // peer state set from log
    peer_mismatch,       // peer from-state differs from tracked state
    peers_added,         // peers inserted by reconciliation
    peers_removed,       // peers removed by reconciliation
    peers_cleared,       // peer map cleared on node restart
    snapshot_failed,     // os connection snapshot unavailable

    /// Blocks.
    sample_emitted,      // block sample handed to sink
    sample_failed,       // block sample rejected by sink
    record_discarded,    // block adopted without complete milestones
    record_swept,        // stale block record removed

    /// Timespans.
    reconcile_msecs,     // reconciliation pass in milliseconds
    sweep_msecs          // sweep pass in milliseconds
};

} // namespace blockperf

#endif
