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
#ifndef BLOCKPERF_PEERS_PEER_TRACKER_HPP
#define BLOCKPERF_PEERS_PEER_TRACKER_HPP

#include <array>
#include <unordered_map>
#include <blockperf/define.hpp>
#include <blockperf/peers/peer.hpp>
#include <blockperf/trace/payloads.hpp>

namespace blockperf {

/// Authoritative peer map.
/// Existence is reconciled against os connections, state against the trace.
/// Not thread safe, owned by chaser_peers (strand).
class BP_API peer_tracker
{
public:
    /// Peer counts by direction (row) and state (column).
    typedef std::array<std::array<size_t, 4>, 2> tally;

    struct reconciliation
    {
        size_t added{};
        size_t removed{};
    };

    DELETE_COPY_MOVE_DESTRUCT(peer_tracker);

    peer_tracker() NOEXCEPT;

    /// Set the peer state from a trace transition, create peer if absent.
    /// The transition is applied regardless of the tracked state, but
    /// error::transition_mismatch is returned if the tracked state is known
    /// and differs from the transition's from-state.
    virtual code apply(const transition_event& event,
        const instant& at) NOEXCEPT;

    /// Insert unknown peers for untracked connections and remove peers that
    /// have no connection. Idempotent for an unchanged connection set.
    virtual reconciliation reconcile(const connection::list& connections,
        const instant& at) NOEXCEPT;

    /// Clear all peers (node restarted).
    virtual void reset() NOEXCEPT;

    /// Retain the most recent inbound governor counters.
    virtual void set_counters(const counters_event& counters) NOEXCEPT;
    virtual const counters_event& counters() const NOEXCEPT;

    /// Copy of the peer set.
    virtual peer::list snapshot() const NOEXCEPT;

    /// Count of peers by direction and state.
    virtual tally report() const NOEXCEPT;

    /// Tracked peer by remote endpoint, nullptr if not tracked.
    virtual const peer* find(const endpoint& remote) const NOEXCEPT;

    /// Number of tracked peers.
    virtual size_t size() const NOEXCEPT;

private:
    std::unordered_map<endpoint, peer, endpoint_hash> peers_;
    counters_event counters_;
};

} // namespace blockperf

#endif
