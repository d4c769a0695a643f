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
#ifndef BLOCKPERF_TRACE_PAYLOADS_HPP
#define BLOCKPERF_TRACE_PAYLOADS_HPP

#include <vector>
#include <blockperf/define.hpp>
#include <blockperf/trace/transition.hpp>
#include <blockperf/utility/endpoint.hpp>

namespace blockperf {

/// Classified event kinds.
enum class event_kind : uint8_t
{
    ignored,
    inbound_governor_counters,
    node_restart,
    peer_promoted_warm,
    peer_promoted_hot,
    peer_demoted_warm,
    peer_demoted_cold,
    peer_status_changed,
    block_header_seen,
    block_fetch_requested,
    block_downloaded,
    block_adopted
};

/// Typed payloads.
/// ---------------------------------------------------------------------------

/// Inbound governor peer counts.
struct counters_event
{
    uint64_t idle{};
    uint64_t cold{};
    uint64_t warm{};
    uint64_t hot{};
};

/// Node server started, prior connections are gone.
struct restart_event
{
};

/// Promotion, demotion or status change of one peer.
struct transition_event
{
    transition change{};
    peer_direction direction{};
    endpoint remote{};
    std::optional<endpoint> local{};
};

/// First header download from a peer.
struct header_event
{
    std::string hash{};
    uint64_t block_no{};
    uint64_t slot_no{};

    /// Zero when not traced.
    uint64_t size{};
    endpoint remote{};
};

/// Block fetch request sent to a peer.
struct fetch_event
{
    std::string hash{};
    endpoint remote{};
};

/// Block download completed from a peer.
struct download_event
{
    std::string hash{};
    uint64_t size{};
    endpoint remote{};
};

/// Blocks added to the current chain (directly or by fork switch).
struct adopt_event
{
    struct header
    {
        std::string hash{};
        uint64_t block_no{};
        uint64_t slot_no{};
    };

    std::vector<header> headers{};
};

/// Closed set of payloads, monostate when ignored.
typedef std::variant<
    std::monostate,
    counters_event,
    restart_event,
    transition_event,
    header_event,
    fetch_event,
    download_event,
    adopt_event> payload;

/// A classified trace record.
struct classified
{
    event_kind kind{ event_kind::ignored };
    instant at{};
    payload value{};
};

} // namespace blockperf

#endif
