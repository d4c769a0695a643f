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
#ifndef BLOCKPERF_TRACE_TRANSITION_HPP
#define BLOCKPERF_TRACE_TRANSITION_HPP

#include <string_view>
#include <blockperf/define.hpp>

namespace blockperf {

/// Peer connection state, unknown until a log event supplies it.
enum class peer_state : uint8_t
{
    unknown,
    cold,
    warm,
    hot
};

/// Inbound connections are accepted on the node port.
enum class peer_direction : uint8_t
{
    inbound,
    outbound
};

/// Peer state transitions observed in the node trace.
/// Peer selection (outbound governor) reports status changes, the inbound
/// governor reports the promotion/demotion equivalents.
enum class transition : uint8_t
{
    cold_to_warm,
    warm_to_hot,
    hot_to_warm,
    warm_to_cold,
    promoted_to_warm,
    promoted_to_hot,
    demoted_to_warm,
    demoted_to_cold
};

/// State the transition leaves.
BP_API peer_state from_state(transition value) NOEXCEPT;

/// State the transition enters.
BP_API peer_state to_state(transition value) NOEXCEPT;

/// True for inbound governor transitions.
BP_API bool is_governed(transition value) NOEXCEPT;

/// Status change transition for the state pair, false if not in the table.
BP_API bool to_transition(transition& out, peer_state from,
    peer_state to) NOEXCEPT;

/// Parse "Cold", "Warm" or "Hot", false otherwise (unknown is not parsed).
BP_API bool parse_state(peer_state& out, std::string_view text) NOEXCEPT;

BP_API std::string_view to_string(peer_state value) NOEXCEPT;
BP_API std::string_view to_string(peer_direction value) NOEXCEPT;
BP_API std::string_view to_string(transition value) NOEXCEPT;

} // namespace blockperf

#endif
