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
#include <blockperf/trace/transition.hpp>

#include <array>
#include <blockperf/define.hpp>

namespace blockperf {

struct transition_entry
{
    transition change;
    peer_state from;
    peer_state to;
    bool governed;
    std::string_view name;
};

// Indexed by transition.
constexpr std::array<transition_entry, 8> transitions
{{
    { transition::cold_to_warm, peer_state::cold, peer_state::warm, false, "ColdToWarm" },
    { transition::warm_to_hot, peer_state::warm, peer_state::hot, false, "WarmToHot" },
    { transition::hot_to_warm, peer_state::hot, peer_state::warm, false, "HotToWarm" },
    { transition::warm_to_cold, peer_state::warm, peer_state::cold, false, "WarmToCold" },
    { transition::promoted_to_warm, peer_state::cold, peer_state::warm, true, "PromotedToWarm" },
    { transition::promoted_to_hot, peer_state::warm, peer_state::hot, true, "PromotedToHot" },
    { transition::demoted_to_warm, peer_state::hot, peer_state::warm, true, "DemotedToWarm" },
    { transition::demoted_to_cold, peer_state::warm, peer_state::cold, true, "DemotedToCold" }
}};

static const transition_entry& entry(transition value) NOEXCEPT
{
    return transitions[static_cast<size_t>(value)];
}

peer_state from_state(transition value) NOEXCEPT
{
    return entry(value).from;
}

peer_state to_state(transition value) NOEXCEPT
{
    return entry(value).to;
}

bool is_governed(transition value) NOEXCEPT
{
    return entry(value).governed;
}

bool to_transition(transition& out, peer_state from, peer_state to) NOEXCEPT
{
    for (const auto& item: transitions)
    {
        if (!item.governed && item.from == from && item.to == to)
        {
            out = item.change;
            return true;
        }
    }

    return false;
}

bool parse_state(peer_state& out, std::string_view text) NOEXCEPT
{
    if (text == "Cold")
        out = peer_state::cold;
    else if (text == "Warm")
        out = peer_state::warm;
    else if (text == "Hot")
        out = peer_state::hot;
    else
        return false;

    return true;
}

std::string_view to_string(peer_state value) NOEXCEPT
{
    switch (value)
    {
        case peer_state::cold:
            return "cold";
        case peer_state::warm:
            return "warm";
        case peer_state::hot:
            return "hot";
        case peer_state::unknown:
        default:
            return "unknown";
    }
}

std::string_view to_string(peer_direction value) NOEXCEPT
{
    return value == peer_direction::inbound ? "inbound" : "outbound";
}

std::string_view to_string(transition value) NOEXCEPT
{
    return entry(value).name;
}

} // namespace blockperf
