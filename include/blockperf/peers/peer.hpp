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
#ifndef BLOCKPERF_PEERS_PEER_HPP
#define BLOCKPERF_PEERS_PEER_HPP

#include <vector>
#include <blockperf/define.hpp>
#include <blockperf/trace/transition.hpp>
#include <blockperf/utility/endpoint.hpp>

namespace blockperf {

/// A tracked peer, identified by its remote endpoint.
struct BP_API peer
{
    typedef std::vector<peer> list;

    endpoint remote{};
    std::optional<endpoint> local{};
    peer_direction direction{ peer_direction::outbound };
    peer_state state{ peer_state::unknown };
    instant updated{};
};

/// An established os socket of the monitored node.
struct BP_API connection
{
    typedef std::vector<connection> list;

    endpoint local{};
    endpoint remote{};
    peer_direction direction{ peer_direction::outbound };
};

} // namespace blockperf

#endif
