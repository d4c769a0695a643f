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
#ifndef BLOCKPERF_INTERFACES_CONNECTION_SOURCE_HPP
#define BLOCKPERF_INTERFACES_CONNECTION_SOURCE_HPP

#include <blockperf/define.hpp>
#include <blockperf/peers/peer.hpp>

namespace blockperf {

/// Snapshot of the established sockets of the monitored node.
/// Called only from the peers strand.
class BP_API connection_source
{
public:
    virtual ~connection_source() NOEXCEPT = default;

    /// Replace out with the current connections.
    /// Returns error::snapshot_unavailable if the os cannot be queried.
    virtual code snapshot(connection::list& out) NOEXCEPT = 0;
};

} // namespace blockperf

#endif
