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
#ifndef BLOCKPERF_TRACE_STATUS_CHANGE_HPP
#define BLOCKPERF_TRACE_STATUS_CHANGE_HPP

#include <string_view>
#include <blockperf/define.hpp>
#include <blockperf/trace/transition.hpp>
#include <blockperf/utility/endpoint.hpp>

namespace blockperf {

/// Decoded peer selection "peerStatusChangeType" value.
struct BP_API status_change
{
    transition change{};
    std::optional<endpoint> local{};
    endpoint remote{};
};

/// Parse either of:
/// "<From>To<To> (Just <localIp>:<localPort>) <remoteIp>:<remotePort>"
/// "<From>To<To> <remoteIp>:<remotePort>"
/// States are Cold, Warm or Hot and the pair must be a defined transition.
BP_API bool parse_status_change(status_change& out,
    std::string_view text) NOEXCEPT;

} // namespace blockperf

#endif
