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
#ifndef BLOCKPERF_UTILITY_ENDPOINT_HPP
#define BLOCKPERF_UTILITY_ENDPOINT_HPP

#include <string_view>
#include <blockperf/define.hpp>

namespace blockperf {

/// Socket address as reported by the node trace or by the os.
/// The address is retained as text, ipv6 without brackets.
struct BP_API endpoint
{
    std::string address{};
    uint16_t port{};

    /// Text form, ipv6 addresses bracketed ("[::1]:3001").
    std::string to_string() const NOEXCEPT;

    bool operator==(const endpoint& other) const NOEXCEPT = default;
};

struct BP_API endpoint_hash
{
    size_t operator()(const endpoint& value) const NOEXCEPT;
};

/// Parse "a.b.c.d:port" or "[v6]:port", false if malformed.
BP_API bool parse_endpoint(endpoint& out, std::string_view text) NOEXCEPT;

/// Parse a trace connection id "<local>:<port> <remote>:<port>".
BP_API bool parse_connection(endpoint& local, endpoint& remote,
    std::string_view text) NOEXCEPT;

/// Parse a port from text, false if not a decimal uint16.
BP_API bool parse_port(uint16_t& out, std::string_view text) NOEXCEPT;

} // namespace blockperf

#endif
