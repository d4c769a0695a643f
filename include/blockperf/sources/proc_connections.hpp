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
#ifndef BLOCKPERF_SOURCES_PROC_CONNECTIONS_HPP
#define BLOCKPERF_SOURCES_PROC_CONNECTIONS_HPP

#include <filesystem>
#include <istream>
#include <unordered_set>
#include <blockperf/define.hpp>
#include <blockperf/interfaces/connection_source.hpp>

namespace blockperf {

/// Linux socket tables (/proc/net/tcp and /proc/net/tcp6).
/// Established sockets of the node process are selected by socket inode when
/// a pid is configured, otherwise by the node port at either end.
class BP_API proc_connections
  : public connection_source
{
public:
    typedef std::unordered_set<uint64_t> inodes;

    proc_connections(uint16_t port, uint32_t pid,
        const std::filesystem::path& root="/proc") NOEXCEPT;

    code snapshot(connection::list& out) NOEXCEPT override;

    /// Append the selected established connections of one table.
    /// The inode filter is ignored when null.
    static bool parse(connection::list& out, std::istream& table,
        uint16_t port, bool ipv6, const inodes* filter=nullptr) NOEXCEPT;

    /// Decode a table address ("0100007F:0BB9"), v4-mapped as v4.
    static bool parse_address(endpoint& out, std::string_view text,
        bool ipv6) NOEXCEPT;

protected:
    /// Socket inodes held open by the process.
    virtual bool socket_inodes(inodes& out) const NOEXCEPT;

private:
    // These are const.
    const uint16_t port_;
    const uint32_t pid_;
    const std::filesystem::path root_;
};

} // namespace blockperf

#endif
