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
#include <blockperf/sources/proc_connections.hpp>

#include <charconv>
#include <sstream>
#include <vector>
#include <blockperf/define.hpp>

namespace blockperf {

using namespace bc::system;
namespace ip = boost::asio::ip;

// Socket state code of TCP_ESTABLISHED.
constexpr std::string_view established{ "01" };

// sl local_address rem_address st tx:rx tr:when retrnsmt uid timeout inode
constexpr size_t local_field = 1;
constexpr size_t remote_field = 2;
constexpr size_t state_field = 3;
constexpr size_t inode_field = 9;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

template <typename Integer>
static bool from_hex(Integer& out, std::string_view text) NOEXCEPT
{
    const auto end = std::next(text.data(), text.size());
    const auto result = std::from_chars(text.data(), end, out, 16);
    return !text.empty() && result.ec == std::errc{} && result.ptr == end;
}

// Each 32 bit word is written in host (little endian) order.
static bool to_bytes(uint8_t* out, std::string_view text) NOEXCEPT
{
    constexpr size_t word = 8;
    for (size_t offset = 0; offset < text.size(); offset += word)
    {
        uint32_t value{};
        if (!from_hex(value, text.substr(offset, word)))
            return false;

        *out++ = static_cast<uint8_t>(value);
        *out++ = static_cast<uint8_t>(value >> 8);
        *out++ = static_cast<uint8_t>(value >> 16);
        *out++ = static_cast<uint8_t>(value >> 24);
    }

    return true;
}

proc_connections::proc_connections(uint16_t port, uint32_t pid,
    const std::filesystem::path& root) NOEXCEPT
  : port_(port), pid_(pid), root_(root)
{
}

code proc_connections::snapshot(connection::list& out) NOEXCEPT
{
    out.clear();
    inodes filter{};
    if (!is_zero(pid_) && !socket_inodes(filter))
        return error::snapshot_unavailable;

    const auto selected = is_zero(pid_) ? nullptr : &filter;
    system::ifstream tcp4{ root_ / "net" / "tcp" };
    system::ifstream tcp6{ root_ / "net" / "tcp6" };

    // Either table is absent when its protocol is disabled.
    if (!tcp4.good() && !tcp6.good())
        return error::snapshot_unavailable;

    if ((tcp4.good() && !parse(out, tcp4, port_, false, selected)) ||
        (tcp6.good() && !parse(out, tcp6, port_, true, selected)))
        return error::snapshot_unavailable;

    return error::success;
}

bool proc_connections::parse(connection::list& out, std::istream& table,
    uint16_t port, bool ipv6, const inodes* filter) NOEXCEPT
{
    std::string line{};

    // Column headings.
    if (!std::getline(table, line))
        return false;

    while (std::getline(table, line))
    {
        std::istringstream reader{ line };
        std::vector<std::string> fields{};
        for (std::string field{}; reader >> field;)
            fields.push_back(std::move(field));

        if (fields.size() <= inode_field)
            return false;

        if (fields.at(state_field) != established)
            continue;

        connection value{};
        if (!parse_address(value.local, fields.at(local_field), ipv6) ||
            !parse_address(value.remote, fields.at(remote_field), ipv6))
            return false;

        if (is_null(filter))
        {
            if (value.local.port != port && value.remote.port != port)
                continue;
        }
        else
        {
            uint64_t inode{};
            const auto& text = fields.at(inode_field);
            const auto end = std::next(text.data(), text.size());
            if (std::from_chars(text.data(), end, inode).ec != std::errc{})
                return false;

            if (!filter->contains(inode))
                continue;
        }

        value.direction = value.local.port == port ?
            peer_direction::inbound : peer_direction::outbound;

        out.push_back(std::move(value));
    }

    return !table.bad();
}

bool proc_connections::parse_address(endpoint& out, std::string_view text,
    bool ipv6) NOEXCEPT
{
    const auto colon = text.find(':');
    if (colon == std::string_view::npos)
        return false;

    const auto host = text.substr(zero, colon);
    if (!from_hex(out.port, text.substr(add1(colon))))
        return false;

    if (!ipv6)
    {
        ip::address_v4::bytes_type bytes{};
        if (host.size() != two * bytes.size() || !to_bytes(bytes.data(), host))
            return false;

        out.address = ip::address_v4{ bytes }.to_string();
        return true;
    }

    ip::address_v6::bytes_type bytes{};
    if (host.size() != two * bytes.size() || !to_bytes(bytes.data(), host))
        return false;

    const ip::address_v6 address{ bytes };
    out.address = address.is_v4_mapped() ?
        ip::make_address_v4(ip::v4_mapped, address).to_string() :
        address.to_string();

    return true;
}

// protected
// ----------------------------------------------------------------------------

bool proc_connections::socket_inodes(inodes& out) const NOEXCEPT
{
    constexpr std::string_view prefix{ "socket:[" };

    std::error_code ec{};
    std::filesystem::directory_iterator it{ root_ / std::to_string(pid_) /
        "fd", ec };
    if (ec)
        return false;

    for (const auto& entry: it)
    {
        const auto target = std::filesystem::read_symlink(entry.path(), ec);
        if (ec)
            continue;

        const auto text = target.string();
        if (!text.starts_with(prefix) || !text.ends_with(']'))
            continue;

        uint64_t inode{};
        const auto begin = std::next(text.data(), prefix.size());
        const auto end = std::prev(std::next(text.data(), text.size()));
        if (std::from_chars(begin, end, inode).ec == std::errc{})
            out.insert(inode);
    }

    return true;
}

BC_POP_WARNING()

} // namespace blockperf
