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
#include <blockperf/utility/endpoint.hpp>

#include <charconv>
#include <functional>
#include <blockperf/define.hpp>

namespace blockperf {

using namespace bc::system;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

std::string endpoint::to_string() const NOEXCEPT
{
    const auto text = std::to_string(port);
    if (address.find(':') == std::string::npos)
        return address + ":" + text;

    return "[" + address + "]:" + text;
}

size_t endpoint_hash::operator()(const endpoint& value) const NOEXCEPT
{
    const auto seed = std::hash<std::string>{}(value.address);
    return seed ^ (std::hash<uint16_t>{}(value.port) + 0x9e3779b9 +
        (seed << 6) + (seed >> 2));
}

bool parse_port(uint16_t& out, std::string_view text) NOEXCEPT
{
    if (text.empty())
        return false;

    uint32_t value{};
    const auto end = std::next(text.data(), text.size());
    const auto result = std::from_chars(text.data(), end, value);
    if (result.ec != std::errc{} || result.ptr != end ||
        value > max_uint16)
        return false;

    out = static_cast<uint16_t>(value);
    return true;
}

bool parse_endpoint(endpoint& out, std::string_view text) NOEXCEPT
{
    std::string_view host{};
    std::string_view port{};

    if (text.starts_with('['))
    {
        const auto close = text.find("]:");
        if (close == std::string_view::npos)
            return false;

        host = text.substr(one, sub1(close));
        port = text.substr(close + 2u);
    }
    else
    {
        const auto colon = text.rfind(':');
        if (colon == std::string_view::npos)
            return false;

        host = text.substr(zero, colon);
        port = text.substr(add1(colon));

        // Unbracketed ipv6 is ambiguous.
        if (host.find(':') != std::string_view::npos)
            return false;
    }

    uint16_t number{};
    if (host.empty() || !parse_port(number, port))
        return false;

    out.address = std::string{ host };
    out.port = number;
    return true;
}

bool parse_connection(endpoint& local, endpoint& remote,
    std::string_view text) NOEXCEPT
{
    const auto space = text.find(' ');
    if (space == std::string_view::npos)
        return false;

    return parse_endpoint(local, text.substr(zero, space)) &&
        parse_endpoint(remote, text.substr(add1(space)));
}

BC_POP_WARNING()

} // namespace blockperf
