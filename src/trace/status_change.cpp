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
#include <blockperf/trace/status_change.hpp>

#include <vector>
#include <blockperf/define.hpp>
#include <blockperf/trace/transition.hpp>
#include <blockperf/utility/endpoint.hpp>

namespace blockperf {

using namespace bc::system;

constexpr std::string_view just_open{ "(Just" };

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

// Tokens are separated by exactly one space, empty tokens are rejected.
static bool tokenize(std::vector<std::string_view>& out,
    std::string_view text) NOEXCEPT
{
    while (!text.empty())
    {
        const auto space = text.find(' ');
        const auto token = text.substr(zero, space);
        if (token.empty())
            return false;

        out.push_back(token);
        if (space == std::string_view::npos)
            break;

        text.remove_prefix(add1(space));
        if (text.empty())
            return false;
    }

    return true;
}

static bool parse_change(transition& out, std::string_view token) NOEXCEPT
{
    // No state name contains "To".
    const auto split = token.find("To");
    if (split == std::string_view::npos)
        return false;

    peer_state from{}, to{};
    return parse_state(from, token.substr(zero, split)) &&
        parse_state(to, token.substr(split + 2u)) &&
        to_transition(out, from, to);
}

bool parse_status_change(status_change& out, std::string_view text) NOEXCEPT
{
    std::vector<std::string_view> tokens{};
    if (!tokenize(tokens, text))
        return false;

    status_change value{};
    if (tokens.size() == 2u)
    {
        if (!parse_change(value.change, tokens.at(0)) ||
            !parse_endpoint(value.remote, tokens.at(1)))
            return false;
    }
    else if (tokens.size() == 4u)
    {
        auto local = tokens.at(2);
        if (tokens.at(1) != just_open || !local.ends_with(')'))
            return false;

        local.remove_suffix(one);
        endpoint address{};
        if (!parse_change(value.change, tokens.at(0)) ||
            !parse_endpoint(address, local) ||
            !parse_endpoint(value.remote, tokens.at(3)))
            return false;

        value.local = std::move(address);
    }
    else
    {
        return false;
    }

    out = std::move(value);
    return true;
}

BC_POP_WARNING()

} // namespace blockperf
