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
#include <blockperf/trace/decoder.hpp>

#include <charconv>
#include <blockperf/define.hpp>
#include <blockperf/utility/timestamp.hpp>

namespace blockperf {

using namespace bc::system;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

static const boost::json::value* find(const boost::json::object& object,
    std::string_view key) NOEXCEPT
{
    return object.if_contains(boost::json::string_view{ key.data(),
        key.size() });
}

bool get_text(std::string& out, const boost::json::object& object,
    std::string_view key) NOEXCEPT
{
    const auto value = find(object, key);
    if (is_null(value) || !value->is_string())
        return false;

    const auto& text = value->get_string();
    out.assign(text.data(), text.size());
    return true;
}

bool get_number(uint64_t& out, const boost::json::object& object,
    std::string_view key) NOEXCEPT
{
    const auto value = find(object, key);
    if (is_null(value))
        return false;

    if (value->is_uint64())
    {
        out = value->get_uint64();
        return true;
    }

    if (value->is_int64())
    {
        if (is_negative(value->get_int64()))
            return false;

        out = static_cast<uint64_t>(value->get_int64());
        return true;
    }

    if (!value->is_string())
        return false;

    const auto& text = value->get_string();
    const auto end = std::next(text.data(), text.size());
    const auto result = std::from_chars(text.data(), end, out);
    return !text.empty() && result.ec == std::errc{} && result.ptr == end;
}

bool get_object(const boost::json::object*& out,
    const boost::json::object& object, std::string_view key) NOEXCEPT
{
    const auto value = find(object, key);
    if (is_null(value) || !value->is_object())
        return false;

    out = &value->get_object();
    return true;
}

code decode(trace_event& out, std::string_view line) NOEXCEPT
{
    boost::system::error_code ec{};
    auto value = boost::json::parse(boost::json::string_view{ line.data(),
        line.size() }, ec);

    if (ec || !value.is_object())
        return error::malformed_event;

    const auto& object = value.get_object();

    trace_event event{};
    std::string at{};
    if (!get_text(at, object, "at") || !parse_timestamp(event.at, at) ||
        !get_text(event.ns, object, "ns") || event.ns.empty())
        return error::malformed_event;

    if (const auto data = find(object, "data"); !is_null(data))
    {
        if (!data->is_object())
            return error::malformed_event;

        event.data = data->get_object();
    }

    // Thread ids are emitted as text or as numbers.
    if (!get_text(event.thread, object, "thread"))
    {
        uint64_t thread{};
        if (get_number(thread, object, "thread"))
            event.thread = std::to_string(thread);
    }

    if (!get_text(event.severity, object, "sev"))
        event.severity.clear();

    if (!get_text(event.host, object, "host"))
        event.host.clear();

    out = std::move(event);
    return error::success;
}

BC_POP_WARNING()

} // namespace blockperf
