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
#include <blockperf/utility/timestamp.hpp>

#include <chrono>
#include <iomanip>
#include <sstream>
#include <blockperf/define.hpp>

namespace blockperf {

using namespace bc::system;

constexpr int64_t seconds_per_day = 86'400;
constexpr int64_t nanoseconds_per_second = 1'000'000'000;
constexpr size_t fraction_digits = 9;

// Text cursor.
// ----------------------------------------------------------------------------

static bool is_digit(char character) NOEXCEPT
{
    return character >= '0' && character <= '9';
}

static bool read_digits(uint32_t& out, std::string_view& text,
    size_t count) NOEXCEPT
{
    if (text.size() < count)
        return false;

    uint32_t value{};
    for (size_t index = 0; index < count; ++index)
    {
        if (!is_digit(text[index]))
            return false;

        value = value * 10u + static_cast<uint32_t>(text[index] - '0');
    }

    out = value;
    text.remove_prefix(count);
    return true;
}

static bool read_char(std::string_view& text, char expected) NOEXCEPT
{
    if (text.empty() || text.front() != expected)
        return false;

    text.remove_prefix(one);
    return true;
}

// Parse.
// ----------------------------------------------------------------------------

bool parse_timestamp(instant& out, std::string_view text) NOEXCEPT
{
    uint32_t year{}, month{}, day{}, hour{}, minute{}, second{};
    if (!read_digits(year, text, 4) || !read_char(text, '-') ||
        !read_digits(month, text, 2) || !read_char(text, '-') ||
        !read_digits(day, text, 2))
        return false;

    if (!read_char(text, 'T') && !read_char(text, ' '))
        return false;

    if (!read_digits(hour, text, 2) || !read_char(text, ':') ||
        !read_digits(minute, text, 2) || !read_char(text, ':') ||
        !read_digits(second, text, 2))
        return false;

    const std::chrono::year_month_day date
    {
        std::chrono::year{ static_cast<int>(year) },
        std::chrono::month{ month },
        std::chrono::day{ day }
    };

    if (!date.ok() || hour > 23u || minute > 59u || second > 60u)
        return false;

    // Digits beyond nanosecond resolution are truncated.
    int64_t fraction{};
    if (read_char(text, '.'))
    {
        size_t digits{};
        size_t consumed{};
        while (!text.empty() && is_digit(text.front()))
        {
            if (digits < fraction_digits)
            {
                fraction = fraction * 10 + (text.front() - '0');
                ++digits;
            }

            text.remove_prefix(one);
            ++consumed;
        }

        if (is_zero(consumed))
            return false;

        for (; digits < fraction_digits; ++digits)
            fraction *= 10;
    }

    int64_t offset{};
    if (text == "Z" || text == "z")
    {
        offset = 0;
    }
    else if (text.size() == 6u && (text.front() == '+' || text.front() == '-'))
    {
        const auto negative = (text.front() == '-');
        text.remove_prefix(one);

        uint32_t hours{}, minutes{};
        if (!read_digits(hours, text, 2) || !read_char(text, ':') ||
            !read_digits(minutes, text, 2) || hours > 23u || minutes > 59u)
            return false;

        offset = static_cast<int64_t>(hours * 3'600u + minutes * 60u);
        if (negative)
            offset = -offset;
    }
    else
    {
        return false;
    }

    const auto days = std::chrono::sys_days{ date }.time_since_epoch().count();
    const auto seconds = static_cast<int64_t>(days) * seconds_per_day +
        hour * 3'600 + minute * 60 + second - offset;

    out = instant{ std::chrono::seconds{ seconds } +
        std::chrono::nanoseconds{ fraction } };
    return true;
}

// Format.
// ----------------------------------------------------------------------------

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

std::string format_timestamp(const instant& time) NOEXCEPT
{
    const auto count = time.time_since_epoch().count();
    auto seconds = count / nanoseconds_per_second;
    auto fraction = count % nanoseconds_per_second;
    if (fraction < 0)
    {
        fraction += nanoseconds_per_second;
        --seconds;
    }

    auto days = seconds / seconds_per_day;
    auto remainder = seconds % seconds_per_day;
    if (remainder < 0)
    {
        remainder += seconds_per_day;
        --days;
    }

    const std::chrono::year_month_day date
    {
        std::chrono::sys_days{ std::chrono::days{ days } }
    };

    std::ostringstream out{};
    out << std::setfill('0')
        << std::setw(4) << static_cast<int>(date.year()) << "-"
        << std::setw(2) << static_cast<unsigned>(date.month()) << "-"
        << std::setw(2) << static_cast<unsigned>(date.day()) << "T"
        << std::setw(2) << (remainder / 3'600) << ":"
        << std::setw(2) << ((remainder % 3'600) / 60) << ":"
        << std::setw(2) << (remainder % 60) << "."
        << std::setw(fraction_digits) << fraction << "Z";

    return out.str();
}

std::string format_seconds(const span& value) NOEXCEPT
{
    const auto count = value.count();
    const auto negative = count < 0;

    // Avoids overflow of the most negative count.
    const auto magnitude = negative ?
        add1(static_cast<uint64_t>(-(count + 1))) :
        static_cast<uint64_t>(count);

    const auto whole = magnitude / nanoseconds_per_second;
    const auto part = magnitude % nanoseconds_per_second;

    std::ostringstream fraction{};
    fraction << std::setfill('0') << std::setw(fraction_digits) << part;
    auto digits = fraction.str();

    // Retain at least one fractional digit.
    while (digits.size() > one && digits.back() == '0')
        digits.pop_back();

    return (negative ? "-" : "") + std::to_string(whole) + "." + digits;
}

BC_POP_WARNING()

} // namespace blockperf
