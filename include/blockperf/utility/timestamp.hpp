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
#ifndef BLOCKPERF_UTILITY_TIMESTAMP_HPP
#define BLOCKPERF_UTILITY_TIMESTAMP_HPP

#include <string_view>
#include <blockperf/define.hpp>

namespace blockperf {

/// Parse ISO-8601 utc text with up to nine fractional digits, terminated by
/// "Z" or a "+hh:mm"/"-hh:mm" offset ("2025-09-12T16:51:39.269022269Z").
BP_API bool parse_timestamp(instant& out, std::string_view text) NOEXCEPT;

/// Format as ISO-8601 utc with nine fractional digits.
BP_API std::string format_timestamp(const instant& time) NOEXCEPT;

/// Format as fractional seconds, trailing zeros trimmed ("0.3", "-1.25").
BP_API std::string format_seconds(const span& value) NOEXCEPT;

} // namespace blockperf

#endif
