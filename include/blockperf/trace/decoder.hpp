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
#ifndef BLOCKPERF_TRACE_DECODER_HPP
#define BLOCKPERF_TRACE_DECODER_HPP

#include <string_view>
#include <blockperf/define.hpp>
#include <blockperf/trace/trace_event.hpp>

namespace blockperf {

/// Decode one json trace line ({"at":..,"ns":..,"data":{..},..}).
/// Requires "at" and "ns", other fields default when absent.
/// Returns error::malformed_event if the line cannot be decoded.
BP_API code decode(trace_event& out, std::string_view line) NOEXCEPT;

/// Json field accessors, false if absent or not of the expected form.
/// Numbers may be given as json numbers or as decimal text.
BP_API bool get_text(std::string& out, const boost::json::object& object,
    std::string_view key) NOEXCEPT;
BP_API bool get_number(uint64_t& out, const boost::json::object& object,
    std::string_view key) NOEXCEPT;
BP_API bool get_object(const boost::json::object*& out,
    const boost::json::object& object, std::string_view key) NOEXCEPT;

} // namespace blockperf

#endif
