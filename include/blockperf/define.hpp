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
#ifndef BLOCKPERF_DEFINE_HPP
#define BLOCKPERF_DEFINE_HPP

/// Standard includes (do not include directly).
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <boost/circular_buffer.hpp>
#include <boost/json.hpp>

/// Pulls in common /blockperf headers (excluding settings/config/parser/collector).
#include <blockperf/events.hpp>

/// Now we use the generic helper definitions above to define BP_API
/// and BP_INTERNAL. BP_API is used for the public API symbols. It either DLL
/// imports or DLL exports (or does nothing for static build) BP_INTERNAL is
/// used for non-api symbols.
#if defined BP_STATIC
    #define BP_API
    #define BP_INTERNAL
#elif defined BP_DLL
    #define BP_API      BC_HELPER_DLL_EXPORT
    #define BP_INTERNAL BC_HELPER_DLL_LOCAL
#else
    #define BP_API      BC_HELPER_DLL_IMPORT
    #define BP_INTERNAL BC_HELPER_DLL_LOCAL
#endif

/// For common types below.
#include <bitcoin/network.hpp>

namespace blockperf {

/// Dependency namespaces.
namespace system = libbitcoin::system;
namespace network = libbitcoin::network;

/// Trace time is utc with nanosecond resolution.
typedef std::chrono::time_point<network::wall_clock,
    std::chrono::nanoseconds> instant;

/// Signed difference of two instants.
typedef std::chrono::nanoseconds span;

/// Completion handler.
typedef network::result_handler result_handler;

} // namespace blockperf

#endif

// define.hpp is the common include for /blockperf.
// All non-blockperf headers include define.hpp.
// Blockperf inclusions are chained as follows.

// version        : <generated>
// error          : version
// events         : error
// define         : events

// Other directory common includes are not internally chained.
// Each header includes only its required common headers.

// settings       : define
// configuration  : define settings
// parser         : define configuration
// /utility       : define
// /trace         : define /utility
// /peers         : define /trace
// /blocks        : define /trace /utility
// /interfaces    : define /trace /peers /blocks
// /sources       : define /interfaces
// /sinks         : define /interfaces
// /chasers       : define configuration /interfaces  [forward: collector]
// collector      : define /chasers
