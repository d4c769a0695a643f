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
#ifndef BLOCKPERF_TRACE_TRACE_EVENT_HPP
#define BLOCKPERF_TRACE_TRACE_EVENT_HPP

#include <blockperf/define.hpp>

namespace blockperf {

/// A normalized node trace record, not mutated once decoded.
struct BP_API trace_event
{
    /// Record time.
    instant at{};

    /// Namespace, the kind discriminator ("BlockFetch.Client.SendFetchRequest").
    std::string ns{};

    std::string severity{};
    std::string thread{};
    std::string host{};

    /// Kind-specific payload.
    boost::json::object data{};
};

} // namespace blockperf

#endif
