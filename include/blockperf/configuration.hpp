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
#ifndef BLOCKPERF_CONFIGURATION_HPP
#define BLOCKPERF_CONFIGURATION_HPP

#include <blockperf/define.hpp>
#include <blockperf/settings.hpp>

namespace blockperf {

/// Collector configuration, thread safe.
class BP_API configuration
{
public:
    DEFAULT_COPY_MOVE_DESTRUCT(configuration);

    configuration() NOEXCEPT;

    /// Environment.
    std::filesystem::path file;

    /// Information.
    bool help{};
    bool settings{};
    bool version{};

    /// Settings.
    log::settings log;
    node::settings node;
    monitor::settings monitor;
    trace::settings trace;
};

} // namespace blockperf

#endif
