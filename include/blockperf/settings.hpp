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
#ifndef BLOCKPERF_SETTINGS_HPP
#define BLOCKPERF_SETTINGS_HPP

#include <filesystem>
#include <blockperf/define.hpp>
#include <blockperf/utility/endpoint.hpp>
#include <blockperf/utility/genesis.hpp>

namespace blockperf {
namespace log {

/// [log] settings.
class BP_API settings
{
public:
    DEFAULT_COPY_MOVE_DESTRUCT(settings);

    settings() NOEXCEPT;

    bool application;
    bool news;
    bool session;
    bool protocol;
    bool proxy;
    bool remote;
    bool fault;
    bool quitting;
    bool objects;
    bool verbose;

    uint32_t maximum_size;
    std::filesystem::path path;

    virtual std::filesystem::path log_file1() const NOEXCEPT;
    virtual std::filesystem::path log_file2() const NOEXCEPT;
    virtual std::filesystem::path events_file() const NOEXCEPT;
};

} // namespace log

namespace node {

/// [node] settings, the monitored cardano node.
class BP_API settings
{
public:
    DEFAULT_COPY_MOVE_DESTRUCT(settings);

    settings() NOEXCEPT;

    /// Properties.
    std::string network;
    uint32_t magic;
    uint64_t genesis_start;
    uint32_t slot_length_seconds;
    uint16_t port;
    uint32_t pid;

    /// Helpers.

    /// Preset for mainnet, preprod or preview, configured values for custom.
    /// Empty if the network name is not recognized.
    virtual std::optional<genesis> genesis_() const NOEXCEPT;
};

} // namespace node

namespace monitor {

/// [monitor] settings.
class BP_API settings
{
public:
    DEFAULT_COPY_MOVE_DESTRUCT(settings);

    settings() NOEXCEPT;

    /// Properties.
    uint32_t threads;
    uint32_t reconcile_interval_seconds;
    uint32_t report_interval_seconds;
    uint32_t sweep_interval_seconds;
    uint32_t stale_seconds;
    uint32_t finalized_capacity;
    std::string bp_version;
    std::string local_address;
    std::filesystem::path samples;

    /// Helpers.
    virtual size_t threads_() const NOEXCEPT;
    virtual size_t finalized_capacity_() const NOEXCEPT;
    virtual network::steady_clock::duration reconcile_interval() const NOEXCEPT;
    virtual network::steady_clock::duration report_interval() const NOEXCEPT;
    virtual network::steady_clock::duration sweep_interval() const NOEXCEPT;
    virtual span stale() const NOEXCEPT;
};

} // namespace monitor

namespace trace {

/// [trace] settings, the node trace log.
class BP_API settings
{
public:
    DEFAULT_COPY_MOVE_DESTRUCT(settings);

    settings() NOEXCEPT;

    /// Properties.
    std::filesystem::path path;
    bool follow;
    bool from_start;
    uint32_t poll_milliseconds;

    /// Helpers.
    virtual network::steady_clock::duration poll() const NOEXCEPT;
};

} // namespace trace
} // namespace blockperf

#endif
