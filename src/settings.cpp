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
#include <blockperf/settings.hpp>

#include <algorithm>
#include <filesystem>
#include <bitcoin/network.hpp>

using namespace bc::system;
using namespace bc::network;

namespace blockperf {
namespace log {

// Log states default to network compiled states or explicit false.
settings::settings() NOEXCEPT
  : application{ levels::application_defined },
    news{ levels::news_defined },
    session{ levels::session_defined },
    protocol{ false /*levels::protocol_defined*/ },
    proxy{ false /*levels::proxy_defined*/ },
    remote{ levels::remote_defined },
    fault{ levels::fault_defined },
    quitting{ false /*levels::quitting_defined*/ },
    objects{ false /*levels::objects_defined*/ },
    verbose{ false /*levels::verbose_defined*/ },
    maximum_size{ 1'000'000_u32 }
{
}

std::filesystem::path settings::log_file1() const NOEXCEPT
{
    BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)
    return path / "bp_end.log";
    BC_POP_WARNING()
}

std::filesystem::path settings::log_file2() const NOEXCEPT
{
    BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)
    return path / "bp_begin.log";
    BC_POP_WARNING()
}

std::filesystem::path settings::events_file() const NOEXCEPT
{
    BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)
    return path / "events.log";
    BC_POP_WARNING()
}

} // namespace log

namespace node {

settings::settings() NOEXCEPT
  : network{ "mainnet" },
    magic{ 0 },
    genesis_start{ 0 },
    slot_length_seconds{ 1 },
    port{ 3001 },
    pid{ 0 }
{
}

std::optional<genesis> settings::genesis_() const NOEXCEPT
{
    if (network != "custom")
        return genesis::preset(network);

    const instant start{ std::chrono::seconds(genesis_start) };
    const span length{ std::chrono::seconds(slot_length_seconds) };
    return genesis{ magic, start, length };
}

} // namespace node

namespace monitor {

settings::settings() NOEXCEPT
  : threads{ 2 },
    reconcile_interval_seconds{ 30 },
    report_interval_seconds{ 30 },
    sweep_interval_seconds{ 60 },
    stale_seconds{ 600 },
    finalized_capacity{ 10'000 },
    bp_version{ "v2" },
    local_address{ "0.0.0.0" },
    samples{ "-" }
{
}

size_t settings::threads_() const NOEXCEPT
{
    return std::max<size_t>(threads, one);
}

size_t settings::finalized_capacity_() const NOEXCEPT
{
    return std::max<size_t>(finalized_capacity, one);
}

steady_clock::duration settings::reconcile_interval() const NOEXCEPT
{
    return seconds(std::max<uint32_t>(reconcile_interval_seconds, 1));
}

steady_clock::duration settings::report_interval() const NOEXCEPT
{
    return seconds(std::max<uint32_t>(report_interval_seconds, 1));
}

steady_clock::duration settings::sweep_interval() const NOEXCEPT
{
    return seconds(std::max<uint32_t>(sweep_interval_seconds, 1));
}

span settings::stale() const NOEXCEPT
{
    return std::chrono::seconds(stale_seconds);
}

} // namespace monitor

namespace trace {

settings::settings() NOEXCEPT
  : path{ "-" },
    follow{ true },
    from_start{ false },
    poll_milliseconds{ 250 }
{
}

steady_clock::duration settings::poll() const NOEXCEPT
{
    return milliseconds(std::max<uint32_t>(poll_milliseconds, 1));
}

} // namespace trace
} // namespace blockperf
