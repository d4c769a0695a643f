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
#ifndef BLOCKPERF_CONSOLE_EXECUTOR_HPP
#define BLOCKPERF_CONSOLE_EXECUTOR_HPP

#include <atomic>
#include <future>
#include <iostream>
#include <unordered_map>
#include <bitcoin/database.hpp>
#include <blockperf.hpp>

namespace blockperf {

class executor
{
public:
    DELETE_COPY(executor);

    executor(parser& metadata, std::ostream& output,
        std::ostream& error);

    /// Invoke the menu command indicated by the metadata.
    bool menu();

private:
    using rotator_t = libbitcoin::database::file::stream::out::rotator;

    void logger(const auto& message) const;
    void stopper(const auto& message);

    static void initialize_stop() NOEXCEPT;
    static void stop(const code& ec);
    static void handle_stop(int code);

    void handle_started(const code& ec);
    void handle_running(const code& ec);
    void handle_stopped(const code& ec);

    void dump_options() const;
    void dump_version() const;
    void dump_totals() const;

    // Command line options.
    bool do_help();
    bool do_settings();
    bool do_version();
    bool do_run();

    rotator_t create_log_sink() const;
    system::ofstream create_event_sink() const;
    void subscribe_log(std::ostream& sink);
    void subscribe_events(std::ostream& sink);

    static const std::string name_;

    // Runtime events.
    static const std::unordered_map<uint8_t, std::string> fired_;

    static std::promise<code> stopping_;

    parser& metadata_;
    std::unique_ptr<collector> collector_{};
    std::promise<code> stopped_{};

    std::ostream& output_;

    // Console log output, error stream when samples are written to output.
    std::ostream& console_;
    network::logger log_{};
    system::std_array<std::atomic_bool, system::add1(network::levels::verbose)>
        toggle_;
};

} // namespace blockperf

#endif
