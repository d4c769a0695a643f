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
#include "test.hpp"

BOOST_AUTO_TEST_SUITE(settings_tests)

using namespace bc::network;

// [log]

BOOST_AUTO_TEST_CASE(settings__log__default_context__expected)
{
    const log::settings log{};
    BOOST_REQUIRE_EQUAL(log.application, levels::application_defined);
    BOOST_REQUIRE_EQUAL(log.news, levels::news_defined);
    BOOST_REQUIRE_EQUAL(log.session, levels::session_defined);
    BOOST_REQUIRE_EQUAL(log.protocol, false /*levels::protocol_defined*/);
    BOOST_REQUIRE_EQUAL(log.proxy, false /*levels::proxy_defined*/);
    BOOST_REQUIRE_EQUAL(log.remote, levels::remote_defined);
    BOOST_REQUIRE_EQUAL(log.fault, levels::fault_defined);
    BOOST_REQUIRE_EQUAL(log.quitting, false /*levels::quitting_defined*/);
    BOOST_REQUIRE_EQUAL(log.objects, false /*levels::objects_defined*/);
    BOOST_REQUIRE_EQUAL(log.verbose, false /*levels::verbose_defined*/);
    BOOST_REQUIRE_EQUAL(log.maximum_size, 1'000'000_u32);
    BOOST_REQUIRE_EQUAL(log.path, "");
    BOOST_REQUIRE_EQUAL(log.log_file1(), "bp_end.log");
    BOOST_REQUIRE_EQUAL(log.log_file2(), "bp_begin.log");
    BOOST_REQUIRE_EQUAL(log.events_file(), "events.log");
}

// [node]

BOOST_AUTO_TEST_CASE(settings__node__default_context__expected)
{
    const node::settings node{};
    BOOST_REQUIRE_EQUAL(node.network, "mainnet");
    BOOST_REQUIRE_EQUAL(node.magic, 0_u32);
    BOOST_REQUIRE_EQUAL(node.genesis_start, 0_u64);
    BOOST_REQUIRE_EQUAL(node.slot_length_seconds, 1_u32);
    BOOST_REQUIRE_EQUAL(node.port, 3001_u16);
    BOOST_REQUIRE_EQUAL(node.pid, 0_u32);

    const auto chain = node.genesis_();
    BOOST_REQUIRE(chain.has_value());
    BOOST_REQUIRE_EQUAL(chain->magic(), 764'824'073_u32);
}

BOOST_AUTO_TEST_CASE(settings__node__genesis_custom__configured_values)
{
    node::settings node{};
    node.network = "custom";
    node.magic = 42;
    node.genesis_start = 1'000;
    node.slot_length_seconds = 2;

    const auto chain = node.genesis_();
    BOOST_REQUIRE(chain.has_value());
    BOOST_REQUIRE_EQUAL(chain->magic(), 42_u32);
    BOOST_REQUIRE(chain->start() == test::at(1'000));
    BOOST_REQUIRE(chain->slot_length() == std::chrono::seconds(2));
    BOOST_REQUIRE(chain->slot_time(10) == test::at(1'020));
}

BOOST_AUTO_TEST_CASE(settings__node__genesis_unknown_network__empty)
{
    node::settings node{};
    node.network = "testnet";
    BOOST_REQUIRE(!node.genesis_().has_value());
}

// [monitor]

BOOST_AUTO_TEST_CASE(settings__monitor__default_context__expected)
{
    const monitor::settings monitor{};
    BOOST_REQUIRE_EQUAL(monitor.threads, 2_u32);
    BOOST_REQUIRE_EQUAL(monitor.reconcile_interval_seconds, 30_u32);
    BOOST_REQUIRE_EQUAL(monitor.report_interval_seconds, 30_u32);
    BOOST_REQUIRE_EQUAL(monitor.sweep_interval_seconds, 60_u32);
    BOOST_REQUIRE_EQUAL(monitor.stale_seconds, 600_u32);
    BOOST_REQUIRE_EQUAL(monitor.finalized_capacity, 10'000_u32);
    BOOST_REQUIRE_EQUAL(monitor.bp_version, "v2");
    BOOST_REQUIRE_EQUAL(monitor.local_address, "0.0.0.0");
    BOOST_REQUIRE_EQUAL(monitor.samples, "-");

    BOOST_REQUIRE_EQUAL(monitor.threads_(), 2_size);
    BOOST_REQUIRE_EQUAL(monitor.finalized_capacity_(), 10'000_size);
    BOOST_REQUIRE(monitor.reconcile_interval() == steady_clock::duration(seconds(30)));
    BOOST_REQUIRE(monitor.report_interval() == steady_clock::duration(seconds(30)));
    BOOST_REQUIRE(monitor.sweep_interval() == steady_clock::duration(seconds(60)));
    BOOST_REQUIRE(monitor.stale() == std::chrono::seconds(600));
}

BOOST_AUTO_TEST_CASE(settings__monitor__zero_values__minimums)
{
    monitor::settings monitor{};
    monitor.threads = 0;
    monitor.finalized_capacity = 0;
    monitor.reconcile_interval_seconds = 0;
    monitor.sweep_interval_seconds = 0;

    BOOST_REQUIRE_EQUAL(monitor.threads_(), 1_size);
    BOOST_REQUIRE_EQUAL(monitor.finalized_capacity_(), 1_size);
    BOOST_REQUIRE(monitor.reconcile_interval() == steady_clock::duration(seconds(1)));
    BOOST_REQUIRE(monitor.sweep_interval() == steady_clock::duration(seconds(1)));
}

// [trace]

BOOST_AUTO_TEST_CASE(settings__trace__default_context__expected)
{
    const trace::settings trace{};
    BOOST_REQUIRE_EQUAL(trace.path, "-");
    BOOST_REQUIRE_EQUAL(trace.follow, true);
    BOOST_REQUIRE_EQUAL(trace.from_start, false);
    BOOST_REQUIRE_EQUAL(trace.poll_milliseconds, 250_u32);
    BOOST_REQUIRE(trace.poll() == steady_clock::duration(milliseconds(250)));
}

BOOST_AUTO_TEST_SUITE_END()
