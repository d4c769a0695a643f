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
#include "../test.hpp"

#include <filesystem>
#include <fstream>

BOOST_AUTO_TEST_SUITE(proc_connections_tests)

#define TABLE_HEADING \
    "  sl  local_address rem_address   st tx_queue rx_queue tr tm->when " \
    "retrnsmt   uid  timeout inode\n"

// 127.0.0.1:3001 <- 3.71.7.26:41734 (inbound, inode 1001)
#define ROW_INBOUND \
    "   0: 0100007F:0BB9 1A074703:A306 01 00000000:00000000 00:00000000 " \
    "00000000  1000        0 1001 1 0000000000000000 20 4 30 10 -1\n"

// 127.0.0.1:40000 -> 3.71.7.26:3001 (outbound, inode 1002)
#define ROW_OUTBOUND \
    "   1: 0100007F:9C40 1A074703:0BB9 01 00000000:00000000 00:00000000 " \
    "00000000  1000        0 1002 1 0000000000000000 20 4 30 10 -1\n"

// 0.0.0.0:3001 listening (inode 1003)
#define ROW_LISTEN \
    "   2: 00000000:0BB9 00000000:0000 0A 00000000:00000000 00:00000000 " \
    "00000000  1000        0 1003 1 0000000000000000 100 0 0 10 0\n"

// 127.0.0.1:22 <- 3.71.7.26:50000 (unrelated, inode 1004)
#define ROW_UNRELATED \
    "   3: 0100007F:0016 1A074703:C350 01 00000000:00000000 00:00000000 " \
    "00000000     0        0 1004 1 0000000000000000 20 4 30 10 -1\n"

// parse

BOOST_AUTO_TEST_CASE(proc_connections__parse__port_filter__established_node_sockets)
{
    std::istringstream table{ TABLE_HEADING ROW_INBOUND ROW_OUTBOUND
        ROW_LISTEN ROW_UNRELATED };

    connection::list out{};
    BOOST_REQUIRE(proc_connections::parse(out, table, 3001, false));
    BOOST_REQUIRE_EQUAL(out.size(), 2u);

    BOOST_REQUIRE(out.at(0).local == endpoint{ "127.0.0.1", 3001 });
    BOOST_REQUIRE(out.at(0).remote == endpoint{ "3.71.7.26", 41734 });
    BOOST_REQUIRE(out.at(0).direction == peer_direction::inbound);

    BOOST_REQUIRE(out.at(1).local == endpoint{ "127.0.0.1", 40000 });
    BOOST_REQUIRE(out.at(1).remote == endpoint{ "3.71.7.26", 3001 });
    BOOST_REQUIRE(out.at(1).direction == peer_direction::outbound);
}

BOOST_AUTO_TEST_CASE(proc_connections__parse__inode_filter__selected_sockets)
{
    std::istringstream table{ TABLE_HEADING ROW_INBOUND ROW_OUTBOUND
        ROW_LISTEN ROW_UNRELATED };

    const proc_connections::inodes filter{ 1002, 1003, 1004 };
    connection::list out{};
    BOOST_REQUIRE(proc_connections::parse(out, table, 3001, false, &filter));

    // Listening socket is not established.
    BOOST_REQUIRE_EQUAL(out.size(), 2u);
    BOOST_REQUIRE(out.at(0).remote == endpoint{ "3.71.7.26", 3001 });
    BOOST_REQUIRE(out.at(1).local == endpoint{ "127.0.0.1", 22 });
    BOOST_REQUIRE(out.at(1).direction == peer_direction::outbound);
}

BOOST_AUTO_TEST_CASE(proc_connections__parse__heading_only__empty)
{
    std::istringstream table{ TABLE_HEADING };
    connection::list out{};
    BOOST_REQUIRE(proc_connections::parse(out, table, 3001, false));
    BOOST_REQUIRE(out.empty());
}

BOOST_AUTO_TEST_CASE(proc_connections__parse__empty_table__false)
{
    std::istringstream table{};
    connection::list out{};
    BOOST_REQUIRE(!proc_connections::parse(out, table, 3001, false));
}

BOOST_AUTO_TEST_CASE(proc_connections__parse__short_row__false)
{
    std::istringstream table{ TABLE_HEADING "   0: 0100007F:0BB9 1A074703:A306 01\n" };
    connection::list out{};
    BOOST_REQUIRE(!proc_connections::parse(out, table, 3001, false));
}

// parse_address

BOOST_AUTO_TEST_CASE(proc_connections__parse_address__ipv4__expected)
{
    endpoint out{};
    BOOST_REQUIRE(proc_connections::parse_address(out, "0100007F:0BB9", false));
    BOOST_REQUIRE(out == endpoint{ "127.0.0.1", 3001 });
}

BOOST_AUTO_TEST_CASE(proc_connections__parse_address__ipv6_loopback__expected)
{
    endpoint out{};
    BOOST_REQUIRE(proc_connections::parse_address(out,
        "00000000000000000000000001000000:0BB9", true));
    BOOST_REQUIRE(out == endpoint{ "::1", 3001 });
}

BOOST_AUTO_TEST_CASE(proc_connections__parse_address__ipv6_v4_mapped__ipv4)
{
    endpoint out{};
    BOOST_REQUIRE(proc_connections::parse_address(out,
        "0000000000000000FFFF00001A074703:A306", true));
    BOOST_REQUIRE(out == endpoint{ "3.71.7.26", 41734 });
}

BOOST_AUTO_TEST_CASE(proc_connections__parse_address__malformed__false)
{
    endpoint out{};
    BOOST_REQUIRE(!proc_connections::parse_address(out, "0100007F", false));
    BOOST_REQUIRE(!proc_connections::parse_address(out, "0100007:0BB9", false));
    BOOST_REQUIRE(!proc_connections::parse_address(out, "0100007G:0BB9", false));
    BOOST_REQUIRE(!proc_connections::parse_address(out, "0100007F:0BB9", true));
}

// snapshot

BOOST_AUTO_TEST_CASE(proc_connections__snapshot__tcp_table__port_selected)
{
    const auto root = std::filesystem::temp_directory_path() /
        "blockperf_test_proc_connections";
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root / "net");
    {
        std::ofstream file{ root / "net" / "tcp" };
        file << TABLE_HEADING ROW_INBOUND ROW_LISTEN ROW_UNRELATED;
    }

    proc_connections instance{ 3001, 0, root };
    connection::list out{};
    BOOST_REQUIRE(!instance.snapshot(out));
    BOOST_REQUIRE_EQUAL(out.size(), 1u);
    BOOST_REQUIRE(out.front().remote == endpoint{ "3.71.7.26", 41734 });

    std::filesystem::remove_all(root);
}

BOOST_AUTO_TEST_CASE(proc_connections__snapshot__missing_tables__snapshot_unavailable)
{
    const auto root = std::filesystem::temp_directory_path() /
        "blockperf_test_proc_missing";
    std::filesystem::remove_all(root);

    proc_connections instance{ 3001, 0, root };
    connection::list out{};
    BOOST_REQUIRE(instance.snapshot(out) == error::snapshot_unavailable);
    BOOST_REQUIRE(out.empty());
}

BOOST_AUTO_TEST_CASE(proc_connections__snapshot__missing_process__snapshot_unavailable)
{
    const auto root = std::filesystem::temp_directory_path() /
        "blockperf_test_proc_pid";
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root / "net");
    {
        std::ofstream file{ root / "net" / "tcp" };
        file << TABLE_HEADING ROW_INBOUND;
    }

    proc_connections instance{ 3001, 4242, root };
    connection::list out{};
    BOOST_REQUIRE(instance.snapshot(out) == error::snapshot_unavailable);

    std::filesystem::remove_all(root);
}

BOOST_AUTO_TEST_SUITE_END()
