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

BOOST_AUTO_TEST_SUITE(status_change_tests)

BOOST_AUTO_TEST_CASE(status_change__parse__with_local__expected)
{
    status_change out{};
    BOOST_REQUIRE(parse_status_change(out,
        "ColdToWarm (Just 172.0.118.125:30002) 3.71.7.26:3001"));
    BOOST_REQUIRE(out.change == transition::cold_to_warm);
    BOOST_REQUIRE(out.local.has_value());
    BOOST_REQUIRE(out.local.value() == endpoint{ "172.0.118.125", 30002 });
    BOOST_REQUIRE(out.remote == endpoint{ "3.71.7.26", 3001 });
}

BOOST_AUTO_TEST_CASE(status_change__parse__without_local__expected)
{
    status_change out{};
    BOOST_REQUIRE(parse_status_change(out, "WarmToHot 3.71.7.26:3001"));
    BOOST_REQUIRE(out.change == transition::warm_to_hot);
    BOOST_REQUIRE(!out.local.has_value());
    BOOST_REQUIRE(out.remote == endpoint{ "3.71.7.26", 3001 });
}

BOOST_AUTO_TEST_CASE(status_change__parse__ipv6_remote__expected)
{
    status_change out{};
    BOOST_REQUIRE(parse_status_change(out, "HotToWarm [2001:db8::2]:3001"));
    BOOST_REQUIRE(out.change == transition::hot_to_warm);
    BOOST_REQUIRE(out.remote == endpoint{ "2001:db8::2", 3001 });
}

BOOST_AUTO_TEST_CASE(status_change__parse__undefined_transition__false)
{
    status_change out{};
    BOOST_REQUIRE(!parse_status_change(out, "ColdToHot 3.71.7.26:3001"));
    BOOST_REQUIRE(!parse_status_change(out, "WarmToWarm 3.71.7.26:3001"));
}

BOOST_AUTO_TEST_CASE(status_change__parse__malformed__false)
{
    status_change out{};
    BOOST_REQUIRE(!parse_status_change(out, ""));
    BOOST_REQUIRE(!parse_status_change(out, "ColdToWarm"));
    BOOST_REQUIRE(!parse_status_change(out, "ColdToWarm  3.71.7.26:3001"));
    BOOST_REQUIRE(!parse_status_change(out, "ColdToWarm 3.71.7.26:3001 "));
    BOOST_REQUIRE(!parse_status_change(out, "ColdToWarm (Just 1.2.3.4:1 3.71.7.26:3001"));
    BOOST_REQUIRE(!parse_status_change(out, "ColdToWarm (Maybe 1.2.3.4:1) 3.71.7.26:3001"));
    BOOST_REQUIRE(!parse_status_change(out, "Cold 3.71.7.26:3001"));
}

BOOST_AUTO_TEST_SUITE_END()
