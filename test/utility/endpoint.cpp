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

BOOST_AUTO_TEST_SUITE(endpoint_tests)

BOOST_AUTO_TEST_CASE(endpoint__to_string__ipv4__unbracketed)
{
    const endpoint instance{ "192.168.1.10", 3001 };
    BOOST_REQUIRE_EQUAL(instance.to_string(), "192.168.1.10:3001");
}

BOOST_AUTO_TEST_CASE(endpoint__to_string__ipv6__bracketed)
{
    const endpoint instance{ "2001:db8::1", 6000 };
    BOOST_REQUIRE_EQUAL(instance.to_string(), "[2001:db8::1]:6000");
}

BOOST_AUTO_TEST_CASE(endpoint__equality__same_address_different_port__false)
{
    const endpoint first{ "10.0.0.1", 3001 };
    const endpoint second{ "10.0.0.1", 3002 };
    BOOST_REQUIRE(first != second);
    BOOST_REQUIRE(first == endpoint{ "10.0.0.1", 3001 });
}

BOOST_AUTO_TEST_CASE(endpoint__parse_endpoint__ipv4__expected)
{
    endpoint out{};
    BOOST_REQUIRE(parse_endpoint(out, "44.1.2.3:3001"));
    BOOST_REQUIRE_EQUAL(out.address, "44.1.2.3");
    BOOST_REQUIRE_EQUAL(out.port, 3001u);
}

BOOST_AUTO_TEST_CASE(endpoint__parse_endpoint__bracketed_ipv6__expected)
{
    endpoint out{};
    BOOST_REQUIRE(parse_endpoint(out, "[::1]:3001"));
    BOOST_REQUIRE_EQUAL(out.address, "::1");
    BOOST_REQUIRE_EQUAL(out.port, 3001u);
}

BOOST_AUTO_TEST_CASE(endpoint__parse_endpoint__unbracketed_ipv6__false)
{
    endpoint out{};
    BOOST_REQUIRE(!parse_endpoint(out, "::1:3001"));
}

BOOST_AUTO_TEST_CASE(endpoint__parse_endpoint__malformed__false)
{
    endpoint out{};
    BOOST_REQUIRE(!parse_endpoint(out, ""));
    BOOST_REQUIRE(!parse_endpoint(out, "1.2.3.4"));
    BOOST_REQUIRE(!parse_endpoint(out, ":3001"));
    BOOST_REQUIRE(!parse_endpoint(out, "1.2.3.4:"));
    BOOST_REQUIRE(!parse_endpoint(out, "1.2.3.4:65536"));
    BOOST_REQUIRE(!parse_endpoint(out, "1.2.3.4:30x1"));
}

BOOST_AUTO_TEST_CASE(endpoint__parse_port__bounds__expected)
{
    uint16_t out{};
    BOOST_REQUIRE(parse_port(out, "0"));
    BOOST_REQUIRE_EQUAL(out, 0u);
    BOOST_REQUIRE(parse_port(out, "65535"));
    BOOST_REQUIRE_EQUAL(out, 65535u);
    BOOST_REQUIRE(!parse_port(out, "-1"));
    BOOST_REQUIRE(!parse_port(out, ""));
}

BOOST_AUTO_TEST_CASE(endpoint__parse_connection__local_remote__expected)
{
    endpoint local{};
    endpoint remote{};
    BOOST_REQUIRE(parse_connection(local, remote,
        "172.0.118.125:30002 167.235.223.34:5355"));
    BOOST_REQUIRE(local == endpoint{ "172.0.118.125", 30002 });
    BOOST_REQUIRE(remote == endpoint{ "167.235.223.34", 5355 });
}

BOOST_AUTO_TEST_CASE(endpoint__parse_connection__single_endpoint__false)
{
    endpoint local{};
    endpoint remote{};
    BOOST_REQUIRE(!parse_connection(local, remote, "172.0.118.125:30002"));
}

BOOST_AUTO_TEST_CASE(endpoint__endpoint_hash__equal_values__equal_hashes)
{
    const endpoint_hash hash{};
    BOOST_REQUIRE_EQUAL(hash(endpoint{ "1.2.3.4", 1 }),
        hash(endpoint{ "1.2.3.4", 1 }));
}

BOOST_AUTO_TEST_SUITE_END()
