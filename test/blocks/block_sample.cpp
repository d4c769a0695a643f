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

BOOST_AUTO_TEST_SUITE(block_sample_tests)

using namespace std::chrono;

static block_sample make_sample()
{
    block_sample sample{};
    sample.magic = 764'824'073;
    sample.bp_version = "v2";
    sample.block_no = 12345;
    sample.slot_no = 67890;
    sample.block_hash = "aa11";
    sample.block_size = 2048;
    sample.header_remote = { "3.71.7.26", 3001 };
    sample.block_remote = { "167.235.223.34", 5355 };
    sample.block_local = { "10.0.0.1", 3001 };
    sample.header_delta = milliseconds(300);
    sample.request_delta = milliseconds(200);
    sample.response_delta = milliseconds(500);
    sample.adopt_delta = milliseconds(200);
    sample.block_g = milliseconds(900);
    return sample;
}

BOOST_AUTO_TEST_CASE(block_sample__is_skewed__non_negative__false)
{
    BOOST_REQUIRE(!make_sample().is_skewed());
    BOOST_REQUIRE(!block_sample{}.is_skewed());
}

BOOST_AUTO_TEST_CASE(block_sample__is_skewed__any_negative__true)
{
    auto sample = make_sample();
    sample.response_delta = -milliseconds(1);
    BOOST_REQUIRE(sample.is_skewed());
}

BOOST_AUTO_TEST_CASE(block_sample__value_from__fields__backend_names)
{
    const auto value = boost::json::value_from(make_sample());
    BOOST_REQUIRE(value.is_object());

    const auto& object = value.get_object();
    BOOST_REQUIRE_EQUAL(object.size(), 17u);
    BOOST_REQUIRE_EQUAL(object.at("magic").to_number<uint64_t>(), 764'824'073u);
    BOOST_REQUIRE_EQUAL(object.at("bpVersion").as_string(), "v2");
    BOOST_REQUIRE_EQUAL(object.at("blockNo").to_number<uint64_t>(), 12345u);
    BOOST_REQUIRE_EQUAL(object.at("slotNo").to_number<uint64_t>(), 67890u);
    BOOST_REQUIRE_EQUAL(object.at("blockHash").as_string(), "aa11");
    BOOST_REQUIRE_EQUAL(object.at("blockSize").to_number<uint64_t>(), 2048u);
    BOOST_REQUIRE_EQUAL(object.at("headerRemoteAddr").as_string(), "3.71.7.26");
    BOOST_REQUIRE_EQUAL(object.at("headerRemotePort").to_number<uint64_t>(), 3001u);
    BOOST_REQUIRE_EQUAL(object.at("headerDelta").as_string(), "0.3");
    BOOST_REQUIRE_EQUAL(object.at("blockReqDelta").as_string(), "0.2");
    BOOST_REQUIRE_EQUAL(object.at("blockRspDelta").as_string(), "0.5");
    BOOST_REQUIRE_EQUAL(object.at("blockAdoptDelta").as_string(), "0.2");
    BOOST_REQUIRE_EQUAL(object.at("blockRemoteAddress").as_string(), "167.235.223.34");
    BOOST_REQUIRE_EQUAL(object.at("blockRemotePort").to_number<uint64_t>(), 5355u);
    BOOST_REQUIRE_EQUAL(object.at("blockLocalAddress").as_string(), "10.0.0.1");
    BOOST_REQUIRE_EQUAL(object.at("blockLocalPort").to_number<uint64_t>(), 3001u);
    BOOST_REQUIRE_EQUAL(object.at("blockG").as_string(), "0.9");
}

BOOST_AUTO_TEST_CASE(block_sample__value_from__negative_delta__signed_text)
{
    auto sample = make_sample();
    sample.header_delta = -milliseconds(1'250);
    const auto value = boost::json::value_from(sample);
    BOOST_REQUIRE_EQUAL(value.as_object().at("headerDelta").as_string(), "-1.25");
}

BOOST_AUTO_TEST_SUITE_END()
