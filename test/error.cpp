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

BOOST_AUTO_TEST_SUITE(error_tests)

// error_t
// These test std::error_code equality operator overrides.

// general

BOOST_AUTO_TEST_CASE(error_t__code__success__false_exected_message)
{
    constexpr auto value = error::success;
    const auto ec = code(value);
    BOOST_REQUIRE(!ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "success");
}

// events

BOOST_AUTO_TEST_CASE(error_t__code__unrecognized_event__true_exected_message)
{
    constexpr auto value = error::unrecognized_event;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "unrecognized event");
}

BOOST_AUTO_TEST_CASE(error_t__code__malformed_event__true_exected_message)
{
    constexpr auto value = error::malformed_event;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "malformed event");
}

BOOST_AUTO_TEST_CASE(error_t__code__malformed_payload__true_exected_message)
{
    constexpr auto value = error::malformed_payload;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "malformed payload");
}

BOOST_AUTO_TEST_CASE(error_t__code__invalid_status_change__true_exected_message)
{
    constexpr auto value = error::invalid_status_change;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "invalid status change");
}

// peers

BOOST_AUTO_TEST_CASE(error_t__code__transition_mismatch__true_exected_message)
{
    constexpr auto value = error::transition_mismatch;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "transition mismatch");
}

BOOST_AUTO_TEST_CASE(error_t__code__snapshot_unavailable__true_exected_message)
{
    constexpr auto value = error::snapshot_unavailable;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "connection snapshot unavailable");
}

// blocks

BOOST_AUTO_TEST_CASE(error_t__code__unknown_block__true_exected_message)
{
    constexpr auto value = error::unknown_block;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "unknown block");
}

BOOST_AUTO_TEST_CASE(error_t__code__incomplete_block__true_exected_message)
{
    constexpr auto value = error::incomplete_block;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "incomplete block");
}

BOOST_AUTO_TEST_CASE(error_t__code__duplicate_sample__true_exected_message)
{
    constexpr auto value = error::duplicate_sample;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "duplicate sample");
}

// sources

BOOST_AUTO_TEST_CASE(error_t__code__source_empty__true_exected_message)
{
    constexpr auto value = error::source_empty;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "source empty");
}

BOOST_AUTO_TEST_CASE(error_t__code__source_exhausted__true_exected_message)
{
    constexpr auto value = error::source_exhausted;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "source exhausted");
}

BOOST_AUTO_TEST_CASE(error_t__code__source_unavailable__true_exected_message)
{
    constexpr auto value = error::source_unavailable;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "source unavailable");
}

// sinks

BOOST_AUTO_TEST_CASE(error_t__code__sink_unavailable__true_exected_message)
{
    constexpr auto value = error::sink_unavailable;
    const auto ec = code(value);
    BOOST_REQUIRE(ec);
    BOOST_REQUIRE(ec == value);
    BOOST_REQUIRE_EQUAL(ec.message(), "sink unavailable");
}

BOOST_AUTO_TEST_CASE(error_t__code__category__blockperf)
{
    const auto ec = code(error::sink_unavailable);
    BOOST_REQUIRE_EQUAL(std::string{ ec.category().name() }, "blockperf");
    BOOST_REQUIRE(ec != code(error::source_unavailable));
}

BOOST_AUTO_TEST_SUITE_END()
