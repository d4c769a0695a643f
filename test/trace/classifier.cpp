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

BOOST_AUTO_TEST_SUITE(classifier_tests)

static trace_event make_event(const std::string& ns,
    const std::string& data)
{
    trace_event event{};
    event.at = test::at(1'757'695'899);
    event.ns = ns;
    event.data = boost::json::parse(data).as_object();
    return event;
}

// kind

BOOST_AUTO_TEST_CASE(classifier__kind__known_namespaces__expected)
{
    BOOST_REQUIRE(classifier::kind("Net.InboundGovernor.Remote.InboundGovernorCounters") == event_kind::inbound_governor_counters);
    BOOST_REQUIRE(classifier::kind("Net.InboundGovernor.Local.PromotedToWarmRemote") == event_kind::peer_promoted_warm);
    BOOST_REQUIRE(classifier::kind("Net.InboundGovernor.Remote.PromotedToHotRemote") == event_kind::peer_promoted_hot);
    BOOST_REQUIRE(classifier::kind("Net.InboundGovernor.Remote.DemotedToWarmRemote") == event_kind::peer_demoted_warm);
    BOOST_REQUIRE(classifier::kind("Net.InboundGovernor.Local.DemotedToColdRemote") == event_kind::peer_demoted_cold);
    BOOST_REQUIRE(classifier::kind("Net.Server.Local.Started") == event_kind::node_restart);
    BOOST_REQUIRE(classifier::kind("Net.PeerSelection.Actions.StatusChanged") == event_kind::peer_status_changed);
    BOOST_REQUIRE(classifier::kind("ChainSync.Client.DownloadedHeader") == event_kind::block_header_seen);
    BOOST_REQUIRE(classifier::kind("BlockFetch.Client.SendFetchRequest") == event_kind::block_fetch_requested);
    BOOST_REQUIRE(classifier::kind("BlockFetch.Client.CompletedBlockFetch") == event_kind::block_downloaded);
    BOOST_REQUIRE(classifier::kind("ChainDB.AddBlockEvent.AddedToCurrentChain") == event_kind::block_adopted);
    BOOST_REQUIRE(classifier::kind("ChainDB.AddBlockEvent.SwitchedToAFork") == event_kind::block_adopted);
}

BOOST_AUTO_TEST_CASE(classifier__kind__unknown_namespaces__ignored)
{
    BOOST_REQUIRE(classifier::kind("") == event_kind::ignored);
    BOOST_REQUIRE(classifier::kind("Mempool.AddedTx") == event_kind::ignored);
    BOOST_REQUIRE(classifier::kind("BlockFetch.Client.XSendFetchRequest") == event_kind::ignored);
    BOOST_REQUIRE(classifier::kind("ChainSync.Client.DownloadedHeader.Extra") == event_kind::ignored);
}

BOOST_AUTO_TEST_CASE(classifier__name__kinds__expected)
{
    BOOST_REQUIRE_EQUAL(classifier::name(event_kind::block_adopted), "block_adopted");
    BOOST_REQUIRE_EQUAL(classifier::name(event_kind::ignored), "ignored");
}

// classify

BOOST_AUTO_TEST_CASE(classifier__classify__unrecognized__unrecognized_event)
{
    classified out{};
    const auto event = make_event("Mempool.AddedTx", "{}");
    BOOST_REQUIRE(classifier::classify(out, event) == error::unrecognized_event);
    BOOST_REQUIRE(out.kind == event_kind::ignored);
    BOOST_REQUIRE(std::holds_alternative<std::monostate>(out.value));
}

BOOST_AUTO_TEST_CASE(classifier__classify__counters__expected)
{
    classified out{};
    const auto event = make_event("Net.InboundGovernor.Remote.InboundGovernorCounters",
        R"({"idlePeers":1,"coldPeers":2,"warmPeers":3,"hotPeers":4})");

    BOOST_REQUIRE(!classifier::classify(out, event));
    BOOST_REQUIRE(out.kind == event_kind::inbound_governor_counters);
    BOOST_REQUIRE(out.at == event.at);
    const auto& value = std::get<counters_event>(out.value);
    BOOST_REQUIRE_EQUAL(value.idle, 1u);
    BOOST_REQUIRE_EQUAL(value.cold, 2u);
    BOOST_REQUIRE_EQUAL(value.warm, 3u);
    BOOST_REQUIRE_EQUAL(value.hot, 4u);
}

BOOST_AUTO_TEST_CASE(classifier__classify__counters_missing_field__malformed_payload)
{
    classified out{};
    const auto event = make_event("Net.InboundGovernor.Remote.InboundGovernorCounters",
        R"({"idlePeers":1,"coldPeers":2,"warmPeers":3})");

    BOOST_REQUIRE(classifier::classify(out, event) == error::malformed_payload);
    BOOST_REQUIRE(out.kind == event_kind::ignored);
}

BOOST_AUTO_TEST_CASE(classifier__classify__restart__expected)
{
    classified out{};
    const auto event = make_event("Net.Server.Local.Started", "{}");
    BOOST_REQUIRE(!classifier::classify(out, event));
    BOOST_REQUIRE(out.kind == event_kind::node_restart);
    BOOST_REQUIRE(std::holds_alternative<restart_event>(out.value));
}

BOOST_AUTO_TEST_CASE(classifier__classify__promoted_hot__inbound_transition)
{
    classified out{};
    const auto event = make_event("Net.InboundGovernor.Remote.PromotedToHotRemote",
        R"({"connectionId":{"localAddress":{"address":"172.0.118.125","port":"3001"},)"
        R"("remoteAddress":{"address":"3.71.7.26","port":"41734"}}})");

    BOOST_REQUIRE(!classifier::classify(out, event));
    BOOST_REQUIRE(out.kind == event_kind::peer_promoted_hot);
    const auto& value = std::get<transition_event>(out.value);
    BOOST_REQUIRE(value.change == transition::promoted_to_hot);
    BOOST_REQUIRE(value.direction == peer_direction::inbound);
    BOOST_REQUIRE(value.remote == endpoint{ "3.71.7.26", 41734 });
    BOOST_REQUIRE(value.local.has_value());
    BOOST_REQUIRE(value.local.value() == endpoint{ "172.0.118.125", 3001 });
}

BOOST_AUTO_TEST_CASE(classifier__classify__demoted_missing_connection__malformed_payload)
{
    classified out{};
    const auto event = make_event("Net.InboundGovernor.Remote.DemotedToColdRemote", "{}");
    BOOST_REQUIRE(classifier::classify(out, event) == error::malformed_payload);
}

BOOST_AUTO_TEST_CASE(classifier__classify__status_changed__outbound_transition)
{
    classified out{};
    const auto event = make_event("Net.PeerSelection.Actions.StatusChanged",
        R"({"peerStatusChangeType":"ColdToWarm (Just 172.0.118.125:30002) 3.71.7.26:3001"})");

    BOOST_REQUIRE(!classifier::classify(out, event));
    BOOST_REQUIRE(out.kind == event_kind::peer_status_changed);
    const auto& value = std::get<transition_event>(out.value);
    BOOST_REQUIRE(value.change == transition::cold_to_warm);
    BOOST_REQUIRE(value.direction == peer_direction::outbound);
    BOOST_REQUIRE(value.remote == endpoint{ "3.71.7.26", 3001 });
    BOOST_REQUIRE(value.local.value() == endpoint{ "172.0.118.125", 30002 });
}

BOOST_AUTO_TEST_CASE(classifier__classify__status_changed_invalid__invalid_status_change)
{
    classified out{};
    const auto event = make_event("Net.PeerSelection.Actions.StatusChanged",
        R"({"peerStatusChangeType":"ColdToHot 3.71.7.26:3001"})");

    BOOST_REQUIRE(classifier::classify(out, event) == error::invalid_status_change);
}

BOOST_AUTO_TEST_CASE(classifier__classify__status_changed_missing__malformed_payload)
{
    classified out{};
    const auto event = make_event("Net.PeerSelection.Actions.StatusChanged", "{}");
    BOOST_REQUIRE(classifier::classify(out, event) == error::malformed_payload);
}

BOOST_AUTO_TEST_CASE(classifier__classify__header__expected)
{
    classified out{};
    const auto event = make_event("ChainSync.Client.DownloadedHeader",
        R"({"block":"aa11","blockNo":12345,"slot":67890,)"
        R"("peer":{"connectionId":"172.0.118.125:30002 167.235.223.34:5355"}})");

    BOOST_REQUIRE(!classifier::classify(out, event));
    BOOST_REQUIRE(out.kind == event_kind::block_header_seen);
    const auto& value = std::get<header_event>(out.value);
    BOOST_REQUIRE_EQUAL(value.hash, "aa11");
    BOOST_REQUIRE_EQUAL(value.block_no, 12345u);
    BOOST_REQUIRE_EQUAL(value.slot_no, 67890u);
    BOOST_REQUIRE(value.remote == endpoint{ "167.235.223.34", 5355 });
}

BOOST_AUTO_TEST_CASE(classifier__classify__header_size__decoded_or_zero)
{
    classified out{};
    const auto sized = make_event("ChainSync.Client.DownloadedHeader",
        R"({"block":"aa11","blockNo":12345,"slot":67890,"size":"864",)"
        R"("peer":{"connectionId":"172.0.118.125:30002 167.235.223.34:5355"}})");

    BOOST_REQUIRE(!classifier::classify(out, sized));
    BOOST_REQUIRE_EQUAL(std::get<header_event>(out.value).size, 864u);

    const auto unsized = make_event("ChainSync.Client.DownloadedHeader",
        R"({"block":"aa11","blockNo":12345,"slot":67890,)"
        R"("peer":{"connectionId":"172.0.118.125:30002 167.235.223.34:5355"}})");

    BOOST_REQUIRE(!classifier::classify(out, unsized));
    BOOST_REQUIRE_EQUAL(std::get<header_event>(out.value).size, 0u);
}

BOOST_AUTO_TEST_CASE(classifier__classify__header_missing_peer__malformed_payload)
{
    classified out{};
    const auto event = make_event("ChainSync.Client.DownloadedHeader",
        R"({"block":"aa11","blockNo":12345,"slot":67890})");

    BOOST_REQUIRE(classifier::classify(out, event) == error::malformed_payload);
}

BOOST_AUTO_TEST_CASE(classifier__classify__fetch_quoted_hash__unquoted)
{
    classified out{};
    const auto event = make_event("BlockFetch.Client.SendFetchRequest",
        R"({"head":"\"aa11\"","peer":{"connectionId":"172.0.118.125:30002 167.235.223.34:5355"}})");

    BOOST_REQUIRE(!classifier::classify(out, event));
    BOOST_REQUIRE(out.kind == event_kind::block_fetch_requested);
    const auto& value = std::get<fetch_event>(out.value);
    BOOST_REQUIRE_EQUAL(value.hash, "aa11");
    BOOST_REQUIRE(value.remote == endpoint{ "167.235.223.34", 5355 });
}

BOOST_AUTO_TEST_CASE(classifier__classify__download_with_size__expected)
{
    classified out{};
    const auto event = make_event("BlockFetch.Client.CompletedBlockFetch",
        R"({"block":"aa11","size":2048,"peer":{"connectionId":"172.0.118.125:30002 167.235.223.34:5355"}})");

    BOOST_REQUIRE(!classifier::classify(out, event));
    BOOST_REQUIRE(out.kind == event_kind::block_downloaded);
    const auto& value = std::get<download_event>(out.value);
    BOOST_REQUIRE_EQUAL(value.hash, "aa11");
    BOOST_REQUIRE_EQUAL(value.size, 2048u);
}

BOOST_AUTO_TEST_CASE(classifier__classify__download_without_size__zero_size)
{
    classified out{};
    const auto event = make_event("BlockFetch.Client.CompletedBlockFetch",
        R"({"block":"aa11","peer":{"connectionId":"172.0.118.125:30002 167.235.223.34:5355"}})");

    BOOST_REQUIRE(!classifier::classify(out, event));
    BOOST_REQUIRE_EQUAL(std::get<download_event>(out.value).size, 0u);
}

BOOST_AUTO_TEST_CASE(classifier__classify__adopted_fork__all_headers_in_order)
{
    classified out{};
    const auto event = make_event("ChainDB.AddBlockEvent.SwitchedToAFork",
        R"({"headers":[{"hash":"aa11","blockNo":1,"slotNo":10},)"
        R"({"hash":"bb22","blockNo":2,"slotNo":"20"}]})");

    BOOST_REQUIRE(!classifier::classify(out, event));
    BOOST_REQUIRE(out.kind == event_kind::block_adopted);
    const auto& value = std::get<adopt_event>(out.value);
    BOOST_REQUIRE_EQUAL(value.headers.size(), 2u);
    BOOST_REQUIRE_EQUAL(value.headers.at(0).hash, "aa11");
    BOOST_REQUIRE_EQUAL(value.headers.at(1).hash, "bb22");
    BOOST_REQUIRE_EQUAL(value.headers.at(1).slot_no, 20u);
}

BOOST_AUTO_TEST_CASE(classifier__classify__adopted_empty_headers__malformed_payload)
{
    classified out{};
    const auto event = make_event("ChainDB.AddBlockEvent.AddedToCurrentChain",
        R"({"headers":[]})");

    BOOST_REQUIRE(classifier::classify(out, event) == error::malformed_payload);
}

BOOST_AUTO_TEST_SUITE_END()
