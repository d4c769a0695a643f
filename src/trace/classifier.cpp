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
#include <blockperf/trace/classifier.hpp>

#include <array>
#include <blockperf/define.hpp>
#include <blockperf/trace/decoder.hpp>
#include <blockperf/trace/status_change.hpp>
#include <blockperf/utility/endpoint.hpp>

namespace blockperf {

using namespace bc::system;

struct namespace_entry
{
    std::string_view prefix;
    std::string_view leaf;
    event_kind kind;
};

// Recognized namespaces, the inbound governor reports under Local and Remote.
// Extend here as new trace kinds are observed.
constexpr std::array<namespace_entry, 12> namespaces
{{
    { "Net.InboundGovernor.", "InboundGovernorCounters", event_kind::inbound_governor_counters },
    { "Net.InboundGovernor.", "PromotedToWarmRemote", event_kind::peer_promoted_warm },
    { "Net.InboundGovernor.", "PromotedToHotRemote", event_kind::peer_promoted_hot },
    { "Net.InboundGovernor.", "DemotedToWarmRemote", event_kind::peer_demoted_warm },
    { "Net.InboundGovernor.", "DemotedToColdRemote", event_kind::peer_demoted_cold },
    { "Net.Server.Local.", "Started", event_kind::node_restart },
    { "Net.PeerSelection.Actions.", "StatusChanged", event_kind::peer_status_changed },
    { "ChainSync.Client.", "DownloadedHeader", event_kind::block_header_seen },
    { "BlockFetch.Client.", "SendFetchRequest", event_kind::block_fetch_requested },
    { "BlockFetch.Client.", "CompletedBlockFetch", event_kind::block_downloaded },
    { "ChainDB.AddBlockEvent.", "AddedToCurrentChain", event_kind::block_adopted },
    { "ChainDB.AddBlockEvent.", "SwitchedToAFork", event_kind::block_adopted }
}};

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

// Utilities.
// ----------------------------------------------------------------------------

// Hashes may be emitted with literal quotes.
static bool get_hash(std::string& out, const boost::json::object& object,
    std::string_view key) NOEXCEPT
{
    if (!get_text(out, object, key))
        return false;

    if (out.size() >= two && out.front() == '"' && out.back() == '"')
        out = out.substr(one, out.size() - two);

    return !out.empty();
}

// "peer": { "connectionId": "<local>:<port> <remote>:<port>" }
static bool get_peer(endpoint& remote, const boost::json::object& object) NOEXCEPT
{
    const boost::json::object* peer{};
    std::string connection{};
    endpoint local{};
    return get_object(peer, object, "peer") &&
        get_text(connection, *peer, "connectionId") &&
        parse_connection(local, remote, connection);
}

// "<key>": { "address": "<ip>", "port": <port> }
static bool get_address(endpoint& out, const boost::json::object& object,
    std::string_view key) NOEXCEPT
{
    const boost::json::object* address{};
    uint64_t port{};
    if (!get_object(address, object, key) ||
        !get_text(out.address, *address, "address") ||
        !get_number(port, *address, "port") ||
        out.address.empty() || port > max_uint16)
        return false;

    out.port = static_cast<uint16_t>(port);
    return true;
}

// Classification.
// ----------------------------------------------------------------------------

event_kind classifier::kind(std::string_view ns) NOEXCEPT
{
    for (const auto& entry: namespaces)
    {
        if (ns.size() < entry.prefix.size() + entry.leaf.size() ||
            !ns.starts_with(entry.prefix) || !ns.ends_with(entry.leaf))
            continue;

        // The leaf must be a whole segment.
        if (ns[ns.size() - entry.leaf.size() - one] == '.')
            return entry.kind;
    }

    return event_kind::ignored;
}

std::string_view classifier::name(event_kind kind) NOEXCEPT
{
    switch (kind)
    {
        case event_kind::inbound_governor_counters:
            return "inbound_governor_counters";
        case event_kind::node_restart:
            return "node_restart";
        case event_kind::peer_promoted_warm:
            return "peer_promoted_warm";
        case event_kind::peer_promoted_hot:
            return "peer_promoted_hot";
        case event_kind::peer_demoted_warm:
            return "peer_demoted_warm";
        case event_kind::peer_demoted_cold:
            return "peer_demoted_cold";
        case event_kind::peer_status_changed:
            return "peer_status_changed";
        case event_kind::block_header_seen:
            return "block_header_seen";
        case event_kind::block_fetch_requested:
            return "block_fetch_requested";
        case event_kind::block_downloaded:
            return "block_downloaded";
        case event_kind::block_adopted:
            return "block_adopted";
        case event_kind::ignored:
        default:
            return "ignored";
    }
}

code classifier::classify(classified& out, const trace_event& event) NOEXCEPT
{
    out = {};
    payload value{};
    code ec{ error::success };
    const auto type = kind(event.ns);

    switch (type)
    {
        case event_kind::inbound_governor_counters:
            ec = decode_counters(value, event.data);
            break;
        case event_kind::node_restart:
            value = restart_event{};
            break;
        case event_kind::peer_promoted_warm:
        case event_kind::peer_promoted_hot:
        case event_kind::peer_demoted_warm:
        case event_kind::peer_demoted_cold:
            ec = decode_governor(value, type, event.data);
            break;
        case event_kind::peer_status_changed:
            ec = decode_status(value, event.data);
            break;
        case event_kind::block_header_seen:
            ec = decode_header(value, event.data);
            break;
        case event_kind::block_fetch_requested:
            ec = decode_fetch(value, event.data);
            break;
        case event_kind::block_downloaded:
            ec = decode_download(value, event.data);
            break;
        case event_kind::block_adopted:
            ec = decode_adopt(value, event.data);
            break;
        case event_kind::ignored:
        default:
            return error::unrecognized_event;
    }

    if (ec)
        return ec;

    out.kind = type;
    out.at = event.at;
    out.value = std::move(value);
    return error::success;
}

// Payload decoders.
// ----------------------------------------------------------------------------

code classifier::decode_counters(payload& out,
    const boost::json::object& data) NOEXCEPT
{
    counters_event value{};
    if (!get_number(value.idle, data, "idlePeers") ||
        !get_number(value.cold, data, "coldPeers") ||
        !get_number(value.warm, data, "warmPeers") ||
        !get_number(value.hot, data, "hotPeers"))
        return error::malformed_payload;

    out = value;
    return error::success;
}

code classifier::decode_governor(payload& out, event_kind kind,
    const boost::json::object& data) NOEXCEPT
{
    transition_event value{};
    value.direction = peer_direction::inbound;

    switch (kind)
    {
        case event_kind::peer_promoted_warm:
            value.change = transition::promoted_to_warm;
            break;
        case event_kind::peer_promoted_hot:
            value.change = transition::promoted_to_hot;
            break;
        case event_kind::peer_demoted_warm:
            value.change = transition::demoted_to_warm;
            break;
        case event_kind::peer_demoted_cold:
            value.change = transition::demoted_to_cold;
            break;
        default:
            return error::unrecognized_event;
    }

    const boost::json::object* connection{};
    endpoint local{};
    if (!get_object(connection, data, "connectionId") ||
        !get_address(local, *connection, "localAddress") ||
        !get_address(value.remote, *connection, "remoteAddress"))
        return error::malformed_payload;

    value.local = std::move(local);
    out = std::move(value);
    return error::success;
}

code classifier::decode_status(payload& out,
    const boost::json::object& data) NOEXCEPT
{
    std::string text{};
    if (!get_text(text, data, "peerStatusChangeType"))
        return error::malformed_payload;

    status_change change{};
    if (!parse_status_change(change, text))
        return error::invalid_status_change;

    transition_event value{};
    value.change = change.change;
    value.direction = peer_direction::outbound;
    value.remote = std::move(change.remote);
    value.local = std::move(change.local);
    out = std::move(value);
    return error::success;
}

code classifier::decode_header(payload& out,
    const boost::json::object& data) NOEXCEPT
{
    header_event value{};
    if (!get_hash(value.hash, data, "block") ||
        !get_number(value.block_no, data, "blockNo") ||
        !get_number(value.slot_no, data, "slot") ||
        !get_peer(value.remote, data))
        return error::malformed_payload;

    // Block size is carried by header traces of some node versions.
    if (!get_number(value.size, data, "size"))
        value.size = zero;

    out = std::move(value);
    return error::success;
}

code classifier::decode_fetch(payload& out,
    const boost::json::object& data) NOEXCEPT
{
    fetch_event value{};
    if (!get_hash(value.hash, data, "head") ||
        !get_peer(value.remote, data))
        return error::malformed_payload;

    out = std::move(value);
    return error::success;
}

code classifier::decode_download(payload& out,
    const boost::json::object& data) NOEXCEPT
{
    download_event value{};
    if (!get_hash(value.hash, data, "block") ||
        !get_peer(value.remote, data))
        return error::malformed_payload;

    // Size is not emitted by all node versions.
    if (!get_number(value.size, data, "size"))
        value.size = zero;

    out = std::move(value);
    return error::success;
}

code classifier::decode_adopt(payload& out,
    const boost::json::object& data) NOEXCEPT
{
    const auto headers = data.if_contains("headers");
    if (is_null(headers) || !headers->is_array() ||
        headers->get_array().empty())
        return error::malformed_payload;

    adopt_event value{};
    for (const auto& item: headers->get_array())
    {
        if (!item.is_object())
            return error::malformed_payload;

        adopt_event::header header{};
        const auto& object = item.get_object();
        if (!get_hash(header.hash, object, "hash") ||
            !get_number(header.block_no, object, "blockNo") ||
            !get_number(header.slot_no, object, "slotNo"))
            return error::malformed_payload;

        value.headers.push_back(std::move(header));
    }

    out = std::move(value);
    return error::success;
}

BC_POP_WARNING()

} // namespace blockperf
