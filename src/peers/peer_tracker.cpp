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
#include <blockperf/peers/peer_tracker.hpp>

#include <unordered_set>
#include <blockperf/define.hpp>

namespace blockperf {

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

peer_tracker::peer_tracker() NOEXCEPT
  : peers_{}, counters_{}
{
}

// Trace truth.
// ----------------------------------------------------------------------------

code peer_tracker::apply(const transition_event& event,
    const instant& at) NOEXCEPT
{
    const auto [it, inserted] = peers_.try_emplace(event.remote);
    auto& tracked = it->second;
    if (inserted)
        tracked.remote = event.remote;

    // Os direction is inferred from ports, the trace direction replaces it.
    tracked.direction = event.direction;

    const auto expected = from_state(event.change);
    const auto mismatch = tracked.state != peer_state::unknown &&
        tracked.state != expected;

    // The trace to-state wins over the tracked state.
    tracked.state = to_state(event.change);
    tracked.updated = at;
    if (!tracked.local.has_value() && event.local.has_value())
        tracked.local = event.local;

    return mismatch ? error::transition_mismatch : error::success;
}

void peer_tracker::reset() NOEXCEPT
{
    peers_.clear();
}

void peer_tracker::set_counters(const counters_event& counters) NOEXCEPT
{
    counters_ = counters;
}

const counters_event& peer_tracker::counters() const NOEXCEPT
{
    return counters_;
}

// OS truth.
// ----------------------------------------------------------------------------

peer_tracker::reconciliation peer_tracker::reconcile(
    const connection::list& connections, const instant& at) NOEXCEPT
{
    reconciliation result{};
    std::unordered_set<endpoint, endpoint_hash> live{};

    for (const auto& socket: connections)
    {
        live.insert(socket.remote);
        const auto [it, inserted] = peers_.try_emplace(socket.remote);
        auto& tracked = it->second;

        if (inserted)
        {
            tracked.remote = socket.remote;
            tracked.local = socket.local;
            tracked.direction = socket.direction;
            tracked.state = peer_state::unknown;
            tracked.updated = at;
            ++result.added;
        }
        else if (!tracked.local.has_value())
        {
            tracked.local = socket.local;
        }
    }

    result.removed = std::erase_if(peers_, [&](const auto& item) NOEXCEPT
    {
        return !live.contains(item.first);
    });

    return result;
}

// Reporting.
// ----------------------------------------------------------------------------

peer::list peer_tracker::snapshot() const NOEXCEPT
{
    peer::list out{};
    out.reserve(peers_.size());
    for (const auto& item: peers_)
        out.push_back(item.second);

    return out;
}

peer_tracker::tally peer_tracker::report() const NOEXCEPT
{
    tally out{};
    for (const auto& item: peers_)
    {
        const auto& tracked = item.second;
        ++out[static_cast<size_t>(tracked.direction)]
            [static_cast<size_t>(tracked.state)];
    }

    return out;
}

const peer* peer_tracker::find(const endpoint& remote) const NOEXCEPT
{
    const auto it = peers_.find(remote);
    return it == peers_.end() ? nullptr : &it->second;
}

size_t peer_tracker::size() const NOEXCEPT
{
    return peers_.size();
}

BC_POP_WARNING()

} // namespace blockperf
