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
#include <blockperf/chasers/chaser_peers.hpp>

#include <algorithm>
#include <chrono>
#include <blockperf/chasers/chaser.hpp>
#include <blockperf/collector.hpp>
#include <blockperf/define.hpp>

namespace blockperf {

#define CLASS chaser_peers

using namespace bc::system;
using namespace network;
using namespace std::chrono;
using namespace std::placeholders;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

chaser_peers::chaser_peers(collector& collector) NOEXCEPT
  : chaser(collector)
{
}

// start/stop
// ----------------------------------------------------------------------------

code chaser_peers::start() NOEXCEPT
{
    // Construct is too early to create the unstarted timers.
    const auto& settings = config().monitor;
    reconcile_timer_ = std::make_shared<deadline>(log, strand(),
        settings.reconcile_interval());
    report_timer_ = std::make_shared<deadline>(log, strand(),
        settings.report_interval());

    // First pass is immediate, establishes connections existing at start.
    POST(handle_reconcile, error::success);
    report_timer_->start(BIND(handle_report, _1));
    return error::success;
}

void chaser_peers::stopping(const code& ec) NOEXCEPT
{
    POST(do_stopping, ec);
}

// protected
void chaser_peers::do_stopping(const code&) NOEXCEPT
{
    BC_ASSERT(stranded());

    if (reconcile_timer_)
    {
        reconcile_timer_->stop();
        reconcile_timer_.reset();
    }

    if (report_timer_)
    {
        report_timer_->stop();
        report_timer_.reset();
    }
}

// Organizers.
// ----------------------------------------------------------------------------

void chaser_peers::apply(const transition_event& event,
    const instant& at) NOEXCEPT
{
    POST(do_apply, event, at);
}

void chaser_peers::restart(const instant& at) NOEXCEPT
{
    POST(do_restart, at);
}

void chaser_peers::counters(const counters_event& event) NOEXCEPT
{
    POST(do_counters, event);
}

void chaser_peers::peers(peers_handler&& handler) NOEXCEPT
{
    POST(do_peers, std::move(handler));
}

// protected
void chaser_peers::do_apply(const transition_event& event,
    const instant& at) NOEXCEPT
{
    BC_ASSERT(stranded());
    latest_ = std::max(latest_, at);

    const auto prior = tracker_.find(event.remote);
    const auto tracked = is_null(prior) ? peer_state::unknown : prior->state;
    const auto ec = tracker_.apply(event, at);
    ++transitions_;
    tracked_ = tracker_.size();
    fire(events::peer_transition, tracker_.size());

    // The log is authoritative for state, the mismatch is only reported.
    if (ec == error::transition_mismatch)
    {
        ++mismatches_;
        fire(events::peer_mismatch, event.remote.port);
        LOGR("Peer [" << event.remote.to_string() << "] "
            << to_string(event.change) << " expects ["
            << to_string(from_state(event.change)) << "] but tracked ["
            << to_string(tracked) << "].");
    }

    LOGV("Peer [" << event.remote.to_string() << "] "
        << to_string(event.change) << " ("
        << to_string(event.direction) << ").");
}

void chaser_peers::do_restart(const instant& at) NOEXCEPT
{
    BC_ASSERT(stranded());
    latest_ = std::max(latest_, at);

    const auto cleared = tracker_.size();
    tracker_.reset();
    tracked_ = zero;
    fire(events::peers_cleared, cleared);
    LOGN("Node restarted, [" << cleared << "] peers cleared.");
}

void chaser_peers::do_counters(const counters_event& event) NOEXCEPT
{
    BC_ASSERT(stranded());
    tracker_.set_counters(event);
}

void chaser_peers::do_peers(const peers_handler& handler) NOEXCEPT
{
    BC_ASSERT(stranded());
    handler(error::success, tracker_.snapshot());
}

// reconcile
// ----------------------------------------------------------------------------

void chaser_peers::handle_reconcile(const code& ec) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (closed() || !reconcile_timer_ ||
        ec == network::error::operation_canceled)
        return;

    if (ec && ec != network::error::operation_timeout)
    {
        LOGF("Peers chaser timer fault, " << ec.message());
        return;
    }

    do_reconcile();
    reconcile_timer_->start(BIND(handle_reconcile, _1));
}

// protected
void chaser_peers::do_reconcile() NOEXCEPT
{
    BC_ASSERT(stranded());

    const auto start = logger::now();
    connection::list connections{};
    if (const auto ec = owner().connections().snapshot(connections))
    {
        // Retried on the next tick.
        fire(events::snapshot_failed);
        LOGS("Connection snapshot skipped, " << ec.message());
        return;
    }

    // Peer times are trace times, zero until the first transition or restart.
    const auto result = tracker_.reconcile(connections, latest_);
    tracked_ = tracker_.size();

    if (!is_zero(result.added))
        fire(events::peers_added, result.added);

    if (!is_zero(result.removed))
        fire(events::peers_removed, result.removed);

    span<milliseconds>(events::reconcile_msecs, start);
    LOGV("Reconciled [" << connections.size() << "] connections, added ["
        << result.added << "] removed [" << result.removed << "] peers.");
}

// report
// ----------------------------------------------------------------------------

void chaser_peers::handle_report(const code& ec) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (closed() || !report_timer_ ||
        ec == network::error::operation_canceled)
        return;

    if (ec && ec != network::error::operation_timeout)
    {
        LOGF("Peers chaser timer fault, " << ec.message());
        return;
    }

    do_report();
    report_timer_->start(BIND(handle_report, _1));
}

// protected
void chaser_peers::do_report() const NOEXCEPT
{
    BC_ASSERT(stranded());

    const auto tally = tracker_.report();
    const auto& in = tally.at(static_cast<size_t>(peer_direction::inbound));
    const auto& out = tally.at(static_cast<size_t>(peer_direction::outbound));
    const auto& governor = tracker_.counters();

    LOGN("Peers [" << tracker_.size() << "] inbound (cold/warm/hot/unknown) ["
        << in.at(1) << "/" << in.at(2) << "/" << in.at(3) << "/" << in.at(0)
        << "] outbound [" << out.at(1) << "/" << out.at(2) << "/" << out.at(3)
        << "/" << out.at(0) << "] governor (idle/cold/warm/hot) ["
        << governor.idle << "/" << governor.cold << "/" << governor.warm
        << "/" << governor.hot << "].");
}

// Totals.
// ----------------------------------------------------------------------------

size_t chaser_peers::transitions() const NOEXCEPT
{
    return transitions_.load();
}

size_t chaser_peers::mismatches() const NOEXCEPT
{
    return mismatches_.load();
}

size_t chaser_peers::tracked() const NOEXCEPT
{
    return tracked_.load();
}

BC_POP_WARNING()

} // namespace blockperf
