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
#include <blockperf/chasers/chaser_dispatch.hpp>

#include <blockperf/chasers/chaser.hpp>
#include <blockperf/collector.hpp>
#include <blockperf/define.hpp>
#include <blockperf/trace/classifier.hpp>

namespace blockperf {

#define CLASS chaser_dispatch

using namespace bc::system;
using namespace network;
using namespace std::placeholders;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

static bool is_blockperf(const code& ec) NOEXCEPT
{
    static const code category{ error::success };
    return ec.category() == category.category();
}

// Independent threadpool and strand (base class strand uses collector pool).
chaser_dispatch::chaser_dispatch(collector& collector) NOEXCEPT
  : chaser(collector),
    threadpool_(one),
    independent_strand_(threadpool_.service().get_executor())
{
}

code chaser_dispatch::start() NOEXCEPT
{
    // Construct is too early to create the unstarted timer.
    poll_timer_ = std::make_shared<deadline>(log, strand(),
        config().trace.poll());

    return error::success;
}

void chaser_dispatch::stopping(const code& ec) NOEXCEPT
{
    POST(do_stopping, ec);

    // Stop threadpool keep-alive, all work must self-terminate to affect join.
    threadpool_.stop();
    chaser::stopping(ec);
}

void chaser_dispatch::stop() NOEXCEPT
{
    // A blocked read (standard input) delays join until the read returns.
    if (!threadpool_.join())
    {
        LOGF("Failed to join dispatch threadpool.");
    }
}

// protected
void chaser_dispatch::do_stopping(const code&) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (!poll_timer_)
        return;

    poll_timer_->stop();
    poll_timer_.reset();
}

// read
// ----------------------------------------------------------------------------

void chaser_dispatch::read() NOEXCEPT
{
    POST(do_read, error::success);
}

// protected
void chaser_dispatch::do_read(const code& ec) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (closed() || !poll_timer_ || ec == network::error::operation_canceled)
        return;

    if (ec && ec != network::error::operation_timeout)
    {
        LOGF("Dispatch chaser timer fault, " << ec.message());
        return;
    }

    auto& source = owner().events();
    for (size_t count = zero; count < batch; ++count)
    {
        trace_event event{};
        const auto result = source.read(event);

        if (result == error::source_empty)
        {
            poll_timer_->start(BIND(do_read, _1));
            return;
        }

        if (result == error::source_exhausted ||
            result == error::source_unavailable)
        {
            LOGN("Trace source closed, " << result.message());
            owner().complete(result);
            return;
        }

        ++reads_;
        if (result)
        {
            discard(result);
            continue;
        }

        classified item{};
        if (const auto reason = classifier::classify(item, event))
        {
            discard(reason);
            continue;
        }

        route(item);
    }

    // Yield to stopping.
    POST(do_read, error::success);
}

// Posts from this strand retain their order on each chaser strand.
void chaser_dispatch::route(const classified& event) NOEXCEPT
{
    BC_ASSERT(stranded());
    auto& target = owner();

    switch (event.kind)
    {
        case event_kind::inbound_governor_counters:
        {
            target.counters(std::get<counters_event>(event.value));
            break;
        }
        case event_kind::node_restart:
        {
            target.restart(event.at);
            break;
        }
        case event_kind::peer_promoted_warm:
        case event_kind::peer_promoted_hot:
        case event_kind::peer_demoted_warm:
        case event_kind::peer_demoted_cold:
        case event_kind::peer_status_changed:
        {
            target.transition(std::get<transition_event>(event.value),
                event.at);
            break;
        }
        case event_kind::block_header_seen:
        {
            target.header_seen(std::get<header_event>(event.value),
                event.at);
            break;
        }
        case event_kind::block_fetch_requested:
        {
            target.fetch_requested(std::get<fetch_event>(event.value),
                event.at);
            break;
        }
        case event_kind::block_downloaded:
        {
            target.downloaded(std::get<download_event>(event.value),
                event.at);
            break;
        }
        case event_kind::block_adopted:
        {
            target.adopted(std::get<adopt_event>(event.value), event.at);
            break;
        }
        case event_kind::ignored:
        default:
        {
            break;
        }
    }
}

// Unrecognized namespaces are the common case and are not reported.
void chaser_dispatch::discard(const code& reason) NOEXCEPT
{
    BC_ASSERT(stranded());

    const auto index = static_cast<size_t>(reason.value());
    if (is_blockperf(reason) && index < discards_.size())
        ++discards_.at(index);

    if (reason == error::unrecognized_event)
        return;

    fire(events::event_discarded, index);
    LOGV("Trace record discarded, " << reason.message());
}

// Strand.
// ----------------------------------------------------------------------------

network::asio::strand& chaser_dispatch::strand() NOEXCEPT
{
    return independent_strand_;
}

bool chaser_dispatch::stranded() const NOEXCEPT
{
    return independent_strand_.running_in_this_thread();
}

// Totals.
// ----------------------------------------------------------------------------

size_t chaser_dispatch::reads() const NOEXCEPT
{
    return reads_.load();
}

size_t chaser_dispatch::discards(const code& reason) const NOEXCEPT
{
    const auto index = static_cast<size_t>(reason.value());
    if (!is_blockperf(reason) || index >= discards_.size())
        return zero;

    return discards_.at(index).load();
}

size_t chaser_dispatch::discards() const NOEXCEPT
{
    size_t total{};
    for (const auto& count: discards_)
        total += count.load();

    return total;
}

BC_POP_WARNING()

} // namespace blockperf
