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
#include <blockperf/collector.hpp>

#include <blockperf/chasers/chasers.hpp>
#include <blockperf/define.hpp>

namespace blockperf {

using namespace bc::system;
using namespace network;
using namespace std::placeholders;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

// Chasers require threadpool and strand, constructed in member order.
collector::collector(event_source& events, connection_source& connections,
    sample_sink& samples, const genesis& chain,
    const configuration& configuration, const logger& log) NOEXCEPT
  : reporter(log),
    config_(configuration),
    chain_(chain),
    events_(events),
    connections_(connections),
    samples_(samples),
    threadpool_(configuration.monitor.threads_()),
    strand_(threadpool_.service().get_executor()),
    close_subscriber_(strand_),
    chaser_peers_(*this),
    chaser_blocks_(*this),
    chaser_dispatch_(*this)
{
}

collector::~collector() NOEXCEPT
{
    collector::close();
}

// Sequences.
// ----------------------------------------------------------------------------

void collector::start(result_handler&& handler) NOEXCEPT
{
    if (closed())
    {
        handler(network::error::service_stopped);
        return;
    }

    boost::asio::post(strand_,
        std::bind(&collector::do_start, this, std::move(handler)));
}

void collector::do_start(const result_handler& handler) NOEXCEPT
{
    BC_ASSERT(stranded());
    code ec{};

    if (((ec = chaser_peers_.start())) ||
        ((ec = chaser_blocks_.start())) ||
        ((ec = chaser_dispatch_.start())))
    {
        handler(ec);
        return;
    }

    LOGN("Collector started for network magic [" << chain_.magic() << "].");
    handler(error::success);
}

void collector::run(result_handler&& handler) NOEXCEPT
{
    boost::asio::post(strand_,
        std::bind(&collector::do_run, this, std::move(handler)));
}

void collector::do_run(const result_handler& handler) NOEXCEPT
{
    BC_ASSERT(stranded());

    if (closed())
    {
        handler(network::error::service_stopped);
        return;
    }

    if (!running_)
    {
        running_ = true;
        chaser_dispatch_.read();
    }

    handler(error::success);
}

void collector::subscribe_close(result_handler&& handler) NOEXCEPT
{
    boost::asio::post(strand_,
        std::bind(&collector::do_subscribe_close, this, std::move(handler)));
}

void collector::do_subscribe_close(const result_handler& handler) NOEXCEPT
{
    BC_ASSERT(stranded());

    // Subscription fails once the collector has completed or closed.
    if (const auto ec = close_subscriber_.subscribe(move_copy(handler)))
        handler(ec);
}

void collector::complete(const code& ec) NOEXCEPT
{
    boost::asio::post(strand_,
        std::bind(&collector::do_complete, this, ec));
}

void collector::do_complete(const code& ec) NOEXCEPT
{
    BC_ASSERT(stranded());
    close_subscriber_.stop(ec);
}

void collector::close() NOEXCEPT
{
    // Initiate stop (once), queued records are still processed.
    if (!closed_.exchange(true))
    {
        boost::asio::post(strand_, std::bind(&collector::do_close, this));
    }

    // Block on join of all threads in the pool.
    if (!threadpool_.join())
    {
        LOGF("Failed to join collector threadpool.");
    }

    // Block on chaser stop (including dedicated threadpool joins).
    chaser_peers_.stop();
    chaser_blocks_.stop();
    chaser_dispatch_.stop();
}

void collector::do_close() NOEXCEPT
{
    BC_ASSERT(stranded());

    // Initiate chaser stopping (including dedicated threadpools).
    chaser_dispatch_.stopping(network::error::service_stopped);
    chaser_peers_.stopping(network::error::service_stopped);
    chaser_blocks_.stopping(network::error::service_stopped);

    close_subscriber_.stop(network::error::service_stopped);
    threadpool_.stop();
}

// Organizers.
// ----------------------------------------------------------------------------

void collector::counters(const counters_event& event) NOEXCEPT
{
    chaser_peers_.counters(event);
}

void collector::restart(const instant& at) NOEXCEPT
{
    chaser_peers_.restart(at);
}

void collector::transition(const transition_event& event,
    const instant& at) NOEXCEPT
{
    chaser_peers_.apply(event, at);
}

void collector::header_seen(const header_event& event,
    const instant& at) NOEXCEPT
{
    chaser_blocks_.header_seen(event, at);
}

void collector::fetch_requested(const fetch_event& event,
    const instant& at) NOEXCEPT
{
    chaser_blocks_.fetch_requested(event, at);
}

void collector::downloaded(const download_event& event,
    const instant& at) NOEXCEPT
{
    chaser_blocks_.downloaded(event, at);
}

void collector::adopted(const adopt_event& event,
    const instant& at) NOEXCEPT
{
    chaser_blocks_.adopted(event, at);
}

// Queries.
// ----------------------------------------------------------------------------

void collector::peers(peers_handler&& handler) NOEXCEPT
{
    chaser_peers_.peers(std::move(handler));
}

collector::totals collector::report() const NOEXCEPT
{
    return
    {
        chaser_dispatch_.reads(),
        chaser_dispatch_.discards(),
        chaser_peers_.transitions(),
        chaser_peers_.mismatches(),
        chaser_peers_.tracked(),
        chaser_blocks_.samples(),
        chaser_blocks_.incomplete(),
        chaser_blocks_.swept(),
        chaser_blocks_.failures(),
        chaser_blocks_.open()
    };
}

// Properties.
// ----------------------------------------------------------------------------

const configuration& collector::config() const NOEXCEPT
{
    return config_;
}

const genesis& collector::chain() const NOEXCEPT
{
    return chain_;
}

event_source& collector::events() NOEXCEPT
{
    return events_;
}

connection_source& collector::connections() NOEXCEPT
{
    return connections_;
}

sample_sink& collector::samples() NOEXCEPT
{
    return samples_;
}

asio::io_context& collector::service() NOEXCEPT
{
    return threadpool_.service();
}

bool collector::closed() const NOEXCEPT
{
    return closed_.load();
}

// protected
// ----------------------------------------------------------------------------

asio::strand& collector::strand() NOEXCEPT
{
    return strand_;
}

bool collector::stranded() const NOEXCEPT
{
    return strand_.running_in_this_thread();
}

BC_POP_WARNING()

} // namespace blockperf
