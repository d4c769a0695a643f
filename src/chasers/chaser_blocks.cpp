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
#include <blockperf/chasers/chaser_blocks.hpp>

#include <chrono>
#include <blockperf/chasers/chaser.hpp>
#include <blockperf/collector.hpp>
#include <blockperf/define.hpp>
#include <blockperf/utility/timestamp.hpp>

namespace blockperf {

#define CLASS chaser_blocks

using namespace bc::system;
using namespace network;
using namespace std::chrono;
using namespace std::placeholders;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

static sample_metadata to_metadata(const configuration& config,
    const genesis& chain) NOEXCEPT
{
    return
    {
        chain.magic(),
        config.monitor.bp_version,
        endpoint{ config.monitor.local_address, config.node.port }
    };
}

chaser_blocks::chaser_blocks(collector& collector) NOEXCEPT
  : chaser(collector),
    correlator_(collector.chain(),
        to_metadata(collector.config(), collector.chain()),
        collector.config().monitor.finalized_capacity_(),
        collector.config().monitor.stale()),
    sink_strand_(collector.service().get_executor())
{
}

// start/stop
// ----------------------------------------------------------------------------

code chaser_blocks::start() NOEXCEPT
{
    // Construct is too early to create the unstarted timer.
    sweep_timer_ = std::make_shared<deadline>(log, strand(),
        config().monitor.sweep_interval());

    sweep_timer_->start(BIND(handle_timer, _1));
    return error::success;
}

void chaser_blocks::stopping(const code& ec) NOEXCEPT
{
    POST(do_stopping, ec);
}

// protected
void chaser_blocks::do_stopping(const code&) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (!sweep_timer_)
        return;

    sweep_timer_->stop();
    sweep_timer_.reset();
}

// Organizers.
// ----------------------------------------------------------------------------

void chaser_blocks::header_seen(const header_event& event,
    const instant& at) NOEXCEPT
{
    POST(do_header_seen, event, at);
}

void chaser_blocks::fetch_requested(const fetch_event& event,
    const instant& at) NOEXCEPT
{
    POST(do_fetch_requested, event, at);
}

void chaser_blocks::downloaded(const download_event& event,
    const instant& at) NOEXCEPT
{
    POST(do_downloaded, event, at);
}

void chaser_blocks::adopted(const adopt_event& event,
    const instant& at) NOEXCEPT
{
    POST(do_adopted, event, at);
}

// protected
void chaser_blocks::do_header_seen(const header_event& event,
    const instant& at) NOEXCEPT
{
    BC_ASSERT(stranded());
    advance(at);

    if (correlator_.header_seen(event, at))
    {
        LOGV("Header [" << event.block_no << "] " << event.hash << " from ["
            << event.remote.to_string() << "].");
    }

    open_ = correlator_.size();
}

void chaser_blocks::do_fetch_requested(const fetch_event& event,
    const instant& at) NOEXCEPT
{
    BC_ASSERT(stranded());
    advance(at);

    if (correlator_.fetch_requested(event, at))
    {
        LOGV("Block " << event.hash << " requested from ["
            << event.remote.to_string() << "].");
    }
}

void chaser_blocks::do_downloaded(const download_event& event,
    const instant& at) NOEXCEPT
{
    BC_ASSERT(stranded());
    advance(at);

    if (correlator_.downloaded(event, at))
    {
        LOGV("Block " << event.hash << " downloaded from ["
            << event.remote.to_string() << "].");
    }

    open_ = correlator_.size();
}

void chaser_blocks::do_adopted(const adopt_event& event,
    const instant& at) NOEXCEPT
{
    BC_ASSERT(stranded());
    advance(at);

    // Headers are adopted in listed order (fork switch lists several).
    for (const auto& header: event.headers)
    {
        block_sample sample{};
        const auto ec = correlator_.adopted(sample, header.hash, at);

        if (ec == error::incomplete_block)
        {
            ++incomplete_;
            fire(events::record_discarded, header.block_no);
            LOGV("Block [" << header.block_no << "] " << header.hash
                << " adopted without complete milestones.");
        }
        else if (ec == error::duplicate_sample)
        {
            LOGF("Block [" << header.block_no << "] " << header.hash
                << " already sampled, suppressed.");
        }
        else if (!ec)
        {
            emit(sample);
        }
    }

    open_ = correlator_.size();
}

// sweep
// ----------------------------------------------------------------------------

void chaser_blocks::handle_timer(const code& ec) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (closed() || !sweep_timer_ || ec == network::error::operation_canceled)
        return;

    if (ec && ec != network::error::operation_timeout)
    {
        LOGF("Blocks chaser timer fault, " << ec.message());
        return;
    }

    do_sweep();
    sweep_timer_->start(BIND(handle_timer, _1));
}

// protected
// Staleness is measured in trace time, so replayed logs sweep consistently.
void chaser_blocks::do_sweep() NOEXCEPT
{
    BC_ASSERT(stranded());

    const auto start = logger::now();
    const auto count = correlator_.sweep(latest_);
    open_ = correlator_.size();
    span<milliseconds>(events::sweep_msecs, start);

    if (is_zero(count))
        return;

    swept_ += count;
    fire(events::record_swept, count);
    LOGV("Swept [" << count << "] stale block records.");
}

// sink
// ----------------------------------------------------------------------------

// private
void chaser_blocks::emit(const block_sample& sample) NOEXCEPT
{
    BC_ASSERT(stranded());

    ++samples_;
    fire(events::sample_emitted, sample.block_no);

    if (sample.is_skewed())
    {
        LOGV("Block [" << sample.block_no << "] " << sample.block_hash
            << " has negative delta (header "
            << format_seconds(sample.header_delta) << ", request "
            << format_seconds(sample.request_delta) << ", response "
            << format_seconds(sample.response_delta) << ", adopt "
            << format_seconds(sample.adopt_delta) << ").");
    }

    LOGN("Block [" << sample.block_no << "] sampled, blockG "
        << format_seconds(sample.block_g) << "s from ["
        << sample.block_remote.to_string() << "].");

    boost::asio::post(sink_strand_, BIND(do_submit, sample));
}

// protected
void chaser_blocks::do_submit(const block_sample& sample) NOEXCEPT
{
    BC_ASSERT(sink_strand_.running_in_this_thread());

    // Not retried.
    if (const auto ec = owner().samples().submit(sample))
    {
        ++failures_;
        fire(events::sample_failed, sample.block_no);
        LOGF("Block [" << sample.block_no << "] sample not delivered, "
            << ec.message());
    }
}

// private
void chaser_blocks::advance(const instant& at) NOEXCEPT
{
    latest_ = std::max(latest_, at);
}

// Totals.
// ----------------------------------------------------------------------------

size_t chaser_blocks::samples() const NOEXCEPT
{
    return samples_.load();
}

size_t chaser_blocks::incomplete() const NOEXCEPT
{
    return incomplete_.load();
}

size_t chaser_blocks::swept() const NOEXCEPT
{
    return swept_.load();
}

size_t chaser_blocks::failures() const NOEXCEPT
{
    return failures_.load();
}

size_t chaser_blocks::open() const NOEXCEPT
{
    return open_.load();
}

BC_POP_WARNING()

} // namespace blockperf
