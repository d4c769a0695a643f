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
#ifndef BLOCKPERF_COLLECTOR_HPP
#define BLOCKPERF_COLLECTOR_HPP

#include <atomic>
#include <blockperf/chasers/chasers.hpp>
#include <blockperf/configuration.hpp>
#include <blockperf/define.hpp>
#include <blockperf/interfaces/interfaces.hpp>
#include <blockperf/utility/genesis.hpp>

namespace blockperf {

/// Thread safe.
/// Owns the threadpool and the chasers, one per derived structure.
/// Trace records flow from the event source through the dispatch chaser to
/// the peers and blocks chasers, samples flow to the sample sink. The
/// collaborators are referenced and must outlive the collector.
class BP_API collector
  : public network::reporter
{
public:
    typedef std::shared_ptr<collector> ptr;
    typedef chaser_peers::peers_handler peers_handler;

    /// Running totals.
    struct totals
    {
        size_t reads{};
        size_t discards{};
        size_t transitions{};
        size_t mismatches{};
        size_t peers{};
        size_t samples{};
        size_t incomplete{};
        size_t swept{};
        size_t failures{};
        size_t open{};
    };

    DELETE_COPY(collector);

    /// Constructors.
    /// -----------------------------------------------------------------------

    collector(event_source& events, connection_source& connections,
        sample_sink& samples, const genesis& chain,
        const configuration& configuration,
        const network::logger& log) NOEXCEPT;

    virtual ~collector() NOEXCEPT;

    /// Sequences.
    /// -----------------------------------------------------------------------

    /// Start the chasers (timers).
    virtual void start(result_handler&& handler) NOEXCEPT;

    /// Begin reading the event source.
    virtual void run(result_handler&& handler) NOEXCEPT;

    /// Handler is invoked once, when the source completes or on close.
    virtual void subscribe_close(result_handler&& handler) NOEXCEPT;

    /// Close the collector, blocks until threads are joined.
    virtual void close() NOEXCEPT;

    /// Organizers (from dispatch).
    /// -----------------------------------------------------------------------

    virtual void counters(const counters_event& event) NOEXCEPT;
    virtual void restart(const instant& at) NOEXCEPT;
    virtual void transition(const transition_event& event,
        const instant& at) NOEXCEPT;
    virtual void header_seen(const header_event& event,
        const instant& at) NOEXCEPT;
    virtual void fetch_requested(const fetch_event& event,
        const instant& at) NOEXCEPT;
    virtual void downloaded(const download_event& event,
        const instant& at) NOEXCEPT;
    virtual void adopted(const adopt_event& event,
        const instant& at) NOEXCEPT;

    /// The event source will produce no further records.
    virtual void complete(const code& ec) NOEXCEPT;

    /// Queries.
    /// -----------------------------------------------------------------------

    /// Copy of the peer set, handler invoked on the peers strand.
    virtual void peers(peers_handler&& handler) NOEXCEPT;

    /// Current totals of all chasers.
    virtual totals report() const NOEXCEPT;

    /// Properties.
    /// -----------------------------------------------------------------------

    /// Collector configuration settings.
    virtual const configuration& config() const NOEXCEPT;

    /// Network parameters of the monitored chain.
    virtual const genesis& chain() const NOEXCEPT;

    /// Collaborators.
    virtual event_source& events() NOEXCEPT;
    virtual connection_source& connections() NOEXCEPT;
    virtual sample_sink& samples() NOEXCEPT;

    /// The collector threadpool service.
    virtual network::asio::io_context& service() NOEXCEPT;

    /// The collector is closed (threadpool may still be joining).
    virtual bool closed() const NOEXCEPT;

protected:
    /// The collector strand.
    virtual network::asio::strand& strand() NOEXCEPT;
    virtual bool stranded() const NOEXCEPT;

    /// Virtual handlers.
    /// -----------------------------------------------------------------------
    virtual void do_start(const result_handler& handler) NOEXCEPT;
    virtual void do_run(const result_handler& handler) NOEXCEPT;
    virtual void do_subscribe_close(const result_handler& handler) NOEXCEPT;
    virtual void do_complete(const code& ec) NOEXCEPT;
    virtual void do_close() NOEXCEPT;

private:
    typedef network::subscriber<> close_subscriber;

    // These are thread safe.
    const configuration& config_;
    const genesis chain_;
    event_source& events_;
    connection_source& connections_;
    sample_sink& samples_;
    std::atomic_bool closed_{};
    network::threadpool threadpool_;
    network::asio::strand strand_;

    // These are protected by strand.
    close_subscriber close_subscriber_;
    bool running_{};

    // These are thread safe (chaser strands).
    chaser_peers chaser_peers_;
    chaser_blocks chaser_blocks_;
    chaser_dispatch chaser_dispatch_;
};

} // namespace blockperf

#endif
