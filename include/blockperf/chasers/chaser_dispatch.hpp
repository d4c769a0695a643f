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
#ifndef BLOCKPERF_CHASERS_CHASER_DISPATCH_HPP
#define BLOCKPERF_CHASERS_CHASER_DISPATCH_HPP

#include <array>
#include <atomic>
#include <blockperf/chasers/chaser.hpp>
#include <blockperf/define.hpp>
#include <blockperf/trace/payloads.hpp>

namespace blockperf {

class collector;

/// Read the event source, classify and route records in arrival order.
/// Reads are made on an independent single thread, as a source may block.
class BP_API chaser_dispatch
  : public chaser
{
public:
    DELETE_COPY_MOVE_DESTRUCT(chaser_dispatch);

    chaser_dispatch(collector& collector) NOEXCEPT;

    code start() NOEXCEPT override;
    void stopping(const code& ec) NOEXCEPT override;
    void stop() NOEXCEPT override;

    /// Begin reading the source (thread safe).
    virtual void read() NOEXCEPT;

    /// Totals (thread safe).
    /// -----------------------------------------------------------------------

    /// Records read from the source, including discards.
    size_t reads() const NOEXCEPT;

    /// Records discarded for the given reason.
    size_t discards(const code& reason) const NOEXCEPT;

    /// Records discarded for any reason.
    size_t discards() const NOEXCEPT;

protected:
    /// Records read before yielding the strand.
    static constexpr size_t batch = 100;

    virtual void do_read(const code& ec) NOEXCEPT;
    virtual void route(const classified& event) NOEXCEPT;
    virtual void discard(const code& reason) NOEXCEPT;
    virtual void do_stopping(const code& ec) NOEXCEPT;

    // Override base class strand because it sits on the collector pool.
    network::asio::strand& strand() NOEXCEPT override;
    bool stranded() const NOEXCEPT override;

private:
    typedef std::array<std::atomic<size_t>,
        system::add1<size_t>(error::sink_unavailable)> counters;

    // This is protected by strand.
    network::threadpool threadpool_;
    network::deadline::ptr poll_timer_{};

    // These are thread safe.
    network::asio::strand independent_strand_;
    std::atomic<size_t> reads_{};
    counters discards_{};
};

} // namespace blockperf

#endif
