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
#ifndef BLOCKPERF_CHASERS_CHASER_BLOCKS_HPP
#define BLOCKPERF_CHASERS_CHASER_BLOCKS_HPP

#include <atomic>
#include <blockperf/blocks/block_correlator.hpp>
#include <blockperf/chasers/chaser.hpp>
#include <blockperf/define.hpp>

namespace blockperf {

class collector;

/// Own the in-flight block records, emit samples to the sink.
/// Samples are submitted on an independent sink strand so that a slow sink
/// does not delay correlation.
class BP_API chaser_blocks
  : public chaser
{
public:
    DELETE_COPY_MOVE_DESTRUCT(chaser_blocks);

    chaser_blocks(collector& collector) NOEXCEPT;

    code start() NOEXCEPT override;
    void stopping(const code& ec) NOEXCEPT override;

    /// Organizers (thread safe).
    /// -----------------------------------------------------------------------

    virtual void header_seen(const header_event& event,
        const instant& at) NOEXCEPT;
    virtual void fetch_requested(const fetch_event& event,
        const instant& at) NOEXCEPT;
    virtual void downloaded(const download_event& event,
        const instant& at) NOEXCEPT;
    virtual void adopted(const adopt_event& event,
        const instant& at) NOEXCEPT;

    /// Totals (thread safe).
    /// -----------------------------------------------------------------------

    size_t samples() const NOEXCEPT;
    size_t incomplete() const NOEXCEPT;
    size_t swept() const NOEXCEPT;
    size_t failures() const NOEXCEPT;
    size_t open() const NOEXCEPT;

protected:
    virtual void do_header_seen(const header_event& event,
        const instant& at) NOEXCEPT;
    virtual void do_fetch_requested(const fetch_event& event,
        const instant& at) NOEXCEPT;
    virtual void do_downloaded(const download_event& event,
        const instant& at) NOEXCEPT;
    virtual void do_adopted(const adopt_event& event,
        const instant& at) NOEXCEPT;
    virtual void do_sweep() NOEXCEPT;
    virtual void do_submit(const block_sample& sample) NOEXCEPT;
    virtual void do_stopping(const code& ec) NOEXCEPT;

private:
    void handle_timer(const code& ec) NOEXCEPT;
    void advance(const instant& at) NOEXCEPT;
    void emit(const block_sample& sample) NOEXCEPT;

    // These are protected by strand.
    block_correlator correlator_;
    network::deadline::ptr sweep_timer_{};
    instant latest_{};

    // This is protected by sink strand.
    network::asio::strand sink_strand_;

    // These are thread safe.
    std::atomic<size_t> samples_{};
    std::atomic<size_t> incomplete_{};
    std::atomic<size_t> swept_{};
    std::atomic<size_t> failures_{};
    std::atomic<size_t> open_{};
};

} // namespace blockperf

#endif
