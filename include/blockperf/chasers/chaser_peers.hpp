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
#ifndef BLOCKPERF_CHASERS_CHASER_PEERS_HPP
#define BLOCKPERF_CHASERS_CHASER_PEERS_HPP

#include <atomic>
#include <functional>
#include <blockperf/chasers/chaser.hpp>
#include <blockperf/define.hpp>
#include <blockperf/peers/peer_tracker.hpp>

namespace blockperf {

class collector;

/// Own the peer map, apply trace transitions and reconcile against the os.
class BP_API chaser_peers
  : public chaser
{
public:
    typedef std::function<void(const code&, const peer::list&)> peers_handler;

    DELETE_COPY_MOVE_DESTRUCT(chaser_peers);

    chaser_peers(collector& collector) NOEXCEPT;

    code start() NOEXCEPT override;
    void stopping(const code& ec) NOEXCEPT override;

    /// Organizers (thread safe).
    /// -----------------------------------------------------------------------

    virtual void apply(const transition_event& event,
        const instant& at) NOEXCEPT;
    virtual void restart(const instant& at) NOEXCEPT;
    virtual void counters(const counters_event& event) NOEXCEPT;

    /// Handler is invoked on the chaser strand with a copy of the peer set.
    virtual void peers(peers_handler&& handler) NOEXCEPT;

    /// Totals (thread safe).
    /// -----------------------------------------------------------------------

    size_t transitions() const NOEXCEPT;
    size_t mismatches() const NOEXCEPT;
    size_t tracked() const NOEXCEPT;

protected:
    virtual void do_apply(const transition_event& event,
        const instant& at) NOEXCEPT;
    virtual void do_restart(const instant& at) NOEXCEPT;
    virtual void do_counters(const counters_event& event) NOEXCEPT;
    virtual void do_peers(const peers_handler& handler) NOEXCEPT;
    virtual void do_reconcile() NOEXCEPT;
    virtual void do_report() const NOEXCEPT;
    virtual void do_stopping(const code& ec) NOEXCEPT;

private:
    void handle_reconcile(const code& ec) NOEXCEPT;
    void handle_report(const code& ec) NOEXCEPT;

    // These are protected by strand.
    peer_tracker tracker_{};
    network::deadline::ptr reconcile_timer_{};
    network::deadline::ptr report_timer_{};
    instant latest_{};

    // These are thread safe.
    std::atomic<size_t> transitions_{};
    std::atomic<size_t> mismatches_{};
    std::atomic<size_t> tracked_{};
};

} // namespace blockperf

#endif
