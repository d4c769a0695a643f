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
#ifndef BLOCKPERF_CHASERS_CHASER_HPP
#define BLOCKPERF_CHASERS_CHASER_HPP

#include <blockperf/configuration.hpp>
#include <blockperf/define.hpp>
#include <blockperf/interfaces/interfaces.hpp>
#include <blockperf/utility/genesis.hpp>

namespace blockperf {

class collector;

/// Abstract base chaser for thread safe derived state management classes.
/// Each chaser owns one structure and mutates it only on its own strand,
/// implemented here, on the collector threadpool. Work is posted to the
/// strand in the order received, so a single producer's order is retained.
class BP_API chaser
  : public network::reporter
{
public:
    DELETE_COPY_MOVE_DESTRUCT(chaser);

    /// Should be called from collector strand.
    virtual code start() NOEXCEPT = 0;

    /// Override to capture non-blocking stopping.
    virtual void stopping(const code& ec) NOEXCEPT;

    /// Override to capture blocking stop.
    virtual void stop() NOEXCEPT;

protected:
    /// Abstract base class protected construct.
    chaser(collector& collector) NOEXCEPT;

    /// Binders.
    /// -----------------------------------------------------------------------

    /// Bind a method (use BIND).
    template <class Derived, typename Method, typename... Args>
    auto bind(Method&& method, Args&&... args) NOEXCEPT
    {
        return BIND_THIS(method, args);
    }

    /// Post a method to chaser strand (use POST).
    template <class Derived, typename Method, typename... Args>
    auto post(Method&& method, Args&&... args) NOEXCEPT
    {
        return boost::asio::post(strand(), BIND_THIS(method, args));
    }

    /// Methods.
    /// -----------------------------------------------------------------------

    /// Collector threadpool is stopped and may still be joining.
    virtual bool closed() const NOEXCEPT;

    /// Strand.
    /// -----------------------------------------------------------------------

    /// The chaser's strand (on the collector threadpool).
    virtual network::asio::strand& strand() NOEXCEPT;

    /// True if the current thread is on the chaser strand.
    virtual bool stranded() const NOEXCEPT;

    /// Properties.
    /// -----------------------------------------------------------------------

    /// Collector configuration settings.
    const configuration& config() const NOEXCEPT;

    /// Network parameters of the monitored chain.
    const genesis& chain() const NOEXCEPT;

    /// The owning collector (thread safe).
    collector& owner() const NOEXCEPT;

private:
    // These are thread safe.
    collector& collector_;
    network::asio::strand strand_;
};

} // namespace blockperf

#endif
