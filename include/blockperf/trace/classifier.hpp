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
#ifndef BLOCKPERF_TRACE_CLASSIFIER_HPP
#define BLOCKPERF_TRACE_CLASSIFIER_HPP

#include <string_view>
#include <blockperf/define.hpp>
#include <blockperf/trace/payloads.hpp>
#include <blockperf/trace/trace_event.hpp>

namespace blockperf {

/// Stateless mapping of trace records to typed payloads.
class BP_API classifier
{
public:
    /// Classify the record, returns the reason if ignored.
    /// The out value holds monostate and kind ignored on failure.
    static code classify(classified& out, const trace_event& event) NOEXCEPT;

    /// Kind of the namespace, ignored if not in the namespace table.
    static event_kind kind(std::string_view ns) NOEXCEPT;

    /// Short name of the kind (for logging).
    static std::string_view name(event_kind kind) NOEXCEPT;

protected:
    static code decode_counters(payload& out,
        const boost::json::object& data) NOEXCEPT;
    static code decode_governor(payload& out, event_kind kind,
        const boost::json::object& data) NOEXCEPT;
    static code decode_status(payload& out,
        const boost::json::object& data) NOEXCEPT;
    static code decode_header(payload& out,
        const boost::json::object& data) NOEXCEPT;
    static code decode_fetch(payload& out,
        const boost::json::object& data) NOEXCEPT;
    static code decode_download(payload& out,
        const boost::json::object& data) NOEXCEPT;
    static code decode_adopt(payload& out,
        const boost::json::object& data) NOEXCEPT;
};

} // namespace blockperf

#endif
