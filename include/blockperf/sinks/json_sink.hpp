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
#ifndef BLOCKPERF_SINKS_JSON_SINK_HPP
#define BLOCKPERF_SINKS_JSON_SINK_HPP

#include <ostream>
#include <blockperf/define.hpp>
#include <blockperf/interfaces/sample_sink.hpp>

namespace blockperf {

/// Writes one json object per line, flushed per sample.
class BP_API json_sink
  : public sample_sink
{
public:
    json_sink(std::ostream& stream) NOEXCEPT;

    code submit(const block_sample& sample) NOEXCEPT override;

    /// Serialize a sample as a single line (without terminator).
    static std::string serialize(const block_sample& sample) NOEXCEPT;

private:
    // This is not thread safe.
    std::ostream& stream_;
};

} // namespace blockperf

#endif
