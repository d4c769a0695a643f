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
#ifndef BLOCKPERF_INTERFACES_SAMPLE_SINK_HPP
#define BLOCKPERF_INTERFACES_SAMPLE_SINK_HPP

#include <blockperf/blocks/block_sample.hpp>
#include <blockperf/define.hpp>

namespace blockperf {

/// Destination of finalized block samples (fire and forget).
/// Called only from the sink strand.
class BP_API sample_sink
{
public:
    virtual ~sample_sink() NOEXCEPT = default;

    /// Deliver one sample, error::sink_unavailable on failure (not retried).
    virtual code submit(const block_sample& sample) NOEXCEPT = 0;
};

} // namespace blockperf

#endif
