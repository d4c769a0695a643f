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
#include <blockperf/blocks/block_sample.hpp>

#include <blockperf/define.hpp>
#include <blockperf/utility/timestamp.hpp>

namespace blockperf {

bool block_sample::is_skewed() const NOEXCEPT
{
    return header_delta < span::zero() || request_delta < span::zero() ||
        response_delta < span::zero() || adopt_delta < span::zero();
}

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

void tag_invoke(const boost::json::value_from_tag&, boost::json::value& value,
    const block_sample& sample) NOEXCEPT
{
    value =
    {
        { "magic", sample.magic },
        { "bpVersion", sample.bp_version },
        { "blockNo", sample.block_no },
        { "slotNo", sample.slot_no },
        { "blockHash", sample.block_hash },
        { "blockSize", sample.block_size },
        { "headerRemoteAddr", sample.header_remote.address },
        { "headerRemotePort", sample.header_remote.port },
        { "headerDelta", format_seconds(sample.header_delta) },
        { "blockReqDelta", format_seconds(sample.request_delta) },
        { "blockRspDelta", format_seconds(sample.response_delta) },
        { "blockAdoptDelta", format_seconds(sample.adopt_delta) },
        { "blockRemoteAddress", sample.block_remote.address },
        { "blockRemotePort", sample.block_remote.port },
        { "blockLocalAddress", sample.block_local.address },
        { "blockLocalPort", sample.block_local.port },
        { "blockG", format_seconds(sample.block_g) }
    };
}

BC_POP_WARNING()

} // namespace blockperf
