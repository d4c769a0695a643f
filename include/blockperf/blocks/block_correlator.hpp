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
#ifndef BLOCKPERF_BLOCKS_BLOCK_CORRELATOR_HPP
#define BLOCKPERF_BLOCKS_BLOCK_CORRELATOR_HPP

#include <unordered_map>
#include <unordered_set>
#include <blockperf/blocks/block_record.hpp>
#include <blockperf/blocks/block_sample.hpp>
#include <blockperf/define.hpp>
#include <blockperf/trace/payloads.hpp>
#include <blockperf/utility/genesis.hpp>

namespace blockperf {

/// Correlates block milestones into samples, at most one per block hash.
/// Not thread safe, owned by chaser_blocks (strand).
class BP_API block_correlator
{
public:
    DELETE_COPY_MOVE_DESTRUCT(block_correlator);

    /// Finalized hashes are retained up to capacity (oldest evicted).
    block_correlator(const genesis& chain, const sample_metadata& metadata,
        size_t finalized_capacity, const span& stale) NOEXCEPT;

    /// Milestones.
    /// -----------------------------------------------------------------------
    /// All return false if the milestone is already set (no-op).

    /// Create record if absent, set header milestone.
    virtual bool header_seen(const header_event& event,
        const instant& at) NOEXCEPT;

    /// Set request milestone if the record exists.
    virtual bool fetch_requested(const fetch_event& event,
        const instant& at) NOEXCEPT;

    /// Create record if absent, set download milestone.
    virtual bool downloaded(const download_event& event,
        const instant& at) NOEXCEPT;

    /// Set adoption milestone and finalize the record.
    /// success: out is populated and the record is removed.
    /// incomplete_block: record absent or lacking milestones, hash retired.
    /// unknown_block: hash already finalized (no-op).
    /// duplicate_sample: open record for a finalized hash (invariant).
    virtual code adopted(block_sample& out, const std::string& hash,
        const instant& at) NOEXCEPT;

    /// Remove open records created before now less the stale period.
    /// Returns the number of records removed (none are sampled).
    virtual size_t sweep(const instant& now) NOEXCEPT;

    /// Properties.
    /// -----------------------------------------------------------------------

    virtual const block_record* find(const std::string& hash) const NOEXCEPT;
    virtual bool is_finalized(const std::string& hash) const NOEXCEPT;
    virtual size_t size() const NOEXCEPT;

protected:
    /// Compute deltas of a complete record.
    virtual block_sample finalize(const block_record& record) const NOEXCEPT;

private:
    block_record* open(const std::string& hash, const instant& at) NOEXCEPT;
    void retire(const std::string& hash) NOEXCEPT;

    // These are const.
    const genesis chain_;
    const sample_metadata metadata_;
    const span stale_;

    // These are not thread safe.
    std::unordered_map<std::string, block_record> records_;
    std::unordered_set<std::string> finalized_;
    boost::circular_buffer<std::string> finalized_order_;
};

} // namespace blockperf

#endif
