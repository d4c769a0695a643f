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
#include <blockperf/blocks/block_correlator.hpp>

#include <algorithm>
#include <blockperf/define.hpp>

namespace blockperf {

using namespace bc::system;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

block_correlator::block_correlator(const genesis& chain,
    const sample_metadata& metadata, size_t finalized_capacity,
    const span& stale) NOEXCEPT
  : chain_(chain),
    metadata_(metadata),
    stale_(stale),
    records_{},
    finalized_{},
    finalized_order_(std::max(finalized_capacity, one))
{
}

// Milestones.
// ----------------------------------------------------------------------------

bool block_correlator::header_seen(const header_event& event,
    const instant& at) NOEXCEPT
{
    const auto record = open(event.hash, at);
    if (is_null(record) || record->header.has_value())
        return false;

    record->header = block_record::sighting{ at, event.remote };
    record->block_no = event.block_no;
    record->slot_no = event.slot_no;
    if (is_zero(record->size))
        record->size = event.size;

    return true;
}

bool block_correlator::fetch_requested(const fetch_event& event,
    const instant& at) NOEXCEPT
{
    const auto it = records_.find(event.hash);
    if (it == records_.end() || it->second.requested.has_value())
        return false;

    it->second.requested = at;
    return true;
}

bool block_correlator::downloaded(const download_event& event,
    const instant& at) NOEXCEPT
{
    const auto record = open(event.hash, at);
    if (is_null(record) || record->downloaded.has_value())
        return false;

    record->downloaded = block_record::sighting{ at, event.remote };
    if (is_zero(record->size))
        record->size = event.size;

    return true;
}

code block_correlator::adopted(block_sample& out, const std::string& hash,
    const instant& at) NOEXCEPT
{
    const auto done = finalized_.contains(hash);
    const auto it = records_.find(hash);

    if (it == records_.end())
    {
        // Repeated adoption of a finalized block.
        if (done)
            return error::unknown_block;

        // Adopted without any prior milestone (locally forged).
        retire(hash);
        return error::incomplete_block;
    }

    // Open records are never created for finalized hashes.
    if (done)
    {
        records_.erase(it);
        return error::duplicate_sample;
    }

    auto& record = it->second;
    record.adopted = at;

    if (!record.is_complete())
    {
        records_.erase(it);
        retire(hash);
        return error::incomplete_block;
    }

    out = finalize(record);
    records_.erase(it);
    retire(hash);
    return error::success;
}

size_t block_correlator::sweep(const instant& now) NOEXCEPT
{
    const auto cutoff = now - stale_;
    return std::erase_if(records_, [&](const auto& item) NOEXCEPT
    {
        return item.second.created < cutoff;
    });
}

// Properties.
// ----------------------------------------------------------------------------

const block_record* block_correlator::find(
    const std::string& hash) const NOEXCEPT
{
    const auto it = records_.find(hash);
    return it == records_.end() ? nullptr : &it->second;
}

bool block_correlator::is_finalized(const std::string& hash) const NOEXCEPT
{
    return finalized_.contains(hash);
}

size_t block_correlator::size() const NOEXCEPT
{
    return records_.size();
}

// protected
// ----------------------------------------------------------------------------

// Deltas are not clamped, negative values indicate skew or reordering.
block_sample block_correlator::finalize(
    const block_record& record) const NOEXCEPT
{
    block_sample sample{};
    sample.magic = metadata_.magic;
    sample.bp_version = metadata_.version;
    sample.block_local = metadata_.local;
    sample.block_no = record.block_no;
    sample.slot_no = record.slot_no;
    sample.block_hash = record.hash;
    sample.block_size = record.size;
    sample.header_remote = record.header->remote;
    sample.block_remote = record.downloaded->remote;

    const auto slot = chain_.slot_time(record.slot_no);
    sample.header_delta = record.header->at - slot;
    sample.request_delta = record.requested.value() - record.header->at;
    sample.response_delta = record.downloaded->at - record.requested.value();
    sample.adopt_delta = record.adopted.value() - record.downloaded->at;
    sample.block_g = sample.request_delta + sample.response_delta +
        sample.adopt_delta;

    return sample;
}

// private
// ----------------------------------------------------------------------------

block_record* block_correlator::open(const std::string& hash,
    const instant& at) NOEXCEPT
{
    if (finalized_.contains(hash))
        return nullptr;

    const auto [it, inserted] = records_.try_emplace(hash);
    if (inserted)
    {
        it->second.hash = hash;
        it->second.created = at;
    }

    return &it->second;
}

void block_correlator::retire(const std::string& hash) NOEXCEPT
{
    // The oldest hash is overwritten when full.
    if (finalized_order_.full())
        finalized_.erase(finalized_order_.front());

    finalized_order_.push_back(hash);
    finalized_.insert(hash);
}

BC_POP_WARNING()

} // namespace blockperf
