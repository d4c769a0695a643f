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
#include <blockperf/sources/file_source.hpp>

#include <iostream>
#include <blockperf/define.hpp>
#include <blockperf/trace/decoder.hpp>

namespace blockperf {

using namespace bc::system;

static const std::filesystem::path standard_input{ "-" };

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

file_source::file_source(const std::filesystem::path& path, bool follow,
    bool from_start) NOEXCEPT
  : path_(path),
    follow_(follow && path != standard_input),
    tail_(follow_ && !from_start),
    stream_(path == standard_input ? &std::cin : nullptr)
{
}

file_source::file_source(std::istream& stream, bool follow) NOEXCEPT
  : path_{},
    follow_(follow),
    tail_(false),
    stream_(&stream)
{
}

code file_source::read(trace_event& out) NOEXCEPT
{
    if (is_null(stream_) && !open())
        return follow_ ? error::source_empty : error::source_unavailable;

    std::string line{};
    while (true)
    {
        if (!std::getline(*stream_, line))
        {
            if (stream_->bad())
                return error::source_unavailable;

            // Nothing more to read now, terminal unless following.
            if (!follow_)
                return error::source_exhausted;

            stream_->clear();

            // Reopened on the next read if the path is not yet recreated.
            if (is_file() && truncated() && !open())
                stream_ = nullptr;

            return error::source_empty;
        }

        position_ += line.size();

        // A final line without terminator may still be written to.
        if (stream_->eof())
        {
            if (follow_)
            {
                partial_.append(line);
                stream_->clear();
                return error::source_empty;
            }
        }
        else
        {
            ++position_;
        }

        if (!partial_.empty())
        {
            line = partial_ + line;
            partial_.clear();
        }

        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        if (!line.empty())
            return decode(out, line);
    }
}

uint64_t file_source::position() const NOEXCEPT
{
    return position_;
}

// protected
// ----------------------------------------------------------------------------

// Only the first open of a followed file skips existing content, a file
// created or replaced later is read from its start.
bool file_source::open() NOEXCEPT
{
    const auto tail = tail_;
    tail_ = false;

    partial_.clear();
    position_ = zero;
    stream_ = nullptr;
    file_ = std::make_unique<system::ifstream>(path_, std::ios_base::in);
    if (!file_->good())
    {
        file_.reset();
        return false;
    }

    if (tail)
    {
        file_->seekg(0, std::ios_base::end);
        const auto end = file_->tellg();
        if (!file_->good() || end < 0)
        {
            file_.reset();
            return false;
        }

        position_ = static_cast<uint64_t>(end);
    }

    stream_ = file_.get();
    return true;
}

bool file_source::truncated() const NOEXCEPT
{
    std::error_code ec{};
    const auto size = std::filesystem::file_size(path_, ec);

    // A rotated file is replaced, which is detected once its size is below
    // the position or the path is briefly missing.
    return ec || size < position_;
}

// private
// ----------------------------------------------------------------------------

bool file_source::is_file() const NOEXCEPT
{
    return !path_.empty() && path_ != standard_input;
}

BC_POP_WARNING()

} // namespace blockperf
