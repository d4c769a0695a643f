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
#ifndef BLOCKPERF_SOURCES_FILE_SOURCE_HPP
#define BLOCKPERF_SOURCES_FILE_SOURCE_HPP

#include <filesystem>
#include <istream>
#include <blockperf/define.hpp>
#include <blockperf/interfaces/event_source.hpp>

namespace blockperf {

/// Json lines trace reader over a file, standard input or a stream.
/// A followed file is tailed from its end as found at the first open (unless
/// from_start), partial lines are held until completed, and the file is
/// reopened from its start when truncated or replaced.
class BP_API file_source
  : public event_source
{
public:
    /// Standard input is read when path is "-" (never followed).
    file_source(const std::filesystem::path& path, bool follow,
        bool from_start=false) NOEXCEPT;

    /// Read from a caller-owned stream, polled at eof when following.
    file_source(std::istream& stream, bool follow) NOEXCEPT;

    code read(trace_event& out) NOEXCEPT override;

    /// Bytes consumed from the current file.
    uint64_t position() const NOEXCEPT;

protected:
    /// Open (or reopen) the path, false if it cannot be read.
    virtual bool open() NOEXCEPT;

    /// The followed file is now shorter than what has been consumed.
    virtual bool truncated() const NOEXCEPT;

private:
    bool is_file() const NOEXCEPT;

    // These are const.
    const std::filesystem::path path_;
    const bool follow_;

    // These are not thread safe.
    bool tail_;
    std::unique_ptr<std::istream> file_{};
    std::istream* stream_{};
    std::string partial_{};
    uint64_t position_{};
};

} // namespace blockperf

#endif
