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
#include "executor.hpp"
#include "localize.hpp"

#include <atomic>
#include <csignal>
#include <functional>
#include <future>
#include <iostream>
#include <mutex>
#include <boost/format.hpp>
#include <bitcoin/database.hpp>
#include <blockperf.hpp>

namespace blockperf {

using boost::format;
using system::config::printer;
using namespace system;
using namespace std::chrono;
using namespace std::placeholders;

namespace database = libbitcoin::database;
namespace levels = network::levels;

// for --help only
const std::string executor::name_{ "blockperf" };

const std::unordered_map<uint8_t, std::string> executor::fired_
{
    { events::event_discarded,  "event_discarded....." },

    { events::peer_transition,  "peer_transition....." },
    { events::peer_mismatch,    "peer_mismatch......." },
    { events::peers_added,      "peers_added........." },
    { events::peers_removed,    "peers_removed......." },
    { events::peers_cleared,    "peers_cleared......." },
    { events::snapshot_failed,  "snapshot_failed....." },

    { events::sample_emitted,   "sample_emitted......" },
    { events::sample_failed,    "sample_failed......." },
    { events::record_discarded, "record_discarded...." },
    { events::record_swept,     "record_swept........" },

    { events::reconcile_msecs,  "reconcile_msecs....." },
    { events::sweep_msecs,      "sweep_msecs........." }
};

// non-const member static (global for blocking interrupt handling).
std::promise<code> executor::stopping_{};

executor::executor(parser& metadata, std::ostream& output,
    std::ostream& error)
  : metadata_(metadata),
    output_(output),
    console_(metadata.configured.monitor.samples == "-" ? error : output),
    toggle_
    {
        metadata.configured.log.application,
        metadata.configured.log.news,
        metadata.configured.log.session,
        metadata.configured.log.protocol,
        metadata.configured.log.proxy,
        metadata.configured.log.remote,
        metadata.configured.log.fault,
        metadata.configured.log.quitting,
        metadata.configured.log.objects,
        metadata.configured.log.verbose
    }
{
    // Capture <ctrl-c>.
    initialize_stop();
}

// Utility.
// ----------------------------------------------------------------------------

void executor::logger(const auto& message) const
{
    if (log_.stopped())
        console_ << message << std::endl;
    else
        log_.write(levels::application) << message << std::endl;
};

void executor::stopper(const auto& message)
{
    log_.stop(message, levels::application);
    stopped_.get_future().wait();
}

// Dumps.
// ----------------------------------------------------------------------------

// logging compilation and initial values.
void executor::dump_options() const
{
    logger(BP_COLLECTOR_INTERRUPT);
    logger(BP_LOG_TABLE_HEADER);
    logger(format("[a]pplication.. " BP_LOG_TABLE) % levels::application_defined % toggle_.at(levels::application));
    logger(format("[n]ews......... " BP_LOG_TABLE) % levels::news_defined % toggle_.at(levels::news));
    logger(format("[s]ession...... " BP_LOG_TABLE) % levels::session_defined % toggle_.at(levels::session));
    logger(format("[p]rotocol..... " BP_LOG_TABLE) % levels::protocol_defined % toggle_.at(levels::protocol));
    logger(format("[x]proxy....... " BP_LOG_TABLE) % levels::proxy_defined % toggle_.at(levels::proxy));
    logger(format("[r]emote....... " BP_LOG_TABLE) % levels::remote_defined % toggle_.at(levels::remote));
    logger(format("[f]ault........ " BP_LOG_TABLE) % levels::fault_defined % toggle_.at(levels::fault));
    logger(format("[q]uitting..... " BP_LOG_TABLE) % levels::quitting_defined % toggle_.at(levels::quitting));
    logger(format("[o]bjects...... " BP_LOG_TABLE) % levels::objects_defined % toggle_.at(levels::objects));
    logger(format("[v]erbose...... " BP_LOG_TABLE) % levels::verbose_defined % toggle_.at(levels::verbose));
}

// emit version information for blockperf and libbitcoin libraries
void executor::dump_version() const
{
    logger(format(BP_VERSION_MESSAGE)
        % BLOCKPERF_VERSION
        % LIBBITCOIN_DATABASE_VERSION
        % LIBBITCOIN_NETWORK_VERSION
        % LIBBITCOIN_SYSTEM_VERSION);
}

void executor::dump_totals() const
{
    const auto totals = collector_->report();
    logger(format(BP_COLLECTOR_TOTALS) %
        totals.reads %
        totals.discards %
        totals.transitions %
        totals.mismatches %
        totals.peers %
        totals.samples %
        totals.incomplete %
        totals.swept %
        totals.failures %
        totals.open);
}

// Command line options.
// ----------------------------------------------------------------------------

// --[h]elp
bool executor::do_help()
{
    log_.stop();
    printer help(metadata_.load_options(), name_, BP_INFORMATION_MESSAGE);
    help.initialize();
    help.commandline(output_);
    return true;
}

// --[s]ettings
bool executor::do_settings()
{
    log_.stop();
    printer print(metadata_.load_settings(), name_, BP_SETTINGS_MESSAGE);
    print.initialize();
    print.settings(output_);
    return true;
}

// --[v]ersion
bool executor::do_version()
{
    log_.stop();
    dump_version();
    return true;
}

// Run.
// ----------------------------------------------------------------------------

executor::rotator_t executor::create_log_sink() const
{
    return
    {
        // Standard file names, within the [log].path directory.
        metadata_.configured.log.log_file1(),
        metadata_.configured.log.log_file2(),
        to_half(metadata_.configured.log.maximum_size)
    };
}

system::ofstream executor::create_event_sink() const
{
    // Standard file name, within the [log].path directory.
    return { metadata_.configured.log.events_file() };
}

void executor::subscribe_log(std::ostream& sink)
{
    log_.subscribe_messages([&](const code& ec, uint8_t level, time_t time,
        const std::string& message)
    {
        if (level >= toggle_.size())
        {
            sink     << "Invalid log [" << serialize(level) << "] : " << message;
            console_ << "Invalid log [" << serialize(level) << "] : " << message;
            console_.flush();
            return true;
        }

        // Write only selected logs.
        if (!ec && !toggle_.at(level))
            return true;

        const auto prefix = format_zulu_time(time) + "." +
            serialize(level) + " ";

        if (ec)
        {
            sink << prefix << message << std::endl;
            console_ << prefix << message << std::endl;
            sink << prefix << BP_COLLECTOR_FOOTER << std::endl;
            console_ << prefix << BP_COLLECTOR_FOOTER << std::endl;
            stopped_.set_value(ec);
            return false;
        }
        else
        {
            sink << prefix << message;
            console_ << prefix << message;
            console_.flush();
            return true;
        }
    });
}

void executor::subscribe_events(std::ostream& sink)
{
    log_.subscribe_events([&sink, start = network::logger::now()](
        const code& ec, uint8_t event_, uint64_t value,
        const network::logger::time& point)
    {
        if (ec) return false;
        const auto time = duration_cast<seconds>(point - start).count();
        sink << fired_.at(event_) << " " << value << " " << time << std::endl;
        return true;
    });
}

// ----------------------------------------------------------------------------

bool executor::do_run()
{
    const auto& config = metadata_.configured;
    if (!config.log.path.empty())
        database::file::create_directory(config.log.path);

    // Hold sinks in scope for the length of the run.
    auto log = create_log_sink();
    auto events = create_event_sink();
    if (!log || !events)
    {
        logger(BP_LOG_INITIALIZE_FAILURE);
        return false;
    }

    subscribe_log(log);
    subscribe_events(events);
    logger(BP_LOG_HEADER);
    dump_version();
    dump_options();

    const auto chain = config.node.genesis_();
    if (!chain)
    {
        logger(format(BP_UNKNOWN_NETWORK) % config.node.network);
        stopper(BP_COLLECTOR_STOPPED);
        return false;
    }

    logger(format(BP_NETWORK_PARAMETERS) % config.node.network %
        chain->magic() %
        duration_cast<milliseconds>(chain->slot_length()).count());

    // Samples are appended to the file, or written to output when "-".
    std::unique_ptr<system::ofstream> file{};
    if (config.monitor.samples != "-")
    {
        file = std::make_unique<system::ofstream>(config.monitor.samples,
            std::ios_base::app);

        if (!file->good())
        {
            logger(format(BP_SAMPLES_INITIALIZE_FAILURE) %
                config.monitor.samples);
            stopper(BP_COLLECTOR_STOPPED);
            return false;
        }
    }

    logger(format(BP_TRACE_SOURCE) % config.trace.path % config.trace.follow);
    logger(format(BP_SAMPLES_SINK) % config.monitor.samples);

    // Hold collaborators in scope for the life of the collector.
    file_source source{ config.trace.path, config.trace.follow,
        config.trace.from_start };
    proc_connections connections{ config.node.port, config.node.pid };
    json_sink sink{ file ? *file : output_ };

    // Create collector.
    collector_ = std::make_unique<collector>(source, connections, sink,
        chain.value(), config, log_);

    // Start collector.
    logger(BP_COLLECTOR_STARTING);
    collector_->start(std::bind(&executor::handle_started, this, _1));

    // Wait on signal to stop collector (<ctrl-c> or source completion).
    stopping_.get_future().wait();
    logger(BP_COLLECTOR_STOPPING);

    // Stop collector (if not already stopped by self), drains the sink.
    collector_->close();
    dump_totals();
    collector_.reset();

    stopper(BP_COLLECTOR_STOPPED);
    return true;
}

// ----------------------------------------------------------------------------

void executor::handle_started(const code& ec)
{
    if (ec)
    {
        logger(format(BP_COLLECTOR_START_FAIL) % ec.message());
        stop(ec);
        return;
    }

    logger(BP_COLLECTOR_STARTED);
    collector_->subscribe_close(
        std::bind(&executor::handle_stopped, this, _1));
    collector_->run(std::bind(&executor::handle_running, this, _1));
}

void executor::handle_running(const code& ec)
{
    if (ec)
    {
        logger(format(BP_COLLECTOR_START_FAIL) % ec.message());
        stop(ec);
        return;
    }

    logger(BP_COLLECTOR_RUNNING);
}

void executor::handle_stopped(const code& ec)
{
    if (ec == error::source_exhausted || ec == error::source_unavailable)
        logger(format(BP_SOURCE_COMPLETE) % ec.message());
    else if (ec && ec != network::error::service_stopped)
        logger(format(BP_COLLECTOR_STOP_CODE) % ec.message());

    // Signal stop (simulates <ctrl-c>).
    stop(ec);
}

// Stop signal.
// ----------------------------------------------------------------------------

void executor::initialize_stop() NOEXCEPT
{
    std::signal(SIGINT, handle_stop);
    std::signal(SIGTERM, handle_stop);
}

void executor::handle_stop(int)
{
    initialize_stop();
    stop(error::success);
}

// Manage the race between console stop and collector stop.
void executor::stop(const code& ec)
{
    static std::once_flag stop_mutex;
    std::call_once(stop_mutex, [&]()
    {
        stopping_.set_value(ec);
    });
}

// Menu selection.
// ----------------------------------------------------------------------------

bool executor::menu()
{
    const auto& config = metadata_.configured;

    if (config.help)
        return do_help();

    if (config.settings)
        return do_settings();

    if (config.version)
        return do_version();

    return do_run();
}

} // namespace blockperf
