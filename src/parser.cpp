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
#include <blockperf/parser.hpp>

#include <iostream>
#include <bitcoin/system.hpp>
#include <bitcoin/network.hpp>
#include <blockperf/configuration.hpp>

std::filesystem::path config_default_path() NOEXCEPT
{
    return { "blockperf/bp.cfg" };
}

namespace blockperf {

using namespace bc::system;
using namespace bc::system::config;
using namespace boost::program_options;

// Initialize configuration by copying the given instance.
parser::parser(const configuration& defaults) NOEXCEPT
  : configured(defaults)
{
}

// Initialize configuration using defaults.
parser::parser() NOEXCEPT
  : configured()
{
}

options_metadata parser::load_options() THROWS
{
    options_metadata description("options");
    description.add_options()
    (
        BP_CONFIG_VARIABLE ",c",
        value<std::filesystem::path>(&configured.file),
        "Specify path to a configuration settings file."
    )
    // Information.
    (
        BP_HELP_VARIABLE ",h",
        value<bool>(&configured.help)->
            default_value(false)->zero_tokens(),
        "Display command line options."
    )
    (
        BP_SETTINGS_VARIABLE ",s",
        value<bool>(&configured.settings)->
            default_value(false)->zero_tokens(),
        "Display all configuration settings."
    )
    (
        BP_VERSION_VARIABLE ",v",
        value<bool>(&configured.version)->
            default_value(false)->zero_tokens(),
        "Display version information."
    );

    return description;
}

arguments_metadata parser::load_arguments() THROWS
{
    arguments_metadata description;
    return description
        .add(BP_CONFIG_VARIABLE, 1);
}

options_metadata parser::load_environment() THROWS
{
    options_metadata description("environment");
    description.add_options()
    (
        // For some reason po requires this to be a lower case name.
        // The case must match the other declarations for it to compose.
        // This composes with the cmdline options and inits to default path.
        BP_CONFIG_VARIABLE,
        value<std::filesystem::path>(&configured.file)->composing()
            ->default_value(config_default_path()),
        "The path to the configuration settings file."
    );

    return description;
}

options_metadata parser::load_settings() THROWS
{
    options_metadata description("settings");
    description.add_options()

    /* [node] */
    (
        "node.network",
        value<std::string>(&configured.node.network),
        "The monitored network (mainnet, preprod, preview, custom), defaults to 'mainnet'."
    )
    (
        "node.magic",
        value<uint32_t>(&configured.node.magic),
        "The network magic of a custom network, defaults to 0."
    )
    (
        "node.genesis_start",
        value<uint64_t>(&configured.node.genesis_start),
        "The unix time of slot zero of a custom network, defaults to 0."
    )
    (
        "node.slot_length_seconds",
        value<uint32_t>(&configured.node.slot_length_seconds),
        "The slot length of a custom network, defaults to 1."
    )
    (
        "node.port",
        value<uint16_t>(&configured.node.port),
        "The node listening port, inbound connections arrive on it, defaults to 3001."
    )
    (
        "node.pid",
        value<uint32_t>(&configured.node.pid),
        "The node process id for socket selection, defaults to 0 (use port)."
    )

    /* [monitor] */
    (
        "monitor.threads",
        value<uint32_t>(&configured.monitor.threads),
        "The number of threads in the collector threadpool, defaults to 2."
    )
    (
        "monitor.reconcile_interval_seconds",
        value<uint32_t>(&configured.monitor.reconcile_interval_seconds),
        "The interval between os connection reconciliations, defaults to 30."
    )
    (
        "monitor.report_interval_seconds",
        value<uint32_t>(&configured.monitor.report_interval_seconds),
        "The interval between peer reports, defaults to 30."
    )
    (
        "monitor.sweep_interval_seconds",
        value<uint32_t>(&configured.monitor.sweep_interval_seconds),
        "The interval between stale block record sweeps, defaults to 60."
    )
    (
        "monitor.stale_seconds",
        value<uint32_t>(&configured.monitor.stale_seconds),
        "The age at which an unadopted block record is dropped, defaults to 600."
    )
    (
        "monitor.finalized_capacity",
        value<uint32_t>(&configured.monitor.finalized_capacity),
        "The number of finalized block hashes retained, defaults to 10000."
    )
    (
        "monitor.bp_version",
        value<std::string>(&configured.monitor.bp_version),
        "The version tag stamped on each sample, defaults to 'v2'."
    )
    (
        "monitor.local_address",
        value<std::string>(&configured.monitor.local_address),
        "The node address stamped on each sample, defaults to '0.0.0.0'."
    )
    (
        "monitor.samples",
        value<std::filesystem::path>(&configured.monitor.samples),
        "The json lines sample file, defaults to '-' (standard output)."
    )

    /* [trace] */
    (
        "trace.path",
        value<std::filesystem::path>(&configured.trace.path),
        "The node json trace log, defaults to '-' (standard input)."
    )
    (
        "trace.follow",
        value<bool>(&configured.trace.follow),
        "Follow the trace log as it grows, defaults to true."
    )
    (
        "trace.from_start",
        value<bool>(&configured.trace.from_start),
        "Read a followed trace log from its start, defaults to false (existing content skipped)."
    )
    (
        "trace.poll_milliseconds",
        value<uint32_t>(&configured.trace.poll_milliseconds),
        "The poll interval at the end of a followed trace log, defaults to 250."
    )

    /* [log] */
#if defined(HAVE_LOGA)
    (
        "log.application",
        value<bool>(&configured.log.application),
        "Enable application logging, defaults to true."
    )
#endif
#if defined(HAVE_LOGN)
    (
        "log.news",
        value<bool>(&configured.log.news),
        "Enable news logging, defaults to true."
    )
#endif
#if defined(HAVE_LOGS)
    (
        "log.session",
        value<bool>(&configured.log.session),
        "Enable session logging, defaults to true."
    )
#endif
#if defined(HAVE_LOGP)
    (
        "log.protocol",
        value<bool>(&configured.log.protocol),
        "Enable protocol logging, defaults to false."
    )
#endif
#if defined(HAVE_LOGX)
    (
        "log.proxy",
        value<bool>(&configured.log.proxy),
        "Enable proxy logging, defaults to false."
    )
#endif
#if defined(HAVE_LOGR)
    (
        "log.remote",
        value<bool>(&configured.log.remote),
        "Enable remote peer logging, defaults to true."
    )
#endif
#if defined(HAVE_LOGF)
    (
        "log.fault",
        value<bool>(&configured.log.fault),
        "Enable local fault logging, defaults to true."
    )
#endif
#if defined(HAVE_LOGQ)
    (
        "log.quitting",
        value<bool>(&configured.log.quitting),
        "Enable quitting logging, defaults to false."
    )
#endif
#if defined(HAVE_LOGO)
    (
        "log.objects",
        value<bool>(&configured.log.objects),
        "Enable objects logging, defaults to false."
    )
#endif
#if defined(HAVE_LOGV)
    (
        "log.verbose",
        value<bool>(&configured.log.verbose),
        "Enable verbose logging, defaults to false."
    )
#endif
    (
        "log.maximum_size",
        value<uint32_t>(&configured.log.maximum_size),
        "The maximum byte size of each pair of rotated log files, defaults to 1000000."
    )
    (
        "log.path",
        value<std::filesystem::path>(&configured.log.path),
        "The log files directory, defaults to empty."
    );

    return description;
}

bool parser::parse(int argc, const char* argv[], std::ostream& error) THROWS
{
    try
    {
        auto file = false;
        variables_map variables;
        load_command_variables(variables, argc, argv);
        load_environment_variables(variables, BP_ENVIRONMENT_VARIABLE_PREFIX);

        // Don't load config file if any of these options are specified.
        if (!get_option(variables, BP_VERSION_VARIABLE) &&
            !get_option(variables, BP_SETTINGS_VARIABLE) &&
            !get_option(variables, BP_HELP_VARIABLE))
        {
            // Returns true if the settings were loaded from a file.
            file = load_configuration_variables(variables, BP_CONFIG_VARIABLE);
        }

        // Update bound variables in metadata.settings.
        notify(variables);

        // Clear the config file path if it wasn't used.
        if (!file)
            configured.file.clear();
    }
    catch (const boost::program_options::error& e)
    {
        // This is obtained from boost, which circumvents our localization.
        error << format_invalid_parameter(e.what()) << std::endl;
        return false;
    }

    return true;
}

} // namespace blockperf
