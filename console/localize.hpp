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
#ifndef BLOCKPERF_CONSOLE_LOCALIZE_HPP
#define BLOCKPERF_CONSOLE_LOCALIZE_HPP

/// Localizable messages.

namespace blockperf {

// --settings
#define BP_SETTINGS_MESSAGE \
    "These are the configuration settings that can be set."
#define BP_INFORMATION_MESSAGE \
    "Collects block propagation samples from a cardano node trace log."

// run/general

#define BP_COLLECTOR_INTERRUPT \
    "Press CTRL-C to stop the collector."
#define BP_COLLECTOR_STARTING \
    "Please wait while the collector is starting..."
#define BP_COLLECTOR_START_FAIL \
    "Collector failed to start with error, %1%."
#define BP_COLLECTOR_STARTED \
    "Collector is started."
#define BP_COLLECTOR_RUNNING \
    "Collector is running."
#define BP_COLLECTOR_STOPPING \
    "Please wait while the collector is stopping..."
#define BP_COLLECTOR_STOP_CODE \
    "Collector stopped with code, %1%."
#define BP_COLLECTOR_STOPPED \
    "Collector stopped successfully."
#define BP_COLLECTOR_TOTALS \
    "Totals...\n" \
    "   reads       :%1%\n" \
    "   discards    :%2%\n" \
    "   transitions :%3%\n" \
    "   mismatches  :%4%\n" \
    "   peers       :%5%\n" \
    "   samples     :%6%\n" \
    "   incomplete  :%7%\n" \
    "   swept       :%8%\n" \
    "   failures    :%9%\n" \
    "   open        :%10%"

#define BP_UNKNOWN_NETWORK \
    "The network '%1%' is not known, use mainnet, preprod, preview or custom."
#define BP_NETWORK_PARAMETERS \
    "Network %1% magic [%2%] slot length %3% ms."
#define BP_TRACE_SOURCE \
    "Trace source: %1% (follow:%2%)"
#define BP_SAMPLES_SINK \
    "Samples sink: %1%"
#define BP_SAMPLES_INITIALIZE_FAILURE \
    "Failed to open samples file, %1%."
#define BP_SOURCE_COMPLETE \
    "Trace source complete, %1%."

#define BP_LOG_INITIALIZE_FAILURE \
    "Failed to initialize logging."
#define BP_LOG_TABLE_HEADER \
    "Log system..."
#define BP_LOG_TABLE \
    "compiled:%1% enabled:%2%"
#define BP_VERSION_MESSAGE \
    "\nVersion Information\n" \
    "----------------------------\n" \
    "blockperf:             %1%\n" \
    "libbitcoin-database:   %2%\n" \
    "libbitcoin-network:    %3%\n" \
    "libbitcoin-system:     %4%"
#define BP_LOG_HEADER \
    "====================== startup ======================="
#define BP_COLLECTOR_FOOTER \
    "====================== shutdown ======================"

} // namespace blockperf

#endif
