///////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2014-2025 blockperf developers (see COPYING).
//
//        GENERATED SOURCE CODE, DO NOT EDIT EXCEPT EXPERIMENTALLY
//
///////////////////////////////////////////////////////////////////////////////
#ifndef BLOCKPERF_HPP
#define BLOCKPERF_HPP

/**
 * API Users: Include only this header. Direct use of other headers is fragile
 * and unsupported as header organization is subject to change.
 *
 * Maintainers: Do not include this header internal to this library.
 */

#include <bitcoin/network.hpp>
#include <blockperf/collector.hpp>
#include <blockperf/configuration.hpp>
#include <blockperf/define.hpp>
#include <blockperf/error.hpp>
#include <blockperf/events.hpp>
#include <blockperf/parser.hpp>
#include <blockperf/settings.hpp>
#include <blockperf/version.hpp>
#include <blockperf/blocks/block_correlator.hpp>
#include <blockperf/blocks/block_record.hpp>
#include <blockperf/blocks/block_sample.hpp>
#include <blockperf/chasers/chaser.hpp>
#include <blockperf/chasers/chaser_blocks.hpp>
#include <blockperf/chasers/chaser_dispatch.hpp>
#include <blockperf/chasers/chaser_peers.hpp>
#include <blockperf/chasers/chasers.hpp>
#include <blockperf/interfaces/connection_source.hpp>
#include <blockperf/interfaces/event_source.hpp>
#include <blockperf/interfaces/interfaces.hpp>
#include <blockperf/interfaces/sample_sink.hpp>
#include <blockperf/peers/peer.hpp>
#include <blockperf/peers/peer_tracker.hpp>
#include <blockperf/sinks/json_sink.hpp>
#include <blockperf/sources/file_source.hpp>
#include <blockperf/sources/proc_connections.hpp>
#include <blockperf/trace/classifier.hpp>
#include <blockperf/trace/decoder.hpp>
#include <blockperf/trace/payloads.hpp>
#include <blockperf/trace/status_change.hpp>
#include <blockperf/trace/trace_event.hpp>
#include <blockperf/trace/transition.hpp>
#include <blockperf/utility/endpoint.hpp>
#include <blockperf/utility/genesis.hpp>
#include <blockperf/utility/timestamp.hpp>

#endif
