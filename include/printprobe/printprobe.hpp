#pragma once

// Printprobe - Manual discovery of network print endpoints
// Probes a hostname at a fixed list of candidate paths through a capability lookup,
// keeps the endpoints that answered in a persisted, deduplicated registry

// Core types and utilities
#include <printprobe/common.hpp>
#include <printprobe/endpoint.hpp>
#include <printprobe/uri.hpp>

// Collaborator interfaces
#include <printprobe/capabilities.hpp>
#include <printprobe/listener.hpp>

// Registry and persistence
#include <printprobe/registry.hpp>
#include <printprobe/store.hpp>

// Probing and the discovery session
#include <printprobe/config.hpp>
#include <printprobe/discovery.hpp>
#include <printprobe/metrics.hpp>
#include <printprobe/probe.hpp>

// All types are in the printprobe:: namespace
// Available types:
//   - printprobe::Uri, Endpoint, Capabilities
//   - printprobe::CapabilityLookup, Listener (interfaces to implement)
//   - printprobe::EndpointStore, EndpointRegistry
//   - printprobe::PathProbe, ProbeOutcome, ProbeMetrics
//   - printprobe::DiscoveryConfig, ManualDiscovery
