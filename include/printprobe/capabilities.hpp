#pragma once

#include <functional>
#include <printprobe/endpoint.hpp>

namespace printprobe {

    // Capability record returned by a lookup that got an answer
    struct Capabilities {
        dp::String path; // Resolved printer URI, may omit scheme and/or port
        dp::String uuid; // Empty when the device has no stable identity
        dp::String name; // Empty when the device reported no display name
        std::optional<dp::String> location;
        bool supported = false;
    };

    /// Handler function type for capability responses
    /// Receives std::nullopt when nothing answered at the requested URI
    using CapabilitiesHandler = std::function<void(const std::optional<Capabilities> &)>;

    // Abstract base class for the capability-lookup transport
    // Implementations fetch and parse a capability document for an endpoint guess
    class CapabilityLookup {
      public:
        virtual ~CapabilityLookup() = default;

        // Request capabilities for the endpoint's URI
        // Must invoke handler exactly once, inline or from another thread
        // refresh=true bypasses any cached answer
        virtual void request(const Endpoint &endpoint, bool refresh, CapabilitiesHandler handler) = 0;

        // Drop anything cached for this URI under the current network,
        // so the next request performs a fresh capability check
        virtual void evict_on_network_change(const Uri &uri) = 0;
    };

} // namespace printprobe
