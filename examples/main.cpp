#include <printprobe/printprobe.hpp>

int main() {
    echo::info("Printprobe library loaded successfully!");
    echo::info("Building blocks:");
    echo::info("  Uri, Endpoint: addressing and stored records");
    echo::info("  CapabilityLookup, Listener: interfaces you implement");
    echo::info("  EndpointRegistry, EndpointStore: persisted manual list");
    echo::info("  ManualDiscovery: probes hostnames and announces the list");
    echo::info("");
    echo::info("See examples/manual_discovery.cpp for usage");
    return 0;
}
