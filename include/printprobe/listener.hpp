#pragma once

#include <printprobe/endpoint.hpp>

namespace printprobe {

    // Observer notified while a discovery session is announcing
    class Listener {
      public:
        virtual ~Listener() = default;

        // An endpoint is available (newly added, or announced on start)
        virtual void on_endpoint_found(const Endpoint &endpoint) = 0;

        // An endpoint previously announced at this URI went away
        virtual void on_endpoint_lost(const Uri &uri) = 0;
    };

} // namespace printprobe
