#pragma once

#include <optional>
#include <printprobe/uri.hpp>

namespace printprobe {

    // A manually configured print service
    // Two endpoints are the same endpoint iff their URIs are equal
    struct Endpoint {
        std::optional<dp::String> uuid; // Stable identity token, if the device reported one
        dp::String name;                // Display name, the URI host when the device gave none
        Uri uri;                        // Always carries an explicit port once stored
        std::optional<dp::String> location;

        inline dp::String to_string() const { return name + " <" + uri.to_string() + ">"; }

        inline bool same_uri(const Endpoint &other) const { return uri == other.uri; }

        // Secondary match used by removal: only the URI path is compared
        inline bool same_path(const Endpoint &other) const { return uri.path == other.uri.path; }

        inline bool operator==(const Endpoint &other) const {
            return uuid == other.uuid && name == other.name && uri == other.uri && location == other.location;
        }
        inline bool operator!=(const Endpoint &other) const { return !(*this == other); }
    };

    // Provisional record used while probing a URI, before anything is known about it
    inline Endpoint make_unidentified(const Uri &uri) {
        Endpoint endpoint;
        endpoint.name = "unknown";
        endpoint.uri = uri;
        return endpoint;
    }

} // namespace printprobe
