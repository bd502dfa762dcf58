#pragma once

#include <printprobe/common.hpp>

#include <cctype>

namespace printprobe {

    // Network location of a print service: scheme://host[:port][/path]
    // scheme and host are stored lower-cased, port is -1 when absent,
    // path is either empty (root) or starts with '/'
    struct Uri {
        dp::String scheme;
        dp::String host; // Hostname, IPv4 address, or bracketed IPv6 literal
        dp::i32 port = -1;
        dp::String path;

        inline bool has_port() const { return port >= 0; }

        inline dp::String to_string() const {
            dp::String out = scheme + "://" + host;
            if (has_port()) {
                out = out + ":" + dp::String(std::to_string(port).c_str());
            }
            return out + path;
        }

        // Same scheme/host/port with the given encoded path ("ipp/print", "/ipp", "")
        inline Uri with_path(const dp::String &encoded_path) const {
            Uri out = *this;
            std::string p = to_std(encoded_path);
            while (!p.empty() && p.front() == '/') {
                p.erase(0, 1);
            }
            out.path = p.empty() ? dp::String("") : to_dp("/" + p);
            return out;
        }

        // Fill in the port if the URI does not carry one
        inline Uri with_default_port(dp::i32 default_port) const {
            Uri out = *this;
            if (!out.has_port()) {
                out.port = default_port;
            }
            return out;
        }

        inline bool operator==(const Uri &other) const {
            return scheme == other.scheme && host == other.host && port == other.port && path == other.path;
        }
        inline bool operator!=(const Uri &other) const { return !(*this == other); }
    };

    namespace detail {

        inline std::string trim(const std::string &text) {
            dp::usize begin = 0;
            dp::usize end = text.size();
            while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
                ++begin;
            }
            while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
                --end;
            }
            return text.substr(begin, end - begin);
        }

        inline std::string lower(std::string text) {
            for (auto &c : text) {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            return text;
        }

        inline bool valid_scheme(const std::string &scheme) {
            if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) {
                return false;
            }
            for (char c : scheme) {
                if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
                    return false;
                }
            }
            return true;
        }

        inline bool valid_host(const std::string &host) {
            if (host.empty()) {
                return false;
            }
            if (host.front() == '[') {
                if (host.size() < 3 || host.back() != ']') {
                    return false;
                }
                for (dp::usize i = 1; i + 1 < host.size(); ++i) {
                    char c = host[i];
                    if (!std::isxdigit(static_cast<unsigned char>(c)) && c != ':' && c != '.' && c != '%') {
                        return false;
                    }
                }
                return true;
            }
            for (char c : host) {
                if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '.' && c != '_') {
                    return false;
                }
            }
            return true;
        }

        // Parses "65535"-style port text; -1 on anything else
        inline dp::i32 parse_port(const std::string &text) {
            if (text.empty() || text.size() > 5) {
                return -1;
            }
            dp::i32 value = 0;
            for (char c : text) {
                if (!std::isdigit(static_cast<unsigned char>(c))) {
                    return -1;
                }
                value = value * 10 + (c - '0');
            }
            if (value < 1 || value > 65535) {
                return -1;
            }
            return value;
        }

    } // namespace detail

    // Parse URI text into its components
    // A missing scheme ("printer.local:631/ipp/print") takes default_scheme.
    // Query and fragment are dropped; user info is ignored.
    // Returns invalid_argument for an empty or illegal host, a bad scheme or a bad port.
    inline dp::Res<Uri> parse_uri(const dp::String &text, const dp::String &default_scheme = DEFAULT_IPP_SCHEME) {
        std::string rest = detail::trim(to_std(text));
        if (rest.empty()) {
            echo::trace("parse_uri: empty input");
            return dp::result::err(dp::Error::invalid_argument("empty uri"));
        }

        Uri uri;
        auto sep = rest.find("://");
        if (sep != std::string::npos) {
            std::string scheme = rest.substr(0, sep);
            if (!detail::valid_scheme(scheme)) {
                echo::trace("parse_uri: invalid scheme '", scheme, "'");
                return dp::result::err(dp::Error::invalid_argument("invalid scheme"));
            }
            uri.scheme = to_dp(detail::lower(scheme));
            rest = rest.substr(sep + 3);
        } else {
            uri.scheme = to_dp(detail::lower(to_std(default_scheme)));
        }

        auto path_start = rest.find_first_of("/?#");
        std::string authority = rest.substr(0, path_start);
        std::string path;
        if (path_start != std::string::npos && rest[path_start] == '/') {
            path = rest.substr(path_start);
            auto tail = path.find_first_of("?#");
            if (tail != std::string::npos) {
                path.erase(tail);
            }
        }
        if (path == "/") {
            path.clear();
        }

        auto at = authority.rfind('@');
        if (at != std::string::npos) {
            authority = authority.substr(at + 1);
        }

        std::string host;
        std::string port_text;
        bool has_port_sep = false;
        if (!authority.empty() && authority.front() == '[') {
            auto close = authority.find(']');
            if (close == std::string::npos) {
                echo::trace("parse_uri: unterminated IPv6 literal");
                return dp::result::err(dp::Error::invalid_argument("invalid host"));
            }
            host = authority.substr(0, close + 1);
            std::string after = authority.substr(close + 1);
            if (!after.empty()) {
                if (after.front() != ':') {
                    return dp::result::err(dp::Error::invalid_argument("invalid host"));
                }
                has_port_sep = true;
                port_text = after.substr(1);
            }
        } else {
            auto colon = authority.find(':');
            host = authority.substr(0, colon);
            if (colon != std::string::npos) {
                has_port_sep = true;
                port_text = authority.substr(colon + 1);
            }
        }

        if (!detail::valid_host(host)) {
            echo::trace("parse_uri: invalid host '", host, "'");
            return dp::result::err(dp::Error::invalid_argument("invalid host"));
        }
        uri.host = to_dp(detail::lower(host));

        // "host:" with nothing after the colon is treated as no port at all
        if (has_port_sep && !port_text.empty()) {
            uri.port = detail::parse_port(port_text);
            if (uri.port < 0) {
                echo::trace("parse_uri: invalid port '", port_text, "'");
                return dp::result::err(dp::Error::invalid_argument("invalid port"));
            }
        }

        uri.path = to_dp(path);
        return dp::result::ok(uri);
    }

    // Repair a user-supplied hostname into a base URI for probing
    // Whitespace, any "scheme://" prefix and any trailing path are stripped.
    // An explicit port is kept, otherwise default_port is used.
    // The result always carries default_scheme and an empty path.
    inline dp::Res<Uri> repair_host(const dp::String &hostname, const dp::String &default_scheme = DEFAULT_IPP_SCHEME,
                                    dp::i32 default_port = DEFAULT_IPP_PORT) {
        auto parsed = parse_uri(hostname, default_scheme);
        if (parsed.is_err()) {
            echo::warn("cannot repair hostname '", hostname.c_str(), "': ", parsed.error().message.c_str());
            return dp::result::err(parsed.error());
        }

        Uri base = parsed.value().with_default_port(default_port);
        base.scheme = to_dp(detail::lower(to_std(default_scheme)));
        base.path = "";
        echo::trace("repaired '", hostname.c_str(), "' to ", base.to_string().c_str());
        return dp::result::ok(base);
    }

} // namespace printprobe
