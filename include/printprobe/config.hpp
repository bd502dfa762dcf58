#pragma once

#include <printprobe/common.hpp>

namespace printprobe {

    // Settings for a manual discovery session
    struct DiscoveryConfig {
        dp::String cache_dir = ".";
        dp::String cache_file = "manual_printers.json";

        dp::String default_scheme = DEFAULT_IPP_SCHEME;
        dp::i32 default_port = DEFAULT_IPP_PORT;

        // Likely paths at which a print service may be found, most specific first
        dp::Vector<dp::String> candidate_paths = {"ipp/printer", "ipp/print", "ipp", ""};

        bool save_on_close = true;

        inline dp::String store_path() const {
            if (cache_dir.empty()) {
                return cache_file;
            }
            std::string dir = to_std(cache_dir);
            if (dir.back() != '/') {
                dir += '/';
            }
            return to_dp(dir) + cache_file;
        }

        /// Check every field
        /// @return invalid_argument naming the first bad field
        inline dp::Res<void> validate() const {
            if (default_scheme.empty()) {
                return dp::result::err(dp::Error::invalid_argument("default_scheme is empty"));
            }
            if (default_port < 1 || default_port > 65535) {
                return dp::result::err(dp::Error::invalid_argument("default_port out of range"));
            }
            if (candidate_paths.empty()) {
                return dp::result::err(dp::Error::invalid_argument("candidate_paths is empty"));
            }
            if (cache_file.empty()) {
                return dp::result::err(dp::Error::invalid_argument("cache_file is empty"));
            }
            return dp::result::ok();
        }

        /// Copy with every invalid field replaced by its default
        inline DiscoveryConfig sanitized() const {
            DiscoveryConfig out = *this;
            DiscoveryConfig defaults;
            if (out.default_scheme.empty()) {
                echo::warn("config: empty default_scheme, using ", defaults.default_scheme.c_str());
                out.default_scheme = defaults.default_scheme;
            }
            if (out.default_port < 1 || out.default_port > 65535) {
                echo::warn("config: default_port ", out.default_port, " out of range, using ", defaults.default_port);
                out.default_port = defaults.default_port;
            }
            if (out.candidate_paths.empty()) {
                echo::warn("config: no candidate paths, using defaults");
                out.candidate_paths = defaults.candidate_paths;
            }
            if (out.cache_file.empty()) {
                echo::warn("config: empty cache_file, using ", defaults.cache_file.c_str());
                out.cache_file = defaults.cache_file;
            }
            return out;
        }
    };

} // namespace printprobe
