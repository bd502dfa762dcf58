#pragma once

#include <atomic>
#include <map>
#include <printprobe/config.hpp>
#include <printprobe/probe.hpp>

namespace printprobe {

    /// Manages the list of print endpoints added by hand
    /// Loads the list on construction, announces it to the listener between start() and stop(),
    /// probes hostnames on request and saves the list on close().
    class ManualDiscovery {
      private:
        DiscoveryConfig config_;
        CapabilityLookup &lookup_;
        Listener &listener_;
        EndpointRegistry registry_;
        ProbeMetrics metrics_;

        std::map<dp::u32, std::shared_ptr<PathProbe>> probes_;
        mutable std::mutex probes_mutex_;
        std::atomic<dp::u32> next_probe_id_;
        std::atomic<bool> started_;
        std::atomic<bool> closed_;

        static DiscoveryConfig checked(DiscoveryConfig config) {
            auto valid_res = config.validate();
            if (valid_res.is_err()) {
                echo::error("invalid discovery config: ", valid_res.error().message.c_str());
                return config.sanitized();
            }
            return config;
        }

        void release_probe(dp::u32 id) {
            std::lock_guard<std::mutex> lock(probes_mutex_);
            probes_.erase(id);
        }

      public:
        ManualDiscovery(DiscoveryConfig config, CapabilityLookup &lookup, Listener &listener)
            : config_(checked(std::move(config))), lookup_(lookup), listener_(listener),
              registry_(EndpointStore(config_.store_path(), config_.default_port)), next_probe_id_(1),
              started_(false), closed_(false) {
            echo::trace("ManualDiscovery constructed, store=", config_.store_path().c_str());
            registry_.load();
        }

        ~ManualDiscovery() {
            auto close_res = close();
            if (close_res.is_err()) {
                echo::warn("ManualDiscovery closed with error: ", close_res.error().message.c_str());
            }
        }

        ManualDiscovery(const ManualDiscovery &) = delete;
        ManualDiscovery &operator=(const ManualDiscovery &) = delete;

        /// Begin announcing: every stored endpoint is reported to the listener,
        /// after its cached network state is dropped so it gets checked afresh
        void start() {
            if (started_.exchange(true)) {
                echo::trace("ManualDiscovery already started");
                return;
            }
            echo::debug("ManualDiscovery start");
            auto snapshot = registry_.announce(listener_);
            for (const auto &endpoint : snapshot) {
                echo::trace("reporting ", endpoint.to_string().c_str());
                lookup_.evict_on_network_change(endpoint.uri);
                listener_.on_endpoint_found(endpoint);
            }
        }

        /// Stop announcing; the list itself is kept
        void stop() {
            if (!started_.exchange(false)) {
                return;
            }
            echo::debug("ManualDiscovery stop");
            registry_.silence();
        }

        bool is_started() const { return started_.load(); }

        /// Cancel outstanding probes and persist the list
        /// Safe to call more than once; only the first call does anything
        dp::Res<void> close() {
            if (closed_.exchange(true)) {
                return dp::result::ok();
            }
            echo::debug("ManualDiscovery close");
            stop();

            std::map<dp::u32, std::shared_ptr<PathProbe>> outstanding;
            {
                std::lock_guard<std::mutex> lock(probes_mutex_);
                outstanding.swap(probes_);
            }
            // A probe finishing on another thread is waited for, so its endpoint is in the saved list
            for (auto &pair : outstanding) {
                pair.second->cancel();
            }

            if (!config_.save_on_close) {
                return dp::result::ok();
            }
            return registry_.save();
        }

        bool is_closed() const { return closed_.load(); }

        /// Persist the list now
        dp::Res<void> save() const { return registry_.save(); }

        /// Asynchronously probe hostname for a print service
        /// handler fires exactly once with the outcome, unless the probe is cancelled or the
        /// session is closed first.
        /// @return Probe id for cancel(), 0 if the hostname was rejected outright
        dp::u32 add_manual_endpoint(const dp::String &hostname, AddHandler handler) {
            echo::debug("add_manual_endpoint ", hostname.c_str());

            if (closed_.load()) {
                echo::warn("add_manual_endpoint after close, reporting not found");
                metrics_.not_found.fetch_add(1);
                if (handler) {
                    handler(ProbeOutcome{ProbeStatus::NotFound, std::nullopt});
                }
                return 0;
            }

            // Repair supplied hostname as much as possible
            auto base_res = repair_host(hostname, config_.default_scheme, config_.default_port);
            if (base_res.is_err()) {
                metrics_.not_found.fetch_add(1);
                if (handler) {
                    handler(ProbeOutcome{ProbeStatus::NotFound, std::nullopt});
                }
                return 0;
            }

            dp::u32 id = next_probe_id_.fetch_add(1);
            auto probe = PathProbe::create(base_res.value(), config_.candidate_paths, lookup_, registry_, metrics_,
                                           handler, config_.default_port, config_.default_scheme);
            probe->set_on_finished([this, id]() { release_probe(id); });

            {
                // close() marks the session closed before it collects probes, so checking here under the
                // table lock means every started probe is one close() will cancel
                std::lock_guard<std::mutex> lock(probes_mutex_);
                if (!closed_.load()) {
                    probes_[id] = probe;
                } else {
                    probe.reset();
                }
            }
            if (!probe) {
                echo::warn("session closed while adding ", hostname.c_str(), ", reporting not found");
                metrics_.not_found.fetch_add(1);
                if (handler) {
                    handler(ProbeOutcome{ProbeStatus::NotFound, std::nullopt});
                }
                return 0;
            }

            probe->start();
            return id;
        }

        /// Remove the stored endpoint whose URI path matches the given one
        /// @return true if an endpoint was removed
        bool remove_manual_endpoint(const Endpoint &endpoint) {
            echo::debug("remove_manual_endpoint ", endpoint.to_string().c_str());
            bool removed = registry_.remove(endpoint);
            if (removed) {
                echo::info("removed manual endpoint at path '", endpoint.uri.path.c_str(), "'");
            }
            return removed;
        }

        /// Discard an outstanding probe; its handler will not fire
        /// @return false if the id is unknown or the probe already finished
        bool cancel(dp::u32 probe_id) {
            std::shared_ptr<PathProbe> probe;
            {
                std::lock_guard<std::mutex> lock(probes_mutex_);
                auto it = probes_.find(probe_id);
                if (it == probes_.end()) {
                    echo::trace("cancel: probe id not found: ", probe_id);
                    return false;
                }
                probe = it->second;
                probes_.erase(it);
            }
            return probe->cancel();
        }

        /// Number of probes still waiting on a lookup
        dp::usize pending_probes() const {
            std::lock_guard<std::mutex> lock(probes_mutex_);
            return probes_.size();
        }

        dp::Vector<Endpoint> endpoints() const { return registry_.endpoints(); }

        const EndpointRegistry &registry() const { return registry_; }

        const DiscoveryConfig &config() const { return config_; }

        const ProbeMetrics &metrics() const { return metrics_; }

        void reset_metrics() { metrics_.reset(); }
    };

} // namespace printprobe
