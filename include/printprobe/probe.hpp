#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <printprobe/capabilities.hpp>
#include <printprobe/metrics.hpp>
#include <printprobe/registry.hpp>

namespace printprobe {

    enum class ProbeState : dp::u8 {
        Idle = 0,
        Probing = 1,   // One lookup outstanding, or about to be issued
        Found = 2,     // A candidate answered; handler fired
        Exhausted = 3, // No candidate answered; handler fired
        Cancelled = 4, // Discarded before completion; handler never fires
    };

    enum class ProbeStatus : dp::u8 {
        Added = 0,       // Found, supported, stored in the registry
        Unsupported = 1, // Found but not supported, not stored
        NotFound = 2,    // Nothing answered at any candidate path
    };

    inline const char *to_string(ProbeStatus status) {
        switch (status) {
        case ProbeStatus::Added:
            return "added";
        case ProbeStatus::Unsupported:
            return "unsupported";
        case ProbeStatus::NotFound:
            return "not found";
        }
        return "unknown";
    }

    /// Final result of a manual add
    struct ProbeOutcome {
        ProbeStatus status;
        std::optional<Endpoint> endpoint; // Set unless status is NotFound

        inline bool found() const { return status != ProbeStatus::NotFound; }
        inline bool supported() const { return status == ProbeStatus::Added; }
    };

    /// Handler for the outcome of a manual add; invoked exactly once unless cancelled
    using AddHandler = std::function<void(const ProbeOutcome &)>;

    /// Tries candidate paths under one base URI, one lookup at a time, until a path answers
    /// Always held by std::shared_ptr. Lookup handlers keep only a weak reference, so responses
    /// arriving after the probe is released are dropped.
    class PathProbe : public std::enable_shared_from_this<PathProbe> {
      private:
        Uri base_;
        std::deque<dp::String> paths_;
        CapabilityLookup &lookup_;
        EndpointRegistry &registry_;
        ProbeMetrics &metrics_;
        AddHandler handler_;
        std::function<void()> on_finished_;
        dp::i32 default_port_;
        dp::String default_scheme_;

        // Held whenever the probe touches its owner (registry, metrics, lookup, on_finished_).
        // cancel() takes it too, so once cancel() returns no other thread is inside the owner.
        // Recursive because lookups may answer inline on the calling thread.
        std::recursive_mutex owner_guard_;

        mutable std::mutex mutex_;
        ProbeState state_;
        bool pending_; // A lookup has been issued and not yet answered

        PathProbe(Uri base, const dp::Vector<dp::String> &paths, CapabilityLookup &lookup,
                  EndpointRegistry &registry, ProbeMetrics &metrics, AddHandler handler, dp::i32 default_port,
                  dp::String default_scheme)
            : base_(std::move(base)), lookup_(lookup), registry_(registry), metrics_(metrics),
              handler_(std::move(handler)), default_port_(default_port), default_scheme_(std::move(default_scheme)),
              state_(ProbeState::Idle), pending_(false) {
            for (const auto &path : paths) {
                paths_.push_back(path);
            }
            echo::trace("PathProbe constructed, base=", base_.to_string().c_str(), " paths=", paths_.size());
        }

        /// Normalize a lookup answer into the endpoint record that gets stored and reported
        dp::Res<Endpoint> normalize(const Capabilities &caps) const {
            auto uri_res = parse_uri(caps.path, default_scheme_);
            if (uri_res.is_err()) {
                return dp::result::err(uri_res.error());
            }

            Endpoint endpoint;
            endpoint.uri = uri_res.value().with_default_port(default_port_);
            if (!caps.uuid.empty()) {
                endpoint.uuid = caps.uuid;
            }
            endpoint.name = caps.name.empty() ? endpoint.uri.host : caps.name;
            endpoint.location = caps.location;
            return dp::result::ok(endpoint);
        }

        /// Transition to a terminal state and fire the handler, unless cancelled first
        /// The registry add and on_finished_ complete before the handler runs, so the handler is the
        /// last thing that may observe the owner.
        void finish(ProbeState terminal, const ProbeOutcome &outcome) {
            // on_finished_ may release the owner's reference
            auto self = shared_from_this();
            {
                std::lock_guard<std::recursive_mutex> guard(owner_guard_);
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (state_ != ProbeState::Probing) {
                        echo::trace("probe ", base_.to_string().c_str(), " already finished, dropping outcome");
                        return;
                    }
                    state_ = terminal;
                }

                if (outcome.status == ProbeStatus::Added) {
                    registry_.add(*outcome.endpoint);
                    metrics_.found_supported.fetch_add(1);
                    echo::info("added manual endpoint ", outcome.endpoint->to_string().c_str());
                } else if (outcome.status == ProbeStatus::Unsupported) {
                    metrics_.found_unsupported.fetch_add(1);
                } else {
                    metrics_.not_found.fetch_add(1);
                }

                if (on_finished_) {
                    auto on_finished = std::move(on_finished_);
                    on_finished_ = nullptr;
                    on_finished();
                }
            }

            echo::debug("probe ", base_.to_string().c_str(), " finished: ", to_string(outcome.status));
            if (handler_) {
                handler_(outcome);
            }
        }

      public:
        static std::shared_ptr<PathProbe> create(Uri base, const dp::Vector<dp::String> &paths,
                                                 CapabilityLookup &lookup, EndpointRegistry &registry,
                                                 ProbeMetrics &metrics, AddHandler handler,
                                                 dp::i32 default_port = DEFAULT_IPP_PORT,
                                                 dp::String default_scheme = DEFAULT_IPP_SCHEME) {
            return std::shared_ptr<PathProbe>(new PathProbe(std::move(base), paths, lookup, registry, metrics,
                                                            std::move(handler), default_port,
                                                            std::move(default_scheme)));
        }

        PathProbe(const PathProbe &) = delete;
        PathProbe &operator=(const PathProbe &) = delete;

        /// Hook run once after the handler fires, used by the owner to release the probe
        void set_on_finished(std::function<void()> on_finished) {
            std::lock_guard<std::recursive_mutex> guard(owner_guard_);
            on_finished_ = std::move(on_finished);
        }

        /// Begin probing; only the first call has any effect
        void start() {
            std::lock_guard<std::recursive_mutex> guard(owner_guard_);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (state_ != ProbeState::Idle) {
                    echo::trace("probe ", base_.to_string().c_str(), " not idle, start ignored");
                    return;
                }
                state_ = ProbeState::Probing;
            }
            metrics_.probes_started.fetch_add(1);
            echo::debug("probing ", base_.to_string().c_str());
            start_next();
        }

        /// Move on to the next path or report not-found if none remain
        void start_next() {
            std::unique_lock<std::recursive_mutex> guard(owner_guard_);
            Uri to_try;
            bool have_path = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (state_ != ProbeState::Probing || pending_) {
                    echo::trace("start_next ignored, state=", static_cast<dp::u32>(state_), " pending=", pending_);
                    return;
                }
                if (!paths_.empty()) {
                    to_try = base_.with_path(paths_.front());
                    paths_.pop_front();
                    pending_ = true;
                    have_path = true;
                }
            }

            if (!have_path) {
                echo::debug("probe ", base_.to_string().c_str(), " exhausted all paths");
                guard.unlock();
                finish(ProbeState::Exhausted, ProbeOutcome{ProbeStatus::NotFound, std::nullopt});
                return;
            }

            echo::trace("probe trying ", to_try.to_string().c_str());
            metrics_.lookups_issued.fetch_add(1);

            std::weak_ptr<PathProbe> weak = shared_from_this();
            lookup_.request(make_unidentified(to_try), false, [weak](const std::optional<Capabilities> &caps) {
                if (auto self = weak.lock()) {
                    self->on_capabilities(caps);
                } else {
                    echo::trace("capabilities arrived for a released probe, dropping");
                }
            });
        }

        /// Response handler for the outstanding lookup
        void on_capabilities(const std::optional<Capabilities> &caps) {
            std::unique_lock<std::recursive_mutex> guard(owner_guard_);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (state_ != ProbeState::Probing || !pending_) {
                    echo::trace("unexpected capabilities for ", base_.to_string().c_str(), ", dropping");
                    return;
                }
                pending_ = false;
            }

            if (!caps) {
                metrics_.lookup_misses.fetch_add(1);
                echo::trace("no answer, trying next path");
                guard.unlock();
                start_next();
                return;
            }

            auto endpoint_res = normalize(*caps);
            if (endpoint_res.is_err()) {
                // An answer we cannot turn into a URI counts as a miss at this path
                echo::warn("unusable capability path '", caps->path.c_str(), "': ",
                           endpoint_res.error().message.c_str());
                metrics_.lookup_misses.fetch_add(1);
                guard.unlock();
                start_next();
                return;
            }

            guard.unlock();
            ProbeStatus status = caps->supported ? ProbeStatus::Added : ProbeStatus::Unsupported;
            finish(ProbeState::Found, ProbeOutcome{status, endpoint_res.value()});
        }

        /// Discard the probe; the handler will not fire after this returns true
        /// @return false if the probe had already finished
        /// Waits for another thread that is finishing the probe, so a false return means the
        /// registry update and on_finished_ have already happened.
        bool cancel() {
            std::lock_guard<std::recursive_mutex> guard(owner_guard_);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (state_ == ProbeState::Found || state_ == ProbeState::Exhausted ||
                    state_ == ProbeState::Cancelled) {
                    return false;
                }
                state_ = ProbeState::Cancelled;
                pending_ = false;
                paths_.clear();
            }
            on_finished_ = nullptr;
            metrics_.cancelled.fetch_add(1);
            echo::debug("probe ", base_.to_string().c_str(), " cancelled");
            return true;
        }

        ProbeState state() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return state_;
        }

        bool pending() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return pending_;
        }

        /// Number of candidate paths not yet tried
        dp::usize remaining() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return paths_.size();
        }

        const Uri &base() const { return base_; }
    };

} // namespace printprobe
