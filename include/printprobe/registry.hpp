#pragma once

#include <mutex>
#include <printprobe/listener.hpp>
#include <printprobe/store.hpp>

namespace printprobe {

    /// Ordered list of manually added endpoints, most recent first
    /// No two entries ever share a URI. Thread-safe: every operation runs under one mutex,
    /// listener callbacks run after the mutex is released.
    class EndpointRegistry {
      private:
        struct Notice {
            bool found;
            Endpoint endpoint;
        };

        EndpointStore store_;
        dp::Vector<Endpoint> endpoints_;
        Listener *listener_; // Non-null while announcing
        mutable std::mutex mutex_;

        /// Insert at the front, evicting any entry with the same URI
        /// Caller holds mutex_; notices are queued for delivery after unlock
        void add_locked(const Endpoint &endpoint, dp::Vector<Notice> &notices) {
            for (auto it = endpoints_.begin(); it != endpoints_.end();) {
                if (it->same_uri(endpoint)) {
                    echo::trace("registry evicting prior entry ", it->to_string().c_str());
                    if (listener_ != nullptr) {
                        notices.push_back(Notice{false, *it});
                    }
                    it = endpoints_.erase(it);
                } else {
                    ++it;
                }
            }

            endpoints_.insert(endpoints_.begin(), endpoint);

            if (listener_ != nullptr) {
                notices.push_back(Notice{true, endpoint});
            }
        }

        void deliver(Listener *listener, const dp::Vector<Notice> &notices) {
            if (listener == nullptr) {
                return;
            }
            for (const auto &notice : notices) {
                if (notice.found) {
                    listener->on_endpoint_found(notice.endpoint);
                } else {
                    listener->on_endpoint_lost(notice.endpoint.uri);
                }
            }
        }

      public:
        explicit EndpointRegistry(EndpointStore store) : store_(std::move(store)), listener_(nullptr) {
            echo::trace("EndpointRegistry constructed");
        }

        /// Rebuild the list from the store
        /// A missing, unreadable or malformed store is only logged. Records decoded before a
        /// malformed one are kept.
        /// @return Number of entries in the registry afterwards
        dp::usize load() {
            dp::Vector<Endpoint> stored;
            auto load_res = store_.load(stored);
            if (load_res.is_err()) {
                if (load_res.error().code == dp::Error::NOT_FOUND) {
                    echo::debug("no stored endpoints at ", store_.path().c_str());
                } else {
                    echo::warn("error while restoring endpoints from ", store_.path().c_str(), ": ",
                               load_res.error().message.c_str(), " (kept ", stored.size(), ")");
                }
            }

            dp::Vector<Notice> notices;
            Listener *listener = nullptr;
            dp::usize count = 0;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                // The store is most recent first and add inserts at the front, so replay oldest first;
                // a save followed by a load then yields the same order rather than a reversed one
                for (dp::usize i = stored.size(); i > 0; --i) {
                    add_locked(stored[i - 1], notices);
                }
                listener = listener_;
                count = endpoints_.size();
            }
            deliver(listener, notices);

            echo::debug("after load the registry has ", count, " endpoints");
            return count;
        }

        /// Persist the current list, replacing what was stored before
        /// Failures are logged and returned; the in-memory list is unaffected either way
        dp::Res<void> save() const {
            dp::Vector<Endpoint> snapshot = endpoints();
            auto save_res = store_.save(snapshot);
            if (save_res.is_err()) {
                echo::warn("error while storing endpoints to ", store_.path().c_str(), ": ",
                           save_res.error().message.c_str());
                return save_res;
            }
            echo::info("stored ", snapshot.size(), " manual endpoints");
            return dp::result::ok();
        }

        /// Add an endpoint at the front, replacing any entry with the same URI
        void add(const Endpoint &endpoint) {
            dp::Vector<Notice> notices;
            Listener *listener = nullptr;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                add_locked(endpoint, notices);
                listener = listener_;
            }
            echo::debug("registry added ", endpoint.to_string().c_str());
            deliver(listener, notices);
        }

        /// Remove the first entry whose URI path matches the target's
        /// @return true if an entry was removed
        bool remove(const Endpoint &target) {
            dp::Vector<Notice> notices;
            Listener *listener = nullptr;
            bool removed = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                for (auto it = endpoints_.begin(); it != endpoints_.end(); ++it) {
                    if (it->same_path(target)) {
                        if (listener_ != nullptr) {
                            notices.push_back(Notice{false, *it});
                        }
                        echo::debug("registry removed ", it->to_string().c_str());
                        endpoints_.erase(it);
                        removed = true;
                        break;
                    }
                }
                listener = listener_;
            }

            if (!removed) {
                echo::trace("registry remove: no entry with path '", target.uri.path.c_str(), "'");
            }
            deliver(listener, notices);
            return removed;
        }

        /// Start signalling changes to listener
        /// @return Snapshot of the entries present when announcing began
        dp::Vector<Endpoint> announce(Listener &listener) {
            std::lock_guard<std::mutex> lock(mutex_);
            listener_ = &listener;
            return endpoints_;
        }

        /// Stop signalling changes
        void silence() {
            std::lock_guard<std::mutex> lock(mutex_);
            listener_ = nullptr;
        }

        bool is_announcing() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return listener_ != nullptr;
        }

        /// Copy of the current entries, most recent first
        dp::Vector<Endpoint> endpoints() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return endpoints_;
        }

        std::optional<Endpoint> find(const Uri &uri) const {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto &endpoint : endpoints_) {
                if (endpoint.uri == uri) {
                    return endpoint;
                }
            }
            return std::nullopt;
        }

        bool contains(const Uri &uri) const { return find(uri).has_value(); }

        dp::usize size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return endpoints_.size();
        }

        bool empty() const { return size() == 0; }

        /// Drop every entry without signalling; the store is untouched until save()
        void clear() {
            std::lock_guard<std::mutex> lock(mutex_);
            endpoints_.clear();
            echo::debug("registry cleared");
        }

        const EndpointStore &store() const { return store_; }
    };

} // namespace printprobe
