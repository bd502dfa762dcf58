#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <printprobe/printprobe.hpp>
#include <thread>

// Simulated capability lookup answering from a worker thread
// Every host "answers" at /ipp/print; hosts starting with "scan" are reported unsupported.
class SimulatedLookup : public printprobe::CapabilityLookup {
  private:
    struct Job {
        printprobe::Endpoint endpoint;
        printprobe::CapabilitiesHandler handler;
    };

    std::deque<Job> jobs_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_;
    std::thread worker_;

    void worker_loop() {
        while (true) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [&] { return !jobs_.empty() || !running_; });
                if (jobs_.empty()) {
                    break;
                }
                job = std::move(jobs_.front());
                jobs_.pop_front();
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            if (job.endpoint.uri.path != "/ipp/print") {
                echo::debug("simulated: no answer at ", job.endpoint.uri.to_string().c_str());
                job.handler(std::nullopt);
                continue;
            }

            printprobe::Capabilities caps;
            caps.path = job.endpoint.uri.host + "/ipp/print";
            caps.supported = job.endpoint.uri.host.find("scan") != 0;
            job.handler(caps);
        }
    }

  public:
    SimulatedLookup() : running_(true) { worker_ = std::thread(&SimulatedLookup::worker_loop, this); }

    ~SimulatedLookup() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        cv_.notify_one();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    void request(const printprobe::Endpoint &endpoint, bool, printprobe::CapabilitiesHandler handler) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            jobs_.push_back(Job{endpoint, std::move(handler)});
        }
        cv_.notify_one();
    }

    void evict_on_network_change(const printprobe::Uri &uri) override {
        echo::debug("simulated: evicting ", uri.to_string().c_str());
    }
};

class LoggingListener : public printprobe::Listener {
  public:
    void on_endpoint_found(const printprobe::Endpoint &endpoint) override {
        echo::info("found: ", endpoint.to_string().c_str());
    }

    void on_endpoint_lost(const printprobe::Uri &uri) override { echo::info("lost: ", uri.to_string().c_str()); }
};

int main(int argc, char **argv) {
    echo::info("Manual discovery example starting...");

    printprobe::DiscoveryConfig config;
    if (argc > 1) {
        config.cache_dir = dp::String(argv[1]);
    }

    SimulatedLookup lookup;
    LoggingListener listener;
    std::atomic<int> outstanding{0};

    {
        printprobe::ManualDiscovery discovery(config, lookup, listener);
        echo::info("Loaded ", discovery.endpoints().size(), " manual endpoints from ",
                   config.store_path().c_str());
        discovery.start();

        const char *hosts[] = {"office-printer.local", "scanner.local", "192.168.1.40:8631"};
        for (const char *host : hosts) {
            outstanding++;
            discovery.add_manual_endpoint(dp::String(host), [&, host](const printprobe::ProbeOutcome &outcome) {
                if (outcome.found()) {
                    echo::info(host, " -> ", outcome.endpoint->uri.to_string().c_str(), " (",
                               printprobe::to_string(outcome.status), ")");
                } else {
                    echo::warn(host, " -> not found");
                }
                outstanding--;
            });
        }

        while (outstanding.load() > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        const auto &metrics = discovery.metrics();
        echo::info("Probes: ", metrics.probes_started.load(), ", lookups: ", metrics.lookups_issued.load(),
                   ", hit rate: ", metrics.hit_rate());

        discovery.stop();
        auto close_res = discovery.close();
        if (close_res.is_err()) {
            echo::error("Failed to save: ", close_res.error().message.c_str());
            return 1;
        }
    }

    echo::info("Example shutting down");
    return 0;
}
