#pragma once

#include <atomic>
#include <datapod/datapod.hpp>

namespace printprobe {

    /// Counters for manual-add probing
    struct ProbeMetrics {
        // Probe outcomes
        std::atomic<dp::u64> probes_started{0};
        std::atomic<dp::u64> found_supported{0};
        std::atomic<dp::u64> found_unsupported{0};
        std::atomic<dp::u64> not_found{0};
        std::atomic<dp::u64> cancelled{0};

        // Per-path lookups
        std::atomic<dp::u64> lookups_issued{0};
        std::atomic<dp::u64> lookup_misses{0};

        /// Reset all metrics to zero
        inline void reset() {
            probes_started = 0;
            found_supported = 0;
            found_unsupported = 0;
            not_found = 0;
            cancelled = 0;
            lookups_issued = 0;
            lookup_misses = 0;
        }

        /// Probes that finished with any answer
        inline dp::u64 found() const { return found_supported.load() + found_unsupported.load(); }

        /// Fraction of finished probes that found something (0.0 to 1.0)
        inline double hit_rate() const {
            dp::u64 finished = found() + not_found.load();
            if (finished == 0)
                return 0.0;
            return static_cast<double>(found()) / static_cast<double>(finished);
        }

        /// Average lookups needed per started probe
        inline double avg_lookups_per_probe() const {
            dp::u64 started = probes_started.load();
            if (started == 0)
                return 0.0;
            return static_cast<double>(lookups_issued.load()) / static_cast<double>(started);
        }
    };

} // namespace printprobe
