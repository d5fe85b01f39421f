#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace mesh_cpp {

    /// @brief Metrics for monitoring an IdleCache
    struct IdleCacheMetrics {
        // Gauges (current state)
        std::atomic<std::size_t> entries{0};       ///< Live entries
        std::atomic<std::size_t> live_handles{0};  ///< Handles not yet released

        // Counters (cumulative)
        std::atomic<std::uint64_t> entries_created{0};  ///< Lazily built
        std::atomic<std::uint64_t> entries_evicted{0};  ///< Removed after idle
        std::atomic<std::uint64_t> handles_acquired{0};
        std::atomic<std::uint64_t> handles_released{0};
    };

    /// @brief Metrics shared by every discovery queue of one cache
    struct DiscoveryMetrics {
        std::atomic<std::uint64_t> discoveries_started{0};  ///< Raw lookups
        std::atomic<std::uint64_t> discoveries_failed{0};
        std::atomic<std::uint64_t> calls_served{0};    ///< Got value or error
        std::atomic<std::uint64_t> calls_rejected{0};  ///< Queue was full
    };

}  // namespace mesh_cpp
