#pragma once

/// @file statistics.hpp
/// @brief Hit/miss and access time tracking

#include "fwd.hpp"
#include "types.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>

namespace uvmask_cache {

/// Threshold evaluation of a statistics snapshot
struct HealthReport {
    bool low_hit_rate = false;
    bool slow_access = false;
    std::uint64_t samples = 0;

    [[nodiscard]] bool healthy() const { return !low_hit_rate && !slow_access; }
};

/// Thresholds applied by StatisticsTracker::evaluate()
struct HealthThresholds {
    std::uint64_t min_samples = 10;
    double low_hit_rate = 0.5;
    double slow_access_ms = 5.0;
};

/// Thread-safe counters for one tier or facade.
/// Access time is the cumulative mean over every recorded read.
class StatisticsTracker {
public:
    StatisticsTracker() = default;
    explicit StatisticsTracker(HealthThresholds thresholds) : m_thresholds(thresholds) {}

    void record_hit(std::chrono::duration<double, std::milli> elapsed);
    void record_miss(std::chrono::duration<double, std::milli> elapsed);
    void record_write();
    void record_eviction(std::uint64_t count = 1);

    /// Copy of the counters with the given occupancy figures
    [[nodiscard]] CacheStatistics snapshot(std::size_t entry_count, std::size_t total_size_bytes) const;

    /// Counters only (entry_count and total_size_bytes are zero)
    [[nodiscard]] CacheStatistics snapshot() const { return snapshot(0, 0); }

    /// Flags are raised once at least min_samples reads have been recorded
    [[nodiscard]] HealthReport evaluate() const;

    [[nodiscard]] const HealthThresholds& thresholds() const noexcept { return m_thresholds; }

    void reset();

private:
    void record_access(std::chrono::duration<double, std::milli> elapsed);

    mutable std::mutex m_mutex;
    HealthThresholds m_thresholds;
    std::uint64_t m_hits = 0;
    std::uint64_t m_misses = 0;
    std::uint64_t m_writes = 0;
    std::uint64_t m_evictions = 0;
    double m_total_access_ms = 0.0;
};

/// Evaluate an arbitrary snapshot against thresholds
[[nodiscard]] HealthReport evaluate_health(const CacheStatistics& stats, const HealthThresholds& thresholds);

} // namespace uvmask_cache
