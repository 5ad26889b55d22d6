/// @file statistics.cpp
/// @brief StatisticsTracker implementation

#include <uvmask/cache/statistics.hpp>

namespace uvmask_cache {

void StatisticsTracker::record_hit(std::chrono::duration<double, std::milli> elapsed) {
    std::lock_guard lock(m_mutex);
    ++m_hits;
    record_access(elapsed);
}

void StatisticsTracker::record_miss(std::chrono::duration<double, std::milli> elapsed) {
    std::lock_guard lock(m_mutex);
    ++m_misses;
    record_access(elapsed);
}

void StatisticsTracker::record_write() {
    std::lock_guard lock(m_mutex);
    ++m_writes;
}

void StatisticsTracker::record_eviction(std::uint64_t count) {
    std::lock_guard lock(m_mutex);
    m_evictions += count;
}

void StatisticsTracker::record_access(std::chrono::duration<double, std::milli> elapsed) {
    if (elapsed.count() > 0.0) {
        m_total_access_ms += elapsed.count();
    }
}

CacheStatistics StatisticsTracker::snapshot(std::size_t entry_count, std::size_t total_size_bytes) const {
    std::lock_guard lock(m_mutex);
    CacheStatistics stats;
    stats.entry_count = entry_count;
    stats.total_size_bytes = total_size_bytes;
    stats.hits = m_hits;
    stats.misses = m_misses;
    stats.writes = m_writes;
    stats.evictions = m_evictions;
    const auto reads = m_hits + m_misses;
    stats.average_access_time_ms = reads > 0 ? m_total_access_ms / static_cast<double>(reads) : 0.0;
    return stats;
}

HealthReport StatisticsTracker::evaluate() const {
    return evaluate_health(snapshot(), m_thresholds);
}

void StatisticsTracker::reset() {
    std::lock_guard lock(m_mutex);
    m_hits = 0;
    m_misses = 0;
    m_writes = 0;
    m_evictions = 0;
    m_total_access_ms = 0.0;
}

HealthReport evaluate_health(const CacheStatistics& stats, const HealthThresholds& thresholds) {
    HealthReport report;
    report.samples = stats.samples();
    if (report.samples < thresholds.min_samples) {
        return report;
    }
    report.low_hit_rate = stats.hit_rate() < thresholds.low_hit_rate;
    report.slow_access = stats.average_access_time_ms > thresholds.slow_access_ms;
    return report;
}

} // namespace uvmask_cache
