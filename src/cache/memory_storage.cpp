/// @file memory_storage.cpp
/// @brief MemoryStorage implementation

#include <uvmask/cache/memory_storage.hpp>
#include <uvmask/cache/config.hpp>
#include <uvmask/core/log.hpp>

#include <mutex>

namespace uvmask_cache {

namespace {

using Millis = std::chrono::duration<double, std::milli>;

HealthThresholds thresholds_of(const CacheConfig& config) {
    return HealthThresholds{config.min_statistics_samples, config.low_hit_rate_threshold,
                            config.slow_access_threshold_ms};
}

} // anonymous namespace

MemoryStorage::MemoryStorage(std::size_t max_entries, int format_version)
    : CacheStorage(format_version)
    , m_max_entries(max_entries > 0 ? max_entries : 1) {}

MemoryStorage::MemoryStorage(const CacheConfig& config)
    : CacheStorage(config.format_version)
    , m_max_entries(config.max_memory_entries > 0 ? config.max_memory_entries : 1)
    , m_stats(thresholds_of(config)) {}

uvmask_core::Result<void> MemoryStorage::save(const std::string& key, const CacheEntry& entry) {
    std::size_t evicted = 0;
    {
        std::unique_lock lock(m_mutex);

        const auto size = entry.size_bytes();
        auto it = m_lookup.find(key);
        if (it != m_lookup.end()) {
            m_total_bytes -= it->second->size_bytes;
            it->second->entry = entry;
            it->second->size_bytes = size;
        } else {
            m_order.push_back(Node{key, entry, size});
            m_lookup[key] = std::prev(m_order.end());
        }
        m_total_bytes += size;

        evicted = enforce_capacity_unlocked();
    }

    m_stats.record_write();
    if (evicted > 0) {
        m_stats.record_eviction(evicted);
        UVMASK_LOG_DEBUG("[memory] evicted {} entr{} over capacity {}", evicted, evicted == 1 ? "y" : "ies",
                         m_max_entries);
    }
    return uvmask_core::Ok();
}

uvmask_core::Result<std::optional<CacheEntry>> MemoryStorage::load(const std::string& key) {
    const auto start = std::chrono::steady_clock::now();
    std::optional<CacheEntry> found;
    {
        std::shared_lock lock(m_mutex);
        auto it = m_lookup.find(key);
        if (it != m_lookup.end()) {
            found = it->second->entry;
        }
    }

    const Millis elapsed = std::chrono::steady_clock::now() - start;
    if (found) {
        m_stats.record_hit(elapsed);
    } else {
        m_stats.record_miss(elapsed);
    }
    return uvmask_core::Ok(std::move(found));
}

uvmask_core::Result<std::optional<EntryHeader>> MemoryStorage::peek(const std::string& key) const {
    std::shared_lock lock(m_mutex);
    auto it = m_lookup.find(key);
    if (it == m_lookup.end()) {
        return uvmask_core::Ok(std::optional<EntryHeader>{});
    }
    return uvmask_core::Ok(std::optional<EntryHeader>(EntryHeader::of(it->second->entry, it->second->size_bytes)));
}

bool MemoryStorage::has(const std::string& key) const {
    std::shared_lock lock(m_mutex);
    return m_lookup.find(key) != m_lookup.end();
}

uvmask_core::Result<void> MemoryStorage::remove(const std::string& key) {
    std::unique_lock lock(m_mutex);
    auto it = m_lookup.find(key);
    if (it != m_lookup.end()) {
        erase_unlocked(it->second);
    }
    return uvmask_core::Ok();
}

uvmask_core::Result<void> MemoryStorage::clear() {
    std::unique_lock lock(m_mutex);
    m_order.clear();
    m_lookup.clear();
    m_total_bytes = 0;
    return uvmask_core::Ok();
}

uvmask_core::Result<std::size_t> MemoryStorage::optimize(Timestamp now, std::chrono::milliseconds expiry) {
    std::size_t expired = 0;
    std::size_t evicted = 0;
    {
        std::unique_lock lock(m_mutex);
        for (auto it = m_order.begin(); it != m_order.end();) {
            auto next = std::next(it);
            if (it->entry.is_expired(now, expiry)) {
                erase_unlocked(it);
                ++expired;
            }
            it = next;
        }
        evicted = enforce_capacity_unlocked();
    }

    if (evicted > 0) {
        m_stats.record_eviction(evicted);
    }
    if (expired + evicted > 0) {
        UVMASK_LOG_INFO("[memory] optimize removed {} expired and {} over-capacity entries", expired, evicted);
    }
    return uvmask_core::Ok(expired + evicted);
}

CacheStatistics MemoryStorage::statistics() const {
    std::shared_lock lock(m_mutex);
    return m_stats.snapshot(m_lookup.size(), m_total_bytes);
}

std::size_t MemoryStorage::count() const {
    std::shared_lock lock(m_mutex);
    return m_lookup.size();
}

std::size_t MemoryStorage::size_bytes() const {
    std::shared_lock lock(m_mutex);
    return m_total_bytes;
}

std::vector<std::string> MemoryStorage::keys() const {
    std::shared_lock lock(m_mutex);
    std::vector<std::string> result;
    result.reserve(m_order.size());
    for (const auto& node : m_order) {
        result.push_back(node.key);
    }
    return result;
}

std::size_t MemoryStorage::enforce_capacity_unlocked() {
    std::size_t evicted = 0;
    while (m_lookup.size() > m_max_entries && !m_order.empty()) {
        erase_unlocked(m_order.begin());
        ++evicted;
    }
    return evicted;
}

void MemoryStorage::erase_unlocked(std::list<Node>::iterator it) {
    m_total_bytes -= it->size_bytes;
    m_lookup.erase(it->key);
    m_order.erase(it);
}

} // namespace uvmask_cache
