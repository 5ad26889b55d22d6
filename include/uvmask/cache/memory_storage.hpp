#pragma once

/// @file memory_storage.hpp
/// @brief Bounded in-memory storage tier
///
/// Entries are evicted in insertion order once the entry count exceeds the
/// configured capacity. Lookups do not refresh an entry's position and
/// overwriting a key keeps its original position.

#include "storage.hpp"
#include "statistics.hpp"

#include <list>
#include <shared_mutex>
#include <unordered_map>

namespace uvmask_cache {

/// In-memory FIFO storage tier
class MemoryStorage final : public CacheStorage {
public:
    /// Create a tier holding at most max_entries entries
    explicit MemoryStorage(std::size_t max_entries = 100, int format_version = 1);

    /// Create a tier sized from a config
    explicit MemoryStorage(const CacheConfig& config);

    [[nodiscard]] std::string name() const override { return "memory"; }

    [[nodiscard]] uvmask_core::Result<void> save(const std::string& key, const CacheEntry& entry) override;
    [[nodiscard]] uvmask_core::Result<std::optional<CacheEntry>> load(const std::string& key) override;
    [[nodiscard]] uvmask_core::Result<std::optional<EntryHeader>> peek(const std::string& key) const override;
    [[nodiscard]] bool has(const std::string& key) const override;
    uvmask_core::Result<void> remove(const std::string& key) override;
    uvmask_core::Result<void> clear() override;
    uvmask_core::Result<std::size_t> optimize(Timestamp now, std::chrono::milliseconds expiry) override;
    [[nodiscard]] CacheStatistics statistics() const override;
    void reset_statistics() override { m_stats.reset(); }

    /// Current entry count
    [[nodiscard]] std::size_t count() const;

    /// Total approximate footprint of stored entries
    [[nodiscard]] std::size_t size_bytes() const;

    [[nodiscard]] std::size_t capacity() const noexcept { return m_max_entries; }

    /// Keys from oldest to newest insertion
    [[nodiscard]] std::vector<std::string> keys() const;

private:
    struct Node {
        std::string key;
        CacheEntry entry;
        std::size_t size_bytes = 0;
    };

    /// Drop the oldest entries until the count fits capacity
    std::size_t enforce_capacity_unlocked();
    void erase_unlocked(std::list<Node>::iterator it);

    mutable std::shared_mutex m_mutex;
    std::list<Node> m_order;
    std::unordered_map<std::string, std::list<Node>::iterator> m_lookup;
    std::size_t m_max_entries;
    std::size_t m_total_bytes = 0;
    StatisticsTracker m_stats;
};

} // namespace uvmask_cache
