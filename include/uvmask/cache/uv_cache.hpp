#pragma once

/// @file uv_cache.hpp
/// @brief UV island cache facade
///
/// UVCache is the only component consumers talk to. It owns one primary
/// storage tier (injected) and an in-memory fallback tier. Storage failures
/// are retried, then absorbed by the fallback tier; no storage error ever
/// escapes a public operation. The typed store()/lookup()/validate() calls
/// report whether the fallback was used.

#include "fwd.hpp"
#include "config.hpp"
#include "memory_storage.hpp"
#include "statistics.hpp"
#include "storage.hpp"
#include "types.hpp"

#include <uvmask/core/error.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace uvmask_cache {

// =============================================================================
// Outcomes
// =============================================================================

/// How an operation was served
enum class CacheOutcome : std::uint8_t {
    Success,   ///< Primary tier answered
    Degraded,  ///< Primary failed, fallback tier answered
    Failed,    ///< Both tiers failed; the no-op result was returned
};

[[nodiscard]] inline const char* cache_outcome_name(CacheOutcome outcome) {
    switch (outcome) {
        case CacheOutcome::Success: return "Success";
        case CacheOutcome::Degraded: return "Degraded";
        case CacheOutcome::Failed: return "Failed";
        default: return "Unknown";
    }
}

struct StoreReport {
    CacheOutcome outcome = CacheOutcome::Failed;
    /// Sanitized key the entry was stored under
    std::string key;
    /// Primary tier error when degraded or failed
    std::optional<uvmask_core::Error> error;

    [[nodiscard]] bool stored() const { return outcome != CacheOutcome::Failed; }
};

struct LookupReport {
    CacheOutcome outcome = CacheOutcome::Failed;
    /// Empty sentinel on a miss or an invalid entry
    CacheEntry entry;

    [[nodiscard]] bool hit() const { return !entry.empty(); }
};

struct ValidityReport {
    CacheOutcome outcome = CacheOutcome::Failed;
    bool valid = false;
};

/// Per-tier statistics
struct TierStatistics {
    std::string primary_name;
    CacheStatistics primary;
    CacheStatistics fallback;
};

// =============================================================================
// UVCache
// =============================================================================

class UVCache {
public:
    using ClockFn = std::function<Timestamp()>;

    /// @param primary Active storage tier (a null tier is replaced by a memory tier)
    /// @param config Tunables
    /// @param clock Time source for timestamps and expiry (defaults to the system clock)
    explicit UVCache(std::unique_ptr<CacheStorage> primary, CacheConfig config = {}, ClockFn clock = {});

    UVCache(const UVCache&) = delete;
    UVCache& operator=(const UVCache&) = delete;

    // -------------------------------------------------------------------------
    // Typed operations
    // -------------------------------------------------------------------------

    /// Stamp entry with the current format version and time, then store it
    StoreReport store(const std::string& mesh_key, CacheEntry entry);

    /// Load an entry; version mismatch and expiry are reported as a miss
    LookupReport lookup(const std::string& mesh_key);

    /// Check version, mesh hash and expiry without reading the payload
    ValidityReport validate(const std::string& mesh_key, std::int32_t mesh_hash);

    // -------------------------------------------------------------------------
    // Consumer API
    // -------------------------------------------------------------------------

    /// Store analysis results; the mesh hash is derived from the key.
    /// Returns false only if no tier could store the entry.
    bool cache_uv_data(const std::string& mesh_key, const PixelBuffer& preview,
                       const std::vector<UVIsland>& islands, const std::vector<int>& selected);

    /// Store analysis results with an explicit mesh content hash
    bool cache_uv_data(const std::string& mesh_key, const PixelBuffer& preview,
                       const std::vector<UVIsland>& islands, const std::vector<int>& selected,
                       std::int32_t mesh_hash);

    /// Stored entry or the empty sentinel
    [[nodiscard]] CacheEntry load_uv_data(const std::string& mesh_key);

    /// Stored preview. The resolution is only honored when
    /// CacheConfig::regenerate_previews is set.
    [[nodiscard]] std::optional<PixelBuffer> get_preview_texture(const std::string& mesh_key, int resolution = 128);

    [[nodiscard]] bool is_valid_cache(const std::string& mesh_key, std::int32_t mesh_hash);

    /// Remove the entry from every tier; absent keys are fine
    void invalidate_cache(const std::string& mesh_key);

    /// Run each tier's compaction pass
    void optimize_memory_usage();

    /// Aggregate statistics across tiers
    [[nodiscard]] CacheStatistics get_statistics() const;

    [[nodiscard]] TierStatistics tier_statistics() const;

    /// Purge expired / over-budget entries, or everything when forced
    /// @return Number of entries removed
    std::size_t cleanup(bool force = false);

    /// Evaluate hit rate and access time; logs a warning when a threshold is first crossed
    HealthReport check_health();

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] const CacheConfig& config() const noexcept { return m_config; }
    [[nodiscard]] CacheStorage& primary() noexcept { return *m_primary; }
    [[nodiscard]] const CacheStorage& primary() const noexcept { return *m_primary; }
    [[nodiscard]] const MemoryStorage& fallback() const noexcept { return m_fallback; }

    /// Operations served by the fallback tier so far
    [[nodiscard]] std::uint64_t degraded_count() const noexcept { return m_degraded.load(); }

    [[nodiscard]] Timestamp now() const { return m_clock(); }

private:
    [[nodiscard]] std::string storage_key(const std::string& mesh_key) const;

    /// Run a primary-tier call, converting a thrown exception into an
    /// Unavailable error so the fallback path handles it
    template<typename F>
    auto guarded(const char* operation, const std::string& key, F&& func) -> decltype(func());

    template<typename F>
    auto with_retry(const char* operation, const std::string& key, F&& func) -> decltype(func());

    [[nodiscard]] bool is_current(int format_version, Timestamp timestamp, Timestamp now) const;

    void note_degraded(const char* operation, const std::string& key, const uvmask_core::Error& error);

    std::unique_ptr<CacheStorage> m_primary;
    MemoryStorage m_fallback;
    CacheConfig m_config;
    ClockFn m_clock;
    StatisticsTracker m_stats;
    std::atomic<std::uint64_t> m_degraded{0};

    std::mutex m_health_mutex;
    bool m_warned_hit_rate = false;
    bool m_warned_slow_access = false;
};

// =============================================================================
// Factories
// =============================================================================

/// Cache backed by a memory primary tier
[[nodiscard]] std::unique_ptr<UVCache> make_memory_cache(const CacheConfig& config = {});

/// Cache backed by a FileStorage in config.cache_directory; falls back to a
/// memory primary, with a warning, when the directory cannot be opened
[[nodiscard]] std::unique_ptr<UVCache> make_persistent_cache(const CacheConfig& config = {});

} // namespace uvmask_cache
