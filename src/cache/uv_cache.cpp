/// @file uv_cache.cpp
/// @brief UVCache facade implementation

#include <uvmask/cache/uv_cache.hpp>
#include <uvmask/cache/file_storage.hpp>
#include <uvmask/cache/key.hpp>
#include <uvmask/core/log.hpp>

#include <exception>
#include <thread>

namespace uvmask_cache {

using uvmask_core::build_error_chain;
using uvmask_core::Error;
using uvmask_core::StorageError;

namespace {

using Millis = std::chrono::duration<double, std::milli>;

Timestamp system_now() {
    return Clock::now();
}

HealthThresholds thresholds_of(const CacheConfig& config) {
    return HealthThresholds{config.min_statistics_samples, config.low_hit_rate_threshold,
                            config.slow_access_threshold_ms};
}

} // anonymous namespace

UVCache::UVCache(std::unique_ptr<CacheStorage> primary, CacheConfig config, ClockFn clock)
    : m_primary(std::move(primary))
    , m_fallback(config)
    , m_config(std::move(config))
    , m_clock(clock ? std::move(clock) : ClockFn(system_now))
    , m_stats(thresholds_of(m_config)) {
    if (!m_primary) {
        UVMASK_LOG_WARN("UVCache created without a storage tier, using memory");
        m_primary = std::make_unique<MemoryStorage>(m_config);
    }
    UVMASK_LOG_DEBUG("UVCache ready (primary: {}, format version {})", m_primary->name(), m_config.format_version);
}

std::string UVCache::storage_key(const std::string& mesh_key) const {
    return sanitize_key(mesh_key, m_config.max_key_length);
}

bool UVCache::is_current(int format_version, Timestamp timestamp, Timestamp now) const {
    return format_version == m_config.format_version && (now - timestamp) <= m_config.expiry;
}

template<typename F>
auto UVCache::guarded(const char* operation, const std::string& key, F&& func) -> decltype(func()) {
    using ResultType = decltype(func());
    try {
        return func();
    } catch (const std::exception& e) {
        UVMASK_LOG_ERROR("{}('{}') threw in {} tier: {}", operation, key, m_primary->name(), e.what());
        Error error(StorageError::unavailable(m_primary->name(), std::string(operation) + " threw: " + e.what()));
        error.with_context("key", key);
        return ResultType(std::move(error));
    }
}

template<typename F>
auto UVCache::with_retry(const char* operation, const std::string& key, F&& func) -> decltype(func()) {
    auto result = guarded(operation, key, func);
    for (int attempt = 1; !result && attempt < m_config.retry_attempts; ++attempt) {
        if (!uvmask_core::is_retryable(result.error())) {
            break;
        }
        UVMASK_LOG_WARN("{}('{}') attempt {}/{} failed: {}", operation, key, attempt, m_config.retry_attempts,
                        result.error().message());
        if (m_config.retry_delay.count() > 0) {
            std::this_thread::sleep_for(m_config.retry_delay);
        }
        result = guarded(operation, key, func);
    }
    return result;
}

void UVCache::note_degraded(const char* operation, const std::string& key, const Error& error) {
    ++m_degraded;
    UVMASK_LOG_WARN("{}('{}') falling back to memory: {}", operation, key, build_error_chain(error));
}

// =============================================================================
// Typed operations
// =============================================================================

StoreReport UVCache::store(const std::string& mesh_key, CacheEntry entry) {
    StoreReport report;
    report.key = storage_key(mesh_key);

    entry.format_version = m_config.format_version;
    entry.timestamp = std::chrono::floor<std::chrono::milliseconds>(m_clock());

    auto saved = with_retry("store", report.key, [&] { return m_primary->save(report.key, entry); });
    if (saved) {
        m_stats.record_write();
        // Drop any copy written while the primary was failing
        auto dropped = m_fallback.remove(report.key);
        if (!dropped) {
            UVMASK_LOG_WARN("store('{}') left a stale fallback copy: {}", report.key,
                            build_error_chain(dropped.error()));
        }
        report.outcome = CacheOutcome::Success;
        return report;
    }

    report.error = saved.error();
    note_degraded("store", report.key, saved.error());

    auto fallback_saved = m_fallback.save(report.key, entry);
    if (!fallback_saved) {
        UVMASK_LOG_ERROR("store('{}') failed in every tier: {}", report.key,
                         build_error_chain(fallback_saved.error()));
        report.outcome = CacheOutcome::Failed;
        return report;
    }

    m_stats.record_write();
    report.outcome = CacheOutcome::Degraded;
    return report;
}

LookupReport UVCache::lookup(const std::string& mesh_key) {
    const auto start = std::chrono::steady_clock::now();
    const auto key = storage_key(mesh_key);

    LookupReport report;
    std::optional<CacheEntry> found;

    auto loaded = with_retry("lookup", key, [&] { return m_primary->load(key); });
    if (loaded) {
        report.outcome = CacheOutcome::Success;
        found = std::move(*loaded);
    } else {
        note_degraded("lookup", key, loaded.error());
        report.outcome = CacheOutcome::Degraded;
    }

    if (!found) {
        auto fallback_loaded = m_fallback.load(key);
        if (fallback_loaded) {
            found = std::move(*fallback_loaded);
        } else if (report.outcome == CacheOutcome::Degraded) {
            UVMASK_LOG_ERROR("lookup('{}') failed in every tier: {}", key,
                             build_error_chain(fallback_loaded.error()));
            report.outcome = CacheOutcome::Failed;
        }
    }

    if (found) {
        if (is_current(found->format_version, found->timestamp, m_clock())) {
            report.entry = std::move(*found);
        } else {
            UVMASK_LOG_DEBUG("lookup('{}') ignoring stale entry (version {}, age {} ms)", key,
                             found->format_version, found->age(m_clock()).count());
        }
    }

    const Millis elapsed = std::chrono::steady_clock::now() - start;
    if (report.hit()) {
        m_stats.record_hit(elapsed);
    } else {
        m_stats.record_miss(elapsed);
    }
    UVMASK_LOG_DEBUG("lookup('{}') {} in {:.3f} ms ({})", key, report.hit() ? "hit" : "miss", elapsed.count(),
                     cache_outcome_name(report.outcome));
    check_health();
    return report;
}

ValidityReport UVCache::validate(const std::string& mesh_key, std::int32_t mesh_hash) {
    const auto start = std::chrono::steady_clock::now();
    const auto key = storage_key(mesh_key);

    ValidityReport report;
    std::optional<EntryHeader> header;

    auto peeked = with_retry("validate", key, [&] { return m_primary->peek(key); });
    if (peeked) {
        report.outcome = CacheOutcome::Success;
        header = *peeked;
    } else {
        note_degraded("validate", key, peeked.error());
        report.outcome = CacheOutcome::Degraded;
    }

    if (!header) {
        auto fallback_peeked = m_fallback.peek(key);
        if (fallback_peeked) {
            header = *fallback_peeked;
        } else if (report.outcome == CacheOutcome::Degraded) {
            UVMASK_LOG_ERROR("validate('{}') failed in every tier: {}", key,
                             build_error_chain(fallback_peeked.error()));
            report.outcome = CacheOutcome::Failed;
        }
    }

    report.valid = header && header->mesh_hash == mesh_hash
        && is_current(header->format_version, header->timestamp, m_clock());

    const Millis elapsed = std::chrono::steady_clock::now() - start;
    if (report.valid) {
        m_stats.record_hit(elapsed);
    } else {
        m_stats.record_miss(elapsed);
    }
    check_health();
    return report;
}

// =============================================================================
// Consumer API
// =============================================================================

bool UVCache::cache_uv_data(const std::string& mesh_key, const PixelBuffer& preview,
                            const std::vector<UVIsland>& islands, const std::vector<int>& selected) {
    return cache_uv_data(mesh_key, preview, islands, selected, compute_key_hash(mesh_key));
}

bool UVCache::cache_uv_data(const std::string& mesh_key, const PixelBuffer& preview,
                            const std::vector<UVIsland>& islands, const std::vector<int>& selected,
                            std::int32_t mesh_hash) {
    CacheEntry entry;
    entry.mesh_hash = mesh_hash;
    entry.islands = islands;
    entry.preview = preview;
    entry.selected_islands = selected;
    return store(mesh_key, std::move(entry)).stored();
}

CacheEntry UVCache::load_uv_data(const std::string& mesh_key) {
    return lookup(mesh_key).entry;
}

std::optional<PixelBuffer> UVCache::get_preview_texture(const std::string& mesh_key, int resolution) {
    auto report = lookup(mesh_key);
    if (!report.hit() || !report.entry.preview.valid()) {
        return std::nullopt;
    }

    auto& preview = report.entry.preview;
    if (m_config.regenerate_previews && resolution > 0
        && (preview.width() != resolution || preview.height() != resolution)) {
        return preview.resample(resolution, resolution);
    }
    return std::move(preview);
}

bool UVCache::is_valid_cache(const std::string& mesh_key, std::int32_t mesh_hash) {
    return validate(mesh_key, mesh_hash).valid;
}

void UVCache::invalidate_cache(const std::string& mesh_key) {
    const auto key = storage_key(mesh_key);

    auto removed = with_retry("invalidate", key, [&] { return m_primary->remove(key); });
    if (!removed) {
        note_degraded("invalidate", key, removed.error());
    }

    auto fallback_removed = m_fallback.remove(key);
    if (!fallback_removed) {
        UVMASK_LOG_ERROR("invalidate('{}') failed in fallback tier: {}", key,
                         build_error_chain(fallback_removed.error()));
    }
}

void UVCache::optimize_memory_usage() {
    const auto now = m_clock();

    auto optimized = with_retry("optimize", m_primary->name(), [&] { return m_primary->optimize(now, m_config.expiry); });
    if (!optimized) {
        UVMASK_LOG_WARN("optimize({}) failed: {}", m_primary->name(), build_error_chain(optimized.error()));
    }

    auto fallback_optimized = m_fallback.optimize(now, m_config.expiry);
    if (!fallback_optimized) {
        UVMASK_LOG_ERROR("optimize(memory) failed: {}", build_error_chain(fallback_optimized.error()));
    }
}

CacheStatistics UVCache::get_statistics() const {
    const auto primary = m_primary->statistics();
    const auto fallback = m_fallback.statistics();

    auto stats = m_stats.snapshot(primary.entry_count + fallback.entry_count,
                                  primary.total_size_bytes + fallback.total_size_bytes);
    stats.evictions = primary.evictions + fallback.evictions;
    return stats;
}

TierStatistics UVCache::tier_statistics() const {
    return TierStatistics{m_primary->name(), m_primary->statistics(), m_fallback.statistics()};
}

std::size_t UVCache::cleanup(bool force) {
    if (!force) {
        const auto now = m_clock();
        std::size_t removed = 0;

        auto optimized = guarded("cleanup", m_primary->name(), [&] { return m_primary->optimize(now, m_config.expiry); });
        if (optimized) {
            removed += *optimized;
        } else {
            UVMASK_LOG_WARN("cleanup({}) failed: {}", m_primary->name(), build_error_chain(optimized.error()));
        }

        auto fallback_optimized = m_fallback.optimize(now, m_config.expiry);
        if (fallback_optimized) {
            removed += *fallback_optimized;
        }

        UVMASK_LOG_INFO("Cache cleanup removed {} entries", removed);
        return removed;
    }

    const auto before = m_primary->statistics().entry_count + m_fallback.statistics().entry_count;

    auto cleared = guarded("clear", m_primary->name(), [&] { return m_primary->clear(); });
    if (!cleared) {
        UVMASK_LOG_WARN("clear({}) failed: {}", m_primary->name(), build_error_chain(cleared.error()));
    }
    auto fallback_cleared = m_fallback.clear();
    if (!fallback_cleared) {
        UVMASK_LOG_ERROR("clear(memory) failed: {}", build_error_chain(fallback_cleared.error()));
    }

    const auto after = m_primary->statistics().entry_count + m_fallback.statistics().entry_count;
    const auto removed = before > after ? before - after : 0;
    UVMASK_LOG_INFO("Forced cache cleanup removed {} entries", removed);
    return removed;
}

HealthReport UVCache::check_health() {
    const auto report = m_stats.evaluate();

    std::lock_guard lock(m_health_mutex);
    if (report.low_hit_rate && !m_warned_hit_rate) {
        const auto stats = m_stats.snapshot();
        UVMASK_LOG_WARN("Low cache hit rate: {:.1f}% over {} lookups", stats.hit_rate() * 100.0, report.samples);
    }
    if (report.slow_access && !m_warned_slow_access) {
        const auto stats = m_stats.snapshot();
        UVMASK_LOG_WARN("Slow cache access: {:.2f} ms average", stats.average_access_time_ms);
    }
    m_warned_hit_rate = report.low_hit_rate;
    m_warned_slow_access = report.slow_access;
    return report;
}

// =============================================================================
// Factories
// =============================================================================

std::unique_ptr<UVCache> make_memory_cache(const CacheConfig& config) {
    return std::make_unique<UVCache>(std::make_unique<MemoryStorage>(config), config);
}

std::unique_ptr<UVCache> make_persistent_cache(const CacheConfig& config) {
    auto storage = FileStorage::open(config.cache_directory, config);
    if (!storage) {
        UVMASK_LOG_WARN("Persistent cache unavailable, using memory: {}", build_error_chain(storage.error()));
        return make_memory_cache(config);
    }
    return std::make_unique<UVCache>(std::move(*storage), config);
}

} // namespace uvmask_cache
