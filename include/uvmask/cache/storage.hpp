#pragma once

/// @file storage.hpp
/// @brief Storage tier abstraction
///
/// A tier is one interchangeable backing store behind UVCache. Entry
/// operations report failures as Result errors; the texture helpers wrap
/// them into the boolean / optional surface used by preview consumers.

#include "fwd.hpp"
#include "types.hpp"

#include <uvmask/core/error.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace uvmask_cache {

/// Abstract storage tier
class CacheStorage {
public:
    virtual ~CacheStorage() = default;

    CacheStorage(const CacheStorage&) = delete;
    CacheStorage& operator=(const CacheStorage&) = delete;

    /// Tier name used in logs and errors
    [[nodiscard]] virtual std::string name() const = 0;

    /// Store an entry, replacing any previous entry for the key
    [[nodiscard]] virtual uvmask_core::Result<void> save(const std::string& key, const CacheEntry& entry) = 0;

    /// Load an entry; an absent key is a successful empty optional
    [[nodiscard]] virtual uvmask_core::Result<std::optional<CacheEntry>> load(const std::string& key) = 0;

    /// Entry metadata without reading the payload
    [[nodiscard]] virtual uvmask_core::Result<std::optional<EntryHeader>> peek(const std::string& key) const = 0;

    /// Cheap existence check
    [[nodiscard]] virtual bool has(const std::string& key) const = 0;

    /// Remove an entry. Missing keys are not an error.
    virtual uvmask_core::Result<void> remove(const std::string& key) = 0;

    /// Remove every entry
    virtual uvmask_core::Result<void> clear() = 0;

    /// Compaction pass: purge entries older than expiry and enforce capacity
    /// @return Number of entries removed
    virtual uvmask_core::Result<std::size_t> optimize(Timestamp now, std::chrono::milliseconds expiry) = 0;

    [[nodiscard]] virtual CacheStatistics statistics() const = 0;

    /// Zero hit/miss/write counters
    virtual void reset_statistics() = 0;

    // -------------------------------------------------------------------------
    // Texture helpers
    // -------------------------------------------------------------------------

    /// Store a bare preview. Returns false if it was not saved.
    bool save_texture(const std::string& key, const PixelBuffer& pixels);

    /// Load the preview stored under key
    [[nodiscard]] std::optional<PixelBuffer> load_texture(const std::string& key);

    [[nodiscard]] bool has_cache(const std::string& key) const { return has(key); }

    /// Idempotent removal of one key
    void clear_cache(const std::string& key);

    /// Idempotent removal of every key
    void clear_all_cache();

    [[nodiscard]] CacheStatistics get_statistics() const { return statistics(); }

    /// Format version stamped on entries created by save_texture()
    [[nodiscard]] int format_version() const noexcept { return m_format_version; }

protected:
    explicit CacheStorage(int format_version = 1) : m_format_version(format_version) {}

private:
    int m_format_version;
};

} // namespace uvmask_cache
