#pragma once

/// @file config.hpp
/// @brief Tunables for the UV island cache

#include "fwd.hpp"

#include <uvmask/core/error.hpp>

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace uvmask_cache {

/// Cache configuration. Every field may be overridden at construction or
/// from a JSON file; missing keys keep the defaults below.
struct CacheConfig {
    /// Memory tier capacity (entries)
    std::size_t max_memory_entries = 100;
    /// Largest single persisted entry
    std::size_t max_file_size_bytes = 10 * 1024 * 1024;
    /// Persistent tier total size that triggers oldest-first cleanup
    std::size_t auto_cleanup_trigger_bytes = 100 * 1024 * 1024;
    std::size_t max_key_length = 200;
    std::chrono::milliseconds expiry = std::chrono::hours(24 * 7);
    std::chrono::milliseconds operation_timeout{5000};
    int retry_attempts = 3;
    std::chrono::milliseconds retry_delay{100};
    int format_version = 1;
    int default_preview_resolution = 128;
    /// Concurrent persistent-tier I/O operations
    std::size_t max_concurrent_operations = 4;

    /// Statistics warnings are suppressed below this sample count
    std::uint64_t min_statistics_samples = 10;
    double low_hit_rate_threshold = 0.5;
    double slow_access_threshold_ms = 5.0;

    std::filesystem::path cache_directory = "Library/UVIslandCache";
    /// Resample stored previews to the requested resolution
    bool regenerate_previews = false;
    std::string log_level = "info";

    /// Reject values that would make the cache unusable
    [[nodiscard]] uvmask_core::Result<void> validate() const;

    /// Parse from a JSON object
    [[nodiscard]] static uvmask_core::Result<CacheConfig> from_json(const nlohmann::json& j);

    /// Serialize to a JSON object
    [[nodiscard]] nlohmann::json to_json() const;

    /// Load from a JSON file
    [[nodiscard]] static uvmask_core::Result<CacheConfig> load(const std::filesystem::path& path);
};

} // namespace uvmask_cache
