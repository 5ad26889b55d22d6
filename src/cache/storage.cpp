/// @file storage.cpp
/// @brief CacheStorage texture helpers

#include <uvmask/cache/storage.hpp>
#include <uvmask/core/log.hpp>

namespace uvmask_cache {

bool CacheStorage::save_texture(const std::string& key, const PixelBuffer& pixels) {
    if (key.empty()) {
        UVMASK_LOG_WARN("save_texture called with an empty key");
        return false;
    }
    if (!pixels.valid()) {
        UVMASK_LOG_WARN("save_texture called with invalid dimensions {}x{} for '{}'",
                        pixels.width(), pixels.height(), key);
        return false;
    }

    CacheEntry entry;
    entry.format_version = m_format_version;
    entry.timestamp = std::chrono::floor<std::chrono::milliseconds>(Clock::now());
    entry.preview = pixels;

    auto result = save(key, entry);
    if (!result) {
        UVMASK_LOG_WARN("[{}] {}", name(), uvmask_core::build_error_chain(result.error()));
        return false;
    }
    return true;
}

std::optional<PixelBuffer> CacheStorage::load_texture(const std::string& key) {
    if (key.empty()) {
        return std::nullopt;
    }

    auto result = load(key);
    if (!result) {
        UVMASK_LOG_WARN("[{}] {}", name(), uvmask_core::build_error_chain(result.error()));
        return std::nullopt;
    }
    if (!result->has_value() || !(*result)->preview.valid()) {
        return std::nullopt;
    }
    return std::move((*result)->preview);
}

void CacheStorage::clear_cache(const std::string& key) {
    auto result = remove(key);
    if (!result) {
        UVMASK_LOG_WARN("[{}] {}", name(), uvmask_core::build_error_chain(result.error()));
    }
}

void CacheStorage::clear_all_cache() {
    auto result = clear();
    if (!result) {
        UVMASK_LOG_WARN("[{}] {}", name(), uvmask_core::build_error_chain(result.error()));
    }
}

} // namespace uvmask_cache
