/// @file types.cpp
/// @brief Entry model helpers and statistics formatting

#include <uvmask/cache/types.hpp>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace uvmask_cache {

// =============================================================================
// PixelBuffer
// =============================================================================

PixelBuffer::PixelBuffer(int width, int height) {
    if (width <= 0 || height <= 0) {
        return;
    }
    m_width = width;
    m_height = height;
    m_pixels.assign(pixel_count() * k_channels, 0);
}

PixelBuffer PixelBuffer::filled(int width, int height, Color32 color) {
    PixelBuffer buffer(width, height);
    for (std::size_t i = 0; i < buffer.m_pixels.size(); i += k_channels) {
        buffer.m_pixels[i + 0] = color.r;
        buffer.m_pixels[i + 1] = color.g;
        buffer.m_pixels[i + 2] = color.b;
        buffer.m_pixels[i + 3] = color.a;
    }
    return buffer;
}

PixelBuffer PixelBuffer::from_rgba(int width, int height, std::vector<std::uint8_t> rgba) {
    if (width <= 0 || height <= 0) {
        return {};
    }
    const auto expected = static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * k_channels;
    if (rgba.size() != expected) {
        return {};
    }
    PixelBuffer buffer;
    buffer.m_width = width;
    buffer.m_height = height;
    buffer.m_pixels = std::move(rgba);
    return buffer;
}

Color32 PixelBuffer::at(int x, int y) const {
    if (!valid()) {
        return Color32::transparent();
    }
    x = std::clamp(x, 0, m_width - 1);
    y = std::clamp(y, 0, m_height - 1);
    const auto i = (static_cast<std::size_t>(y) * static_cast<std::size_t>(m_width) + static_cast<std::size_t>(x)) * k_channels;
    return Color32{m_pixels[i], m_pixels[i + 1], m_pixels[i + 2], m_pixels[i + 3]};
}

void PixelBuffer::set(int x, int y, Color32 color) {
    if (x < 0 || y < 0 || x >= m_width || y >= m_height) {
        return;
    }
    const auto i = (static_cast<std::size_t>(y) * static_cast<std::size_t>(m_width) + static_cast<std::size_t>(x)) * k_channels;
    m_pixels[i + 0] = color.r;
    m_pixels[i + 1] = color.g;
    m_pixels[i + 2] = color.b;
    m_pixels[i + 3] = color.a;
}

PixelBuffer PixelBuffer::resample(int width, int height) const {
    if (!valid() || width <= 0 || height <= 0) {
        return {};
    }
    if (width == m_width && height == m_height) {
        return *this;
    }

    PixelBuffer out(width, height);
    const float scale_x = static_cast<float>(m_width) / static_cast<float>(width);
    const float scale_y = static_cast<float>(m_height) / static_cast<float>(height);

    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const int sx = static_cast<int>(static_cast<float>(x) * scale_x);
            const int sy = static_cast<int>(static_cast<float>(y) * scale_y);
            out.set(x, y, at(sx, sy));
        }
    }
    return out;
}

// =============================================================================
// CacheEntry
// =============================================================================

std::size_t CacheEntry::size_bytes() const {
    std::size_t total = sizeof(CacheEntry) + preview.size_bytes() + selected_islands.size() * sizeof(int);
    for (const auto& island : islands) {
        total += island.size_bytes();
    }
    return total;
}

// =============================================================================
// Statistics Formatting
// =============================================================================

std::string format_file_size(std::size_t bytes) {
    static constexpr const char* k_units[] = {"B", "KB", "MB", "GB"};
    double len = static_cast<double>(bytes);
    std::size_t order = 0;
    while (len >= 1024.0 && order < 3) {
        ++order;
        len /= 1024.0;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << len << " " << k_units[order];
    return oss.str();
}

std::string format_statistics(const CacheStatistics& stats, const std::string& title) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << title << ":\n";
    oss << "  Entries: " << stats.entry_count << "\n";
    oss << "  Size: " << format_file_size(stats.total_size_bytes) << "\n";
    oss << "  Hits: " << stats.hits << "\n";
    oss << "  Misses: " << stats.misses << "\n";
    oss << "  Hit Rate: " << (stats.hit_rate() * 100.0) << "%\n";
    oss << "  Avg Access: " << stats.average_access_time_ms << " ms\n";
    oss << "  Writes: " << stats.writes << "\n";
    oss << "  Evictions: " << stats.evictions << "\n";
    return oss.str();
}

} // namespace uvmask_cache
