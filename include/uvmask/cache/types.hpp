#pragma once

/// @file types.hpp
/// @brief Entry model for the UV island cache
///
/// A CacheEntry is the unit stored per cache key: the island partition of a
/// mesh, a rasterized preview and the islands the user had selected, tagged
/// with a format version, a mesh content hash and a creation timestamp.

#include "fwd.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace uvmask_cache {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/// Milliseconds since the Unix epoch (persisted timestamp form)
[[nodiscard]] inline std::int64_t to_unix_millis(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

[[nodiscard]] inline Timestamp from_unix_millis(std::int64_t millis) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(millis)));
}

// =============================================================================
// Pixel Data
// =============================================================================

/// 8-bit RGBA color
struct Color32 {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;

    bool operator==(const Color32&) const = default;

    [[nodiscard]] static constexpr Color32 gray() { return {128, 128, 128, 255}; }
    [[nodiscard]] static constexpr Color32 transparent() { return {0, 0, 0, 0}; }
};

/// Two-dimensional RGBA8 pixel buffer (row-major, origin at bottom-left)
class PixelBuffer {
public:
    static constexpr std::size_t k_channels = 4;

    PixelBuffer() = default;

    /// Create a transparent buffer
    PixelBuffer(int width, int height);

    /// Create a buffer filled with one color
    [[nodiscard]] static PixelBuffer filled(int width, int height, Color32 color);

    /// Wrap raw RGBA8 bytes; returns an empty buffer if the size does not match
    [[nodiscard]] static PixelBuffer from_rgba(int width, int height, std::vector<std::uint8_t> rgba);

    [[nodiscard]] int width() const noexcept { return m_width; }
    [[nodiscard]] int height() const noexcept { return m_height; }

    /// True if the buffer has positive dimensions
    [[nodiscard]] bool valid() const noexcept { return m_width > 0 && m_height > 0; }

    [[nodiscard]] std::size_t pixel_count() const noexcept {
        return static_cast<std::size_t>(m_width) * static_cast<std::size_t>(m_height);
    }

    [[nodiscard]] std::size_t size_bytes() const noexcept { return m_pixels.size(); }

    [[nodiscard]] const std::vector<std::uint8_t>& rgba() const noexcept { return m_pixels; }

    /// Read a pixel (coordinates are clamped to the buffer)
    [[nodiscard]] Color32 at(int x, int y) const;

    /// Write a pixel; out-of-range coordinates are ignored
    void set(int x, int y, Color32 color);

    /// Nearest-neighbour resample to a new size
    [[nodiscard]] PixelBuffer resample(int width, int height) const;

    bool operator==(const PixelBuffer&) const = default;

private:
    int m_width = 0;
    int m_height = 0;
    std::vector<std::uint8_t> m_pixels;
};

// =============================================================================
// UV Islands
// =============================================================================

/// UV-space coordinate
struct UV {
    float u = 0.0f;
    float v = 0.0f;

    bool operator==(const UV&) const = default;
};

/// Axis-aligned rectangle in UV space
struct UVRect {
    float min_u = 0.0f;
    float min_v = 0.0f;
    float max_u = 0.0f;
    float max_v = 0.0f;

    [[nodiscard]] float width() const { return max_u - min_u; }
    [[nodiscard]] float height() const { return max_v - min_v; }

    [[nodiscard]] bool contains(UV p) const {
        return p.u >= min_u && p.u <= max_u && p.v >= min_v && p.v <= max_v;
    }

    bool operator==(const UVRect&) const = default;
};

/// One connected component of a mesh in UV space
struct UVIsland {
    int id = 0;
    std::vector<int> vertex_indices;
    std::vector<int> triangle_indices;
    UVRect bounds;
    Color32 mask_color;

    [[nodiscard]] std::size_t face_count() const { return triangle_indices.size(); }
    [[nodiscard]] bool valid() const { return !vertex_indices.empty(); }

    /// Approximate in-memory footprint
    [[nodiscard]] std::size_t size_bytes() const {
        return sizeof(UVIsland) + (vertex_indices.size() + triangle_indices.size()) * sizeof(int);
    }

    bool operator==(const UVIsland&) const = default;
};

// =============================================================================
// Cache Entry
// =============================================================================

/// Stored unit per cache key. A default-constructed entry is the empty sentinel.
struct CacheEntry {
    int format_version = 0;
    std::int32_t mesh_hash = 0;
    Timestamp timestamp{};
    std::vector<UVIsland> islands;
    PixelBuffer preview;
    std::vector<int> selected_islands;

    /// True for the empty sentinel returned on a miss
    [[nodiscard]] bool empty() const noexcept { return format_version == 0; }

    [[nodiscard]] std::chrono::milliseconds age(Timestamp now) const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - timestamp);
    }

    [[nodiscard]] bool is_expired(Timestamp now, std::chrono::milliseconds expiry) const {
        return age(now) > expiry;
    }

    /// Approximate in-memory footprint
    [[nodiscard]] std::size_t size_bytes() const;

    bool operator==(const CacheEntry&) const = default;
};

/// Entry metadata kept without the payload (persistent index record)
struct EntryHeader {
    int format_version = 0;
    std::int32_t mesh_hash = 0;
    Timestamp timestamp{};
    std::size_t size_bytes = 0;
    /// Checksum of the stored bytes, when the tier records one
    std::optional<std::uint32_t> checksum;

    [[nodiscard]] static EntryHeader of(const CacheEntry& entry, std::size_t size,
                                        std::optional<std::uint32_t> checksum = std::nullopt) {
        return EntryHeader{entry.format_version, entry.mesh_hash, entry.timestamp, size, checksum};
    }

    [[nodiscard]] bool is_expired(Timestamp now, std::chrono::milliseconds expiry) const {
        return (now - timestamp) > expiry;
    }

    bool operator==(const EntryHeader&) const = default;
};

// =============================================================================
// Statistics
// =============================================================================

/// Per-tier aggregate statistics
struct CacheStatistics {
    std::size_t entry_count = 0;
    std::size_t total_size_bytes = 0;
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t writes = 0;
    std::uint64_t evictions = 0;
    double average_access_time_ms = 0.0;

    [[nodiscard]] std::uint64_t samples() const { return hits + misses; }

    [[nodiscard]] double hit_rate() const {
        const auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }
};

/// Human readable statistics block
std::string format_statistics(const CacheStatistics& stats, const std::string& title);

/// Format a byte count as B / KB / MB / GB
std::string format_file_size(std::size_t bytes);

} // namespace uvmask_cache
