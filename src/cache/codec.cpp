/// @file codec.cpp
/// @brief CBOR entry codec

#include <uvmask/cache/codec.hpp>

#include <nlohmann/json.hpp>

namespace uvmask_cache {

namespace {

using json = nlohmann::json;

json rect_to_json(const UVRect& rect) {
    return json::array({rect.min_u, rect.min_v, rect.max_u, rect.max_v});
}

UVRect rect_from_json(const json& j) {
    return UVRect{j.at(0).get<float>(), j.at(1).get<float>(), j.at(2).get<float>(), j.at(3).get<float>()};
}

json color_to_json(Color32 c) {
    return json::array({c.r, c.g, c.b, c.a});
}

Color32 color_from_json(const json& j) {
    return Color32{j.at(0).get<std::uint8_t>(), j.at(1).get<std::uint8_t>(),
                   j.at(2).get<std::uint8_t>(), j.at(3).get<std::uint8_t>()};
}

json island_to_json(const UVIsland& island) {
    return json{
        {"id", island.id},
        {"vertices", island.vertex_indices},
        {"triangles", island.triangle_indices},
        {"bounds", rect_to_json(island.bounds)},
        {"color", color_to_json(island.mask_color)},
    };
}

UVIsland island_from_json(const json& j) {
    UVIsland island;
    island.id = j.at("id").get<int>();
    island.vertex_indices = j.at("vertices").get<std::vector<int>>();
    island.triangle_indices = j.at("triangles").get<std::vector<int>>();
    island.bounds = rect_from_json(j.at("bounds"));
    island.mask_color = color_from_json(j.at("color"));
    return island;
}

} // anonymous namespace

std::vector<std::uint8_t> encode_entry(const CacheEntry& entry) {
    json islands = json::array();
    for (const auto& island : entry.islands) {
        islands.push_back(island_to_json(island));
    }

    json j{
        {"version", entry.format_version},
        {"hash", entry.mesh_hash},
        {"timestamp", to_unix_millis(entry.timestamp)},
        {"islands", std::move(islands)},
        {"selected", entry.selected_islands},
        {"preview", json{
            {"width", entry.preview.width()},
            {"height", entry.preview.height()},
            {"pixels", json::binary(entry.preview.rgba())},
        }},
    };

    return json::to_cbor(j);
}

uvmask_core::Result<CacheEntry> decode_entry(
    std::span<const std::uint8_t> bytes,
    const std::string& tier,
    const std::string& key) {

    using uvmask_core::Err;
    using uvmask_core::StorageError;

    if (bytes.empty()) {
        return Err<CacheEntry>(StorageError::corrupted(tier, key, "empty payload"));
    }

    auto j = json::from_cbor(bytes.begin(), bytes.end(), true, false);
    if (j.is_discarded() || !j.is_object()) {
        return Err<CacheEntry>(StorageError::corrupted(tier, key, "malformed CBOR"));
    }

    try {
        CacheEntry entry;
        entry.format_version = j.at("version").get<int>();
        entry.mesh_hash = j.at("hash").get<std::int32_t>();
        entry.timestamp = from_unix_millis(j.at("timestamp").get<std::int64_t>());

        for (const auto& island : j.at("islands")) {
            entry.islands.push_back(island_from_json(island));
        }
        entry.selected_islands = j.at("selected").get<std::vector<int>>();

        const auto& preview = j.at("preview");
        const int width = preview.at("width").get<int>();
        const int height = preview.at("height").get<int>();
        const auto& pixels = preview.at("pixels");
        if (!pixels.is_binary()) {
            return Err<CacheEntry>(StorageError::corrupted(tier, key, "preview pixels are not binary"));
        }

        std::vector<std::uint8_t> rgba(pixels.get_binary().begin(), pixels.get_binary().end());
        if (width > 0 || height > 0) {
            entry.preview = PixelBuffer::from_rgba(width, height, std::move(rgba));
            if (!entry.preview.valid()) {
                return Err<CacheEntry>(StorageError::corrupted(tier, key, "preview size mismatch"));
            }
        }

        if (entry.empty()) {
            return Err<CacheEntry>(StorageError::corrupted(tier, key, "missing format version"));
        }

        return uvmask_core::Ok(std::move(entry));
    } catch (const json::exception& e) {
        return Err<CacheEntry>(StorageError::corrupted(tier, key, e.what()));
    }
}

std::uint32_t compute_checksum(std::span<const std::uint8_t> bytes) {
    std::uint32_t hash = 2166136261u;
    for (auto byte : bytes) {
        hash ^= byte;
        hash *= 16777619u;
    }
    return hash;
}

} // namespace uvmask_cache
