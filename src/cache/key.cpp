/// @file key.cpp
/// @brief Cache key codec and mesh hashing

#include <uvmask/cache/key.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>

namespace uvmask_cache {

namespace {

constexpr std::string_view k_reserved_chars = "/\\:*?\"<>|";
constexpr std::size_t k_max_hash_samples = 100;

std::uint32_t float_bits(float value) {
    // Fold -0.0 into 0.0 so equal coordinates hash equally
    if (value == 0.0f) {
        value = 0.0f;
    }
    std::uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    return bits;
}

/// Length of the well-formed UTF-8 sequence starting at pos, or 0 if the
/// bytes there are not valid UTF-8 (overlong forms and surrogates included)
std::size_t utf8_sequence_length(std::string_view text, std::size_t pos) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    if (lead < 0x80) {
        return 1;
    }

    std::size_t length = 0;
    unsigned char second_min = 0x80;
    unsigned char second_max = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) {
            second_min = 0xA0;
        } else if (lead == 0xED) {
            second_max = 0x9F;
        }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) {
            second_min = 0x90;
        } else if (lead == 0xF4) {
            second_max = 0x8F;
        }
    } else {
        return 0;
    }

    if (pos + length > text.size()) {
        return 0;
    }
    const auto second = static_cast<unsigned char>(text[pos + 1]);
    if (second < second_min || second > second_max) {
        return 0;
    }
    for (std::size_t i = 2; i < length; ++i) {
        const auto next = static_cast<unsigned char>(text[pos + i]);
        if (next < 0x80 || next > 0xBF) {
            return 0;
        }
    }
    return length;
}

} // anonymous namespace

std::string sanitize_key(std::string_view raw, std::size_t max_length) {
    if (raw.empty() || max_length == 0) {
        return std::string(k_empty_key);
    }

    std::string sanitized;
    sanitized.reserve(std::min(raw.size(), max_length));

    std::size_t pos = 0;
    while (pos < raw.size()) {
        std::size_t length = utf8_sequence_length(raw, pos);
        if (length == 0) {
            // Invalid byte
            if (sanitized.size() + 1 > max_length) {
                break;
            }
            sanitized += '_';
            ++pos;
            continue;
        }
        // Never split a code point
        if (sanitized.size() + length > max_length) {
            break;
        }
        if (length == 1 && k_reserved_chars.find(raw[pos]) != std::string_view::npos) {
            sanitized += '_';
        } else {
            sanitized.append(raw, pos, length);
        }
        pos += length;
    }

    if (sanitized.empty()) {
        return std::string(k_empty_key);
    }
    return sanitized;
}

std::string derive_key(const MeshIdentity& mesh, std::size_t max_length) {
    std::string raw;
    raw.reserve(mesh.name.size() + 24);
    raw += mesh.name.empty() ? std::string(k_unnamed_mesh) : mesh.name;
    raw += '_';
    raw += std::to_string(mesh.instance_id);
    raw += '_';
    raw += std::to_string(mesh.vertex_count);
    return sanitize_key(raw, max_length);
}

std::string derive_key(const MeshIdentitySource* mesh, std::size_t max_length) {
    if (mesh == nullptr) {
        return std::string(k_invalid_mesh_key);
    }
    return derive_key(mesh->identity(), max_length);
}

std::int32_t compute_mesh_hash(std::span<const UV> uvs) {
    if (uvs.empty()) {
        return 1;
    }

    std::uint32_t hash = 17;
    const std::size_t step = std::max<std::size_t>(1, uvs.size() / k_max_hash_samples);
    std::size_t samples = 0;

    for (std::size_t i = 0; i < uvs.size() && samples < k_max_hash_samples; i += step) {
        const auto& uv = uvs[i];
        if (!std::isfinite(uv.u) || !std::isfinite(uv.v)) {
            continue;
        }
        const std::uint32_t uv_hash = float_bits(uv.u) ^ (float_bits(uv.v) << 2);
        hash = hash * 31u + uv_hash;
        ++samples;
    }

    hash = hash * 31u + static_cast<std::uint32_t>(uvs.size());
    return static_cast<std::int32_t>(hash);
}

std::int32_t compute_mesh_hash(const MeshIdentitySource& mesh) {
    return compute_mesh_hash(mesh.uvs());
}

std::int32_t compute_key_hash(std::string_view key) {
    constexpr std::uint32_t k_fnv_offset_basis = 2166136261u;
    constexpr std::uint32_t k_fnv_prime = 16777619u;

    std::uint32_t hash = k_fnv_offset_basis;
    for (char c : key) {
        hash ^= static_cast<std::uint8_t>(c);
        hash *= k_fnv_prime;
    }
    return static_cast<std::int32_t>(hash);
}

} // namespace uvmask_cache
