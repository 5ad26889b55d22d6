#pragma once

/// @file key.hpp
/// @brief Cache key derivation and mesh fingerprinting
///
/// Keys have the form "{name}_{instanceId}_{vertexCount}" and are made
/// filesystem-safe by sanitize_key(). All functions here are pure and need
/// no synchronization.

#include "fwd.hpp"
#include "types.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace uvmask_cache {

/// Returned by sanitize_key() for an empty input
inline constexpr std::string_view k_empty_key = "empty_key";
/// Returned by derive_key() when there is no mesh
inline constexpr std::string_view k_invalid_mesh_key = "invalid_mesh";
/// Substituted for an empty mesh name
inline constexpr std::string_view k_unnamed_mesh = "unnamed_mesh";
inline constexpr std::size_t k_default_max_key_length = 200;

/// Identity fields of a mesh
struct MeshIdentity {
    std::string name;
    std::int32_t instance_id = 0;
    std::int32_t vertex_count = 0;
};

/// Narrow view of a host mesh object. Host adapters implement this so the
/// cache never depends on host types.
class MeshIdentitySource {
public:
    virtual ~MeshIdentitySource() = default;

    [[nodiscard]] virtual std::string mesh_name() const = 0;
    [[nodiscard]] virtual std::int32_t instance_id() const = 0;
    [[nodiscard]] virtual std::int32_t vertex_count() const = 0;

    /// UV coordinates of the first channel (may be empty)
    [[nodiscard]] virtual std::span<const UV> uvs() const = 0;

    [[nodiscard]] MeshIdentity identity() const {
        return MeshIdentity{mesh_name(), instance_id(), vertex_count()};
    }
};

/// Replace / \ : * ? " < > | and invalid UTF-8 bytes with '_', then truncate
/// to max_length bytes on a code point boundary. Never returns an empty string.
[[nodiscard]] std::string sanitize_key(std::string_view raw, std::size_t max_length = k_default_max_key_length);

/// Build and sanitize the key for a mesh identity
[[nodiscard]] std::string derive_key(const MeshIdentity& mesh, std::size_t max_length = k_default_max_key_length);

/// Build the key for a host mesh; a null source yields "invalid_mesh"
[[nodiscard]] std::string derive_key(const MeshIdentitySource* mesh, std::size_t max_length = k_default_max_key_length);

/// Sampled fingerprint of UV content (at most 100 samples, non-finite
/// coordinates skipped, element count folded in). Empty input yields 1.
[[nodiscard]] std::int32_t compute_mesh_hash(std::span<const UV> uvs);

/// Fingerprint of a host mesh's UV content
[[nodiscard]] std::int32_t compute_mesh_hash(const MeshIdentitySource& mesh);

/// Stable FNV-1a hash of a key
[[nodiscard]] std::int32_t compute_key_hash(std::string_view key);

} // namespace uvmask_cache
