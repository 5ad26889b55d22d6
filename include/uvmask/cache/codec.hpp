#pragma once

/// @file codec.hpp
/// @brief Binary encoding of cache entries (CBOR)

#include "fwd.hpp"
#include "types.hpp"

#include <uvmask/core/error.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace uvmask_cache {

/// Serialize an entry to CBOR bytes
[[nodiscard]] std::vector<std::uint8_t> encode_entry(const CacheEntry& entry);

/// Deserialize an entry. Truncated or malformed input yields
/// StorageError::Kind::Corrupted; this function does not throw.
/// @param tier Tier name recorded in the error
/// @param key Key recorded in the error
[[nodiscard]] uvmask_core::Result<CacheEntry> decode_entry(
    std::span<const std::uint8_t> bytes,
    const std::string& tier = "codec",
    const std::string& key = {});

/// FNV-1a checksum of encoded entry bytes
[[nodiscard]] std::uint32_t compute_checksum(std::span<const std::uint8_t> bytes);

} // namespace uvmask_cache
