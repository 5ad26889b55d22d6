#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for uvmask_cache module

#include <cstdint>

namespace uvmask_cache {

// =============================================================================
// Entry Model
// =============================================================================

struct Color32;
struct UV;
struct UVRect;
class PixelBuffer;
struct UVIsland;
struct CacheEntry;
struct EntryHeader;
struct CacheStatistics;

// =============================================================================
// Keys
// =============================================================================

struct MeshIdentity;
class MeshIdentitySource;

// =============================================================================
// Storage
// =============================================================================

struct CacheConfig;
class StatisticsTracker;
struct HealthReport;
struct HealthThresholds;
class CacheStorage;
class MemoryStorage;
class FileStorage;
class OperationGate;

// =============================================================================
// Facade
// =============================================================================

enum class CacheOutcome : std::uint8_t;
struct StoreReport;
struct LookupReport;
struct ValidityReport;
struct TierStatistics;
class UVCache;

} // namespace uvmask_cache
