#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for uvmask_core module

#include <cstdint>

namespace uvmask_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct StorageError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

} // namespace uvmask_core
