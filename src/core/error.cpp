/// @file error.cpp
/// @brief Error handling implementation for uvmask_core
///
/// The error system is template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities

#include <uvmask/core/error.hpp>
#include <sstream>

namespace uvmask_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

const char* storage_error_kind_name(StorageError::Kind kind) {
    switch (kind) {
        case StorageError::Kind::ReadFailed: return "ReadFailed";
        case StorageError::Kind::WriteFailed: return "WriteFailed";
        case StorageError::Kind::Corrupted: return "Corrupted";
        case StorageError::Kind::TooLarge: return "TooLarge";
        case StorageError::Kind::Timeout: return "Timeout";
        case StorageError::Kind::Unavailable: return "Unavailable";
        default: return "Unknown";
    }
}

/// Format storage error with tier and key
std::string format_storage_error(const StorageError& err) {
    std::ostringstream oss;
    oss << "[StorageError:" << storage_error_kind_name(err.kind) << "] " << err.message;

    if (!err.tier.empty()) {
        oss << " (tier: " << err.tier << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, StorageError>) {
            oss << detail::format_storage_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::size_t, Error>;
template class Result<std::string, Error>;

} // namespace uvmask_core
