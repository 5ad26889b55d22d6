/// @file config.cpp
/// @brief CacheConfig JSON loading

#include <uvmask/cache/config.hpp>
#include <uvmask/core/log.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace uvmask_cache {

namespace {

using uvmask_core::Err;
using uvmask_core::Error;
using uvmask_core::ErrorCode;

Error type_error(const std::string& key, const char* expected) {
    return Error(ErrorCode::ParseError, "Config key '" + key + "' must be " + expected);
}

bool is_non_negative_integer(const nlohmann::json& value) {
    return value.is_number_unsigned() || (value.is_number_integer() && value.get<std::int64_t>() >= 0);
}

/// Read an unsigned size field if present
bool read_size(const nlohmann::json& j, const std::string& key, std::size_t& out, Error& err) {
    if (!j.contains(key)) return true;
    if (!is_non_negative_integer(j[key])) {
        err = type_error(key, "a non-negative integer");
        return false;
    }
    out = j[key].get<std::size_t>();
    return true;
}

bool read_int(const nlohmann::json& j, const std::string& key, int& out, Error& err) {
    if (!j.contains(key)) return true;
    if (!j[key].is_number_integer()) {
        err = type_error(key, "an integer");
        return false;
    }
    out = j[key].get<int>();
    return true;
}

bool read_ms(const nlohmann::json& j, const std::string& key, std::chrono::milliseconds& out, Error& err) {
    if (!j.contains(key)) return true;
    if (!j[key].is_number_integer()) {
        err = type_error(key, "an integer number of milliseconds");
        return false;
    }
    out = std::chrono::milliseconds(j[key].get<std::int64_t>());
    return true;
}

bool read_double(const nlohmann::json& j, const std::string& key, double& out, Error& err) {
    if (!j.contains(key)) return true;
    if (!j[key].is_number()) {
        err = type_error(key, "a number");
        return false;
    }
    out = j[key].get<double>();
    return true;
}

} // anonymous namespace

uvmask_core::Result<void> CacheConfig::validate() const {
    if (max_memory_entries == 0) {
        return Err(Error(ErrorCode::InvalidArgument, "max_memory_entries must be positive"));
    }
    if (max_key_length == 0) {
        return Err(Error(ErrorCode::InvalidArgument, "max_key_length must be positive"));
    }
    if (retry_attempts < 1) {
        return Err(Error(ErrorCode::InvalidArgument, "retry_attempts must be at least 1"));
    }
    if (max_concurrent_operations == 0) {
        return Err(Error(ErrorCode::InvalidArgument, "max_concurrent_operations must be positive"));
    }
    if (format_version < 1) {
        return Err(Error(ErrorCode::InvalidArgument, "format_version must be at least 1"));
    }
    if (default_preview_resolution <= 0) {
        return Err(Error(ErrorCode::InvalidArgument, "default_preview_resolution must be positive"));
    }
    if (retry_delay.count() < 0 || operation_timeout.count() < 0 || expiry.count() < 0) {
        return Err(Error(ErrorCode::InvalidArgument, "durations must not be negative"));
    }
    return uvmask_core::Ok();
}

uvmask_core::Result<CacheConfig> CacheConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Err<CacheConfig>(Error(ErrorCode::ParseError, "Cache config must be a JSON object"));
    }

    CacheConfig config;
    Error err;

    std::int64_t expiry_days = -1;
    if (j.contains("expiry_days")) {
        if (!j["expiry_days"].is_number_integer()) {
            return Err<CacheConfig>(type_error("expiry_days", "an integer"));
        }
        expiry_days = j["expiry_days"].get<std::int64_t>();
    }

    bool ok = read_size(j, "max_memory_entries", config.max_memory_entries, err)
        && read_size(j, "max_file_size_bytes", config.max_file_size_bytes, err)
        && read_size(j, "auto_cleanup_trigger_bytes", config.auto_cleanup_trigger_bytes, err)
        && read_size(j, "max_key_length", config.max_key_length, err)
        && read_size(j, "max_concurrent_operations", config.max_concurrent_operations, err)
        && read_ms(j, "expiry_ms", config.expiry, err)
        && read_ms(j, "operation_timeout_ms", config.operation_timeout, err)
        && read_ms(j, "retry_delay_ms", config.retry_delay, err)
        && read_int(j, "retry_attempts", config.retry_attempts, err)
        && read_int(j, "format_version", config.format_version, err)
        && read_int(j, "default_preview_resolution", config.default_preview_resolution, err)
        && read_double(j, "low_hit_rate_threshold", config.low_hit_rate_threshold, err)
        && read_double(j, "slow_access_threshold_ms", config.slow_access_threshold_ms, err);
    if (!ok) {
        return Err<CacheConfig>(err);
    }

    if (expiry_days >= 0) {
        config.expiry = std::chrono::hours(24 * expiry_days);
    }

    if (j.contains("min_statistics_samples")) {
        if (!is_non_negative_integer(j["min_statistics_samples"])) {
            return Err<CacheConfig>(type_error("min_statistics_samples", "a non-negative integer"));
        }
        config.min_statistics_samples = j["min_statistics_samples"].get<std::uint64_t>();
    }

    if (j.contains("cache_directory")) {
        if (!j["cache_directory"].is_string()) {
            return Err<CacheConfig>(type_error("cache_directory", "a string"));
        }
        config.cache_directory = j["cache_directory"].get<std::string>();
    }

    if (j.contains("regenerate_previews")) {
        if (!j["regenerate_previews"].is_boolean()) {
            return Err<CacheConfig>(type_error("regenerate_previews", "a boolean"));
        }
        config.regenerate_previews = j["regenerate_previews"].get<bool>();
    }

    if (j.contains("log_level")) {
        if (!j["log_level"].is_string()) {
            return Err<CacheConfig>(type_error("log_level", "a string"));
        }
        config.log_level = j["log_level"].get<std::string>();
        if (!uvmask_core::parse_log_level(config.log_level)) {
            return Err<CacheConfig>(Error(ErrorCode::ParseError, "Unknown log_level: " + config.log_level));
        }
    }

    auto valid = config.validate();
    if (!valid) {
        return Err<CacheConfig>(valid.error());
    }

    return uvmask_core::Ok(std::move(config));
}

nlohmann::json CacheConfig::to_json() const {
    nlohmann::json j;
    j["max_memory_entries"] = max_memory_entries;
    j["max_file_size_bytes"] = max_file_size_bytes;
    j["auto_cleanup_trigger_bytes"] = auto_cleanup_trigger_bytes;
    j["max_key_length"] = max_key_length;
    j["expiry_ms"] = expiry.count();
    j["operation_timeout_ms"] = operation_timeout.count();
    j["retry_attempts"] = retry_attempts;
    j["retry_delay_ms"] = retry_delay.count();
    j["format_version"] = format_version;
    j["default_preview_resolution"] = default_preview_resolution;
    j["max_concurrent_operations"] = max_concurrent_operations;
    j["min_statistics_samples"] = min_statistics_samples;
    j["low_hit_rate_threshold"] = low_hit_rate_threshold;
    j["slow_access_threshold_ms"] = slow_access_threshold_ms;
    j["cache_directory"] = cache_directory.string();
    j["regenerate_previews"] = regenerate_previews;
    j["log_level"] = log_level;
    return j;
}

uvmask_core::Result<CacheConfig> CacheConfig::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Err<CacheConfig>(Error(ErrorCode::NotFound, "Config file not found: " + path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<CacheConfig>(Error(ErrorCode::IOError, "Failed to open config file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto j = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (j.is_discarded()) {
        return Err<CacheConfig>(Error(ErrorCode::ParseError, "Invalid JSON in config file: " + path.string()));
    }

    auto result = from_json(j);
    if (!result) {
        result.error().with_context("file", path.string());
    }
    return result;
}

} // namespace uvmask_cache
