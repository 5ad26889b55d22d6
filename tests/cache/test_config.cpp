/// @file test_config.cpp
/// @brief Tests for CacheConfig

#include <catch2/catch_test_macros.hpp>
#include <uvmask/cache/config.hpp>

#include <nlohmann/json.hpp>

#include "test_support.hpp"

#include <fstream>

using namespace uvmask_cache;
using uvmask_core::ErrorCode;

TEST_CASE("CacheConfig: defaults", "[cache][config]") {
    CacheConfig config;
    REQUIRE(config.max_memory_entries == 100);
    REQUIRE(config.max_file_size_bytes == 10u * 1024 * 1024);
    REQUIRE(config.auto_cleanup_trigger_bytes == 100u * 1024 * 1024);
    REQUIRE(config.max_key_length == 200);
    REQUIRE(config.expiry == std::chrono::hours(24 * 7));
    REQUIRE(config.operation_timeout == std::chrono::milliseconds(5000));
    REQUIRE(config.retry_attempts == 3);
    REQUIRE(config.retry_delay == std::chrono::milliseconds(100));
    REQUIRE(config.format_version == 1);
    REQUIRE(config.default_preview_resolution == 128);
    REQUIRE(config.max_concurrent_operations == 4);
    REQUIRE(config.validate().is_ok());
}

TEST_CASE("CacheConfig: from_json overrides", "[cache][config]") {
    nlohmann::json j = {
        {"max_memory_entries", 8},
        {"expiry_days", 1},
        {"retry_attempts", 5},
        {"retry_delay_ms", 0},
        {"format_version", 2},
        {"low_hit_rate_threshold", 0.25},
        {"cache_directory", "/tmp/uv"},
        {"regenerate_previews", true},
        {"log_level", "debug"},
    };

    auto result = CacheConfig::from_json(j);
    REQUIRE(result.is_ok());
    REQUIRE(result->max_memory_entries == 8);
    REQUIRE(result->expiry == std::chrono::hours(24));
    REQUIRE(result->retry_attempts == 5);
    REQUIRE(result->retry_delay == std::chrono::milliseconds(0));
    REQUIRE(result->format_version == 2);
    REQUIRE(result->low_hit_rate_threshold == 0.25);
    REQUIRE(result->cache_directory == std::filesystem::path("/tmp/uv"));
    REQUIRE(result->regenerate_previews);
    REQUIRE(result->log_level == "debug");
    REQUIRE(result->max_key_length == 200);
}

TEST_CASE("CacheConfig: from_json rejects bad input", "[cache][config]") {
    SECTION("not an object") {
        auto result = CacheConfig::from_json(nlohmann::json::array());
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("wrong type") {
        auto result = CacheConfig::from_json({{"max_memory_entries", "many"}});
        REQUIRE(result.is_err());
        REQUIRE(result.error().message().find("max_memory_entries") != std::string::npos);
    }

    SECTION("negative size") {
        auto result = CacheConfig::from_json({{"max_file_size_bytes", -1}});
        REQUIRE(result.is_err());
    }

    SECTION("unknown log level") {
        auto result = CacheConfig::from_json({{"log_level", "loud"}});
        REQUIRE(result.is_err());
    }

    SECTION("fails validation") {
        auto result = CacheConfig::from_json({{"retry_attempts", 0}});
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("CacheConfig: to_json round trips", "[cache][config]") {
    CacheConfig config;
    config.max_memory_entries = 12;
    config.expiry = std::chrono::milliseconds(1500);
    config.cache_directory = "cache/uv";

    auto parsed = CacheConfig::from_json(config.to_json());
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed->max_memory_entries == 12);
    REQUIRE(parsed->expiry == std::chrono::milliseconds(1500));
    REQUIRE(parsed->cache_directory == std::filesystem::path("cache/uv"));
}

TEST_CASE("CacheConfig: load from file", "[cache][config]") {
    uvmask_test::TempDir dir;

    SECTION("valid file") {
        auto path = dir.path() / "cache.json";
        std::ofstream(path) << R"({"max_memory_entries": 3, "operation_timeout_ms": 250})";

        auto result = CacheConfig::load(path);
        REQUIRE(result.is_ok());
        REQUIRE(result->max_memory_entries == 3);
        REQUIRE(result->operation_timeout == std::chrono::milliseconds(250));
    }

    SECTION("missing file") {
        auto result = CacheConfig::load(dir.path() / "absent.json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::NotFound);
    }

    SECTION("invalid JSON") {
        auto path = dir.path() / "broken.json";
        std::ofstream(path) << "{ not json";

        auto result = CacheConfig::load(path);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("invalid value carries the file name") {
        auto path = dir.path() / "bad.json";
        std::ofstream(path) << R"({"format_version": 0})";

        auto result = CacheConfig::load(path);
        REQUIRE(result.is_err());
        REQUIRE(result.error().get_context("file") != nullptr);
    }
}
