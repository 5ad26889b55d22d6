// uvmask_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <uvmask/core/error.hpp>
#include <string>

using namespace uvmask_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("StorageError factories map to error codes", "[core][error]") {
    SECTION("read_failed") {
        Error err = StorageError::read_failed("file", "Cube_1_8", "disk gone");
        REQUIRE(err.code() == ErrorCode::IOError);
        REQUIRE(err.is<StorageError>());
        REQUIRE(err.as<StorageError>()->key == "Cube_1_8");
        REQUIRE(err.as<StorageError>()->tier == "file");
        REQUIRE(err.message().find("disk gone") != std::string::npos);
    }

    SECTION("write_failed") {
        Error err = StorageError::write_failed("file", "k", "read-only");
        REQUIRE(err.code() == ErrorCode::IOError);
    }

    SECTION("corrupted") {
        Error err = StorageError::corrupted("file", "k", "bad bytes");
        REQUIRE(err.code() == ErrorCode::ParseError);
    }

    SECTION("too_large") {
        Error err = StorageError::too_large("file", "k", 2048, 1024);
        REQUIRE(err.code() == ErrorCode::CapacityExceeded);
        REQUIRE(err.message().find("2048") != std::string::npos);
        REQUIRE(err.message().find("1024") != std::string::npos);
    }

    SECTION("timeout") {
        Error err = StorageError::timeout("file", "k");
        REQUIRE(err.code() == ErrorCode::Timeout);
    }

    SECTION("unavailable") {
        Error err = StorageError::unavailable("file", "no directory");
        REQUIRE(err.code() == ErrorCode::NotSupported);
        REQUIRE(err.as<StorageError>()->key.empty());
    }
}

TEST_CASE("is_retryable", "[core][error]") {
    REQUIRE(is_retryable(StorageError::read_failed("t", "k", "r")));
    REQUIRE(is_retryable(StorageError::write_failed("t", "k", "r")));
    REQUIRE(is_retryable(StorageError::timeout("t", "k")));
    REQUIRE_FALSE(is_retryable(StorageError::corrupted("t", "k", "r")));
    REQUIRE_FALSE(is_retryable(StorageError::too_large("t", "k", 2, 1)));
    REQUIRE_FALSE(is_retryable(Error("plain")));
}

TEST_CASE("build_error_chain", "[core][error]") {
    Error err = StorageError::write_failed("file", "Cube_1_8", "no space");
    err.with_context("attempt", "3");

    auto chain = build_error_chain(err);
    REQUIRE(chain.find("[IOError]") != std::string::npos);
    REQUIRE(chain.find("WriteFailed") != std::string::npos);
    REQUIRE(chain.find("tier: file") != std::string::npos);
    REQUIRE(chain.find("{attempt=3}") != std::string::npos);
}

TEST_CASE("error_code_name", "[core][error]") {
    REQUIRE(std::string(error_code_name(ErrorCode::Timeout)) == "Timeout");
    REQUIRE(std::string(error_code_name(ErrorCode::CapacityExceeded)) == "CapacityExceeded");
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
        REQUIRE(*r == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE(static_cast<bool>(r));
    }

    SECTION("Err with message") {
        Result<int> r = Err<int>(Error("failed"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().message() == "failed");
        REQUIRE(r.value_or(7) == 7);
    }

    SECTION("Err void with storage error") {
        Result<void> r = Err(StorageError::timeout("file", "k"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::Timeout);
    }
}

TEST_CASE("Result map and unwrap", "[core][result]") {
    SECTION("map transforms value") {
        Result<int> r = Ok(21);
        auto doubled = r.map([](int v) { return v * 2; });
        REQUIRE(doubled.is_ok());
        REQUIRE(doubled.value() == 42);
    }

    SECTION("map keeps error") {
        Result<int> r = Err<int>(Error(ErrorCode::NotFound, "missing"));
        auto mapped = r.map([](int v) { return v + 1; });
        REQUIRE(mapped.is_err());
        REQUIRE(mapped.error().code() == ErrorCode::NotFound);
    }

    SECTION("unwrap throws on error") {
        Result<int> r = Err<int>(Error("boom"));
        REQUIRE_THROWS(r.unwrap());
    }
}
