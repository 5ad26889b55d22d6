/// @file test_file_storage.cpp
/// @brief Tests for the persistent storage tier

#include <catch2/catch_test_macros.hpp>
#include <uvmask/cache/file_storage.hpp>

#include "test_support.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iterator>
#include <thread>
#include <vector>

using namespace uvmask_cache;
using uvmask_core::ErrorCode;
using uvmask_core::StorageError;
using uvmask_test::make_entry;
using uvmask_test::TempDir;

namespace {

std::unique_ptr<FileStorage> open_storage(const TempDir& dir, const CacheConfig& config = uvmask_test::test_config()) {
    auto storage = FileStorage::open(dir.path(), config);
    REQUIRE(storage.is_ok());
    return std::move(*storage);
}

std::size_t count_temp_files(const TempDir& dir) {
    std::size_t count = 0;
    for (const auto& file : std::filesystem::directory_iterator(dir.path())) {
        if (file.path().extension() == ".tmp") {
            ++count;
        }
    }
    return count;
}

nlohmann::json read_index(const TempDir& dir) {
    std::ifstream file(dir.path() / FileStorage::k_index_file);
    return nlohmann::json::parse(file);
}

} // anonymous namespace

TEST_CASE("FileStorage: save writes entry file and index", "[cache][file]") {
    TempDir dir;
    auto storage = open_storage(dir);

    REQUIRE(storage->save("Cube_12345_24", make_entry()).is_ok());
    REQUIRE(std::filesystem::exists(dir.path() / "Cube_12345_24.uvc"));
    REQUIRE(std::filesystem::exists(dir.path() / "index.json"));
    REQUIRE(count_temp_files(dir) == 0);
    REQUIRE(storage->has("Cube_12345_24"));
    REQUIRE(storage->count() == 1);
    REQUIRE(storage->size_bytes() > 0);
}

TEST_CASE("FileStorage: load returns the saved entry", "[cache][file]") {
    TempDir dir;
    auto storage = open_storage(dir);
    auto entry = make_entry(1, 77);

    REQUIRE(storage->save("mesh", entry).is_ok());
    auto loaded = storage->load("mesh");
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded->has_value());
    REQUIRE(**loaded == entry);

    auto missing = storage->load("other");
    REQUIRE(missing.is_ok());
    REQUIRE_FALSE(missing->has_value());

    auto stats = storage->statistics();
    REQUIRE(stats.hits == 1);
    REQUIRE(stats.misses == 1);
    REQUIRE(stats.writes == 1);
}

TEST_CASE("FileStorage: keys are sanitized into file names", "[cache][file]") {
    TempDir dir;
    auto storage = open_storage(dir);

    REQUIRE(storage->save("Body/LOD:0_1_3", make_entry()).is_ok());
    REQUIRE(std::filesystem::exists(dir.path() / "Body_LOD_0_1_3.uvc"));
    REQUIRE(storage->has("Body/LOD:0_1_3"));
    REQUIRE(storage->has("Body_LOD_0_1_3"));
    REQUIRE(storage->entry_path("Body/LOD:0_1_3") == dir.path() / "Body_LOD_0_1_3.uvc");
}

TEST_CASE("FileStorage: entries survive reopening", "[cache][file]") {
    TempDir dir;
    auto entry = make_entry(1, 5);
    {
        auto storage = open_storage(dir);
        REQUIRE(storage->save("persisted", entry).is_ok());
    }

    auto reopened = open_storage(dir);
    REQUIRE(reopened->has("persisted"));

    auto header = reopened->peek("persisted");
    REQUIRE(header.is_ok());
    REQUIRE(header->has_value());
    REQUIRE((*header)->mesh_hash == 5);
    REQUIRE((*header)->timestamp == entry.timestamp);
    REQUIRE((*header)->checksum.has_value());

    auto loaded = reopened->load("persisted");
    REQUIRE(loaded.is_ok());
    REQUIRE(**loaded == entry);
}

TEST_CASE("FileStorage: corrupt index is treated as empty", "[cache][file]") {
    TempDir dir;
    {
        auto storage = open_storage(dir);
        REQUIRE(storage->save("a", make_entry()).is_ok());
    }
    std::ofstream(dir.path() / "index.json", std::ios::trunc) << "{ \"entries\": [ truncated";

    auto storage = open_storage(dir);
    REQUIRE(storage->count() == 0);
    REQUIRE_FALSE(storage->has("a"));

    // Next write rebuilds a valid index
    REQUIRE(storage->save("b", make_entry()).is_ok());
    auto reopened = open_storage(dir);
    REQUIRE(reopened->has("b"));
}

TEST_CASE("FileStorage: corrupt entry file is a miss and leaves the index", "[cache][file]") {
    TempDir dir;
    auto storage = open_storage(dir);
    REQUIRE(storage->save("broken", make_entry()).is_ok());

    std::ofstream(dir.path() / "broken.uvc", std::ios::binary | std::ios::trunc) << "not cbor at all";

    auto loaded = storage->load("broken");
    REQUIRE(loaded.is_ok());
    REQUIRE_FALSE(loaded->has_value());
    REQUIRE_FALSE(storage->has("broken"));
}

TEST_CASE("FileStorage: payload damage is caught by the checksum", "[cache][file]") {
    TempDir dir;
    auto storage = open_storage(dir);
    auto entry = make_entry();
    entry.preview = PixelBuffer::filled(4, 4, Color32{11, 22, 33, 44});
    REQUIRE(storage->save("flipped", entry).is_ok());

    auto index = read_index(dir);
    REQUIRE(index["entries"]["flipped"].contains("checksum"));

    const auto path = dir.path() / "flipped.uvc";
    std::vector<char> bytes;
    {
        std::ifstream in(path, std::ios::binary);
        bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    const std::vector<char> pixel = {11, 22, 33, 44, 11, 22, 33, 44};
    auto it = std::search(bytes.begin(), bytes.end(), pixel.begin(), pixel.end());
    REQUIRE(it != bytes.end());
    *it = 12;
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }

    // Still well-formed CBOR, so only the checksum can reject it
    std::vector<std::uint8_t> raw(bytes.begin(), bytes.end());
    REQUIRE(decode_entry(raw).is_ok());

    auto loaded = storage->load("flipped");
    REQUIRE(loaded.is_ok());
    REQUIRE_FALSE(loaded->has_value());
    REQUIRE_FALSE(storage->has("flipped"));
}

TEST_CASE("FileStorage: index entry without file is dropped", "[cache][file]") {
    TempDir dir;
    auto storage = open_storage(dir);
    REQUIRE(storage->save("gone", make_entry()).is_ok());
    std::filesystem::remove(dir.path() / "gone.uvc");

    auto loaded = storage->load("gone");
    REQUIRE(loaded.is_ok());
    REQUIRE_FALSE(loaded->has_value());
    REQUIRE_FALSE(storage->has("gone"));
}

TEST_CASE("FileStorage: orphaned files are ignored", "[cache][file]") {
    TempDir dir;
    std::ofstream(dir.path() / "orphan.uvc", std::ios::binary) << "x";

    auto storage = open_storage(dir);
    REQUIRE_FALSE(storage->has("orphan"));
    auto loaded = storage->load("orphan");
    REQUIRE(loaded.is_ok());
    REQUIRE_FALSE(loaded->has_value());
}

TEST_CASE("FileStorage: entries above the file size limit are rejected", "[cache][file]") {
    TempDir dir;
    auto config = uvmask_test::test_config();
    config.max_file_size_bytes = 256;
    auto storage = open_storage(dir, config);

    auto entry = make_entry();
    entry.preview = PixelBuffer::filled(64, 64, Color32::gray());

    auto result = storage->save("huge", entry);
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == ErrorCode::CapacityExceeded);
    REQUIRE_FALSE(storage->has("huge"));
    REQUIRE_FALSE(std::filesystem::exists(dir.path() / "huge.uvc"));
}

TEST_CASE("FileStorage: size-triggered cleanup removes oldest first", "[cache][file]") {
    TempDir dir;
    auto config = uvmask_test::test_config();
    const auto base = from_unix_millis(1'700'000'000'000);

    // Measure one entry to size the budget for exactly three
    std::size_t entry_size = 0;
    {
        TempDir sizing;
        auto storage = open_storage(sizing);
        REQUIRE(storage->save("sizing", make_entry(1, 1, base)).is_ok());
        entry_size = storage->size_bytes();
    }
    config.auto_cleanup_trigger_bytes = entry_size * 3;
    auto storage = open_storage(dir, config);

    for (int i = 0; i < 4; ++i) {
        REQUIRE(storage->save("m" + std::to_string(i), make_entry(1, 1, base + std::chrono::seconds(i))).is_ok());
    }

    REQUIRE(storage->count() == 3);
    REQUIRE_FALSE(storage->has("m0"));
    REQUIRE(storage->has("m3"));
    REQUIRE_FALSE(std::filesystem::exists(dir.path() / "m0.uvc"));
    REQUIRE(storage->size_bytes() <= config.auto_cleanup_trigger_bytes);
    REQUIRE(storage->statistics().evictions == 1);
}

TEST_CASE("FileStorage: optimize purges expired entries", "[cache][file]") {
    TempDir dir;
    auto storage = open_storage(dir);
    const auto now = from_unix_millis(1'700'000'000'000);
    const auto expiry = std::chrono::milliseconds(std::chrono::hours(24 * 7));

    REQUIRE(storage->save("fresh", make_entry(1, 1, now)).is_ok());
    REQUIRE(storage->save("stale", make_entry(1, 1, now - expiry - std::chrono::minutes(1))).is_ok());

    auto removed = storage->optimize(now, expiry);
    REQUIRE(removed.is_ok());
    REQUIRE(*removed == 1);
    REQUIRE(storage->has("fresh"));
    REQUIRE_FALSE(storage->has("stale"));
    REQUIRE_FALSE(std::filesystem::exists(dir.path() / "stale.uvc"));
}

TEST_CASE("FileStorage: optimize keeps entries it cannot delete", "[cache][file]") {
    TempDir dir;
    auto storage = open_storage(dir);
    const auto now = from_unix_millis(1'700'000'000'000);
    const auto expiry = std::chrono::milliseconds(std::chrono::hours(24 * 7));

    REQUIRE(storage->save("stuck", make_entry(1, 1, now - expiry - std::chrono::minutes(1))).is_ok());

    // A non-empty directory in place of the entry file cannot be removed
    const auto path = dir.path() / "stuck.uvc";
    std::filesystem::remove(path);
    std::filesystem::create_directory(path);
    std::ofstream(path / "keep") << "x";

    auto removed = storage->optimize(now, expiry);
    REQUIRE(removed.is_ok());
    REQUIRE(*removed == 0);
    REQUIRE(storage->has("stuck"));
}

TEST_CASE("FileStorage: remove and clear", "[cache][file]") {
    TempDir dir;
    auto storage = open_storage(dir);
    REQUIRE(storage->save("a", make_entry()).is_ok());
    REQUIRE(storage->save("b", make_entry()).is_ok());

    REQUIRE(storage->remove("a").is_ok());
    REQUIRE(storage->remove("a").is_ok());
    REQUIRE_FALSE(std::filesystem::exists(dir.path() / "a.uvc"));

    REQUIRE(storage->clear().is_ok());
    REQUIRE(storage->count() == 0);
    REQUIRE_FALSE(std::filesystem::exists(dir.path() / "b.uvc"));
    REQUIRE(std::filesystem::exists(dir.path() / "index.json"));
}

TEST_CASE("FileStorage: keys that are not valid UTF-8 keep the index writable", "[cache][file]") {
    TempDir dir;
    auto storage = open_storage(dir);

    const auto long_key = derive_key(MeshIdentity{std::string(199, 'a') + "\xC3\xA9", 1, 24});
    REQUIRE(storage->save(long_key, make_entry()).is_ok());
    REQUIRE(storage->save("\xff", make_entry()).is_ok());
    REQUIRE(storage->save("Cube_12345_24", make_entry()).is_ok());

    auto index = read_index(dir);
    REQUIRE(index["entries"].size() == 3);

    auto reopened = open_storage(dir);
    REQUIRE(reopened->count() == 3);
    REQUIRE(reopened->has(long_key));
    REQUIRE(reopened->has("\xff"));
    REQUIRE(reopened->has("Cube_12345_24"));
}

TEST_CASE("FileStorage: open fails when the path is a file", "[cache][file]") {
    TempDir dir;
    auto file_path = dir.path() / "not_a_dir";
    std::ofstream(file_path) << "x";

    auto storage = FileStorage::open(file_path, uvmask_test::test_config());
    REQUIRE(storage.is_err());
    REQUIRE(storage.error().is<StorageError>());
    REQUIRE(storage.error().as<StorageError>()->kind == StorageError::Kind::Unavailable);
}

TEST_CASE("FileStorage: texture helpers", "[cache][file]") {
    TempDir dir;
    auto storage = open_storage(dir);
    auto preview = PixelBuffer::filled(32, 32, Color32{10, 20, 30, 255});

    REQUIRE(storage->save_texture("tex", preview));
    auto loaded = storage->load_texture("tex");
    REQUIRE(loaded.has_value());
    REQUIRE(*loaded == preview);

    storage->clear_all_cache();
    REQUIRE_FALSE(storage->has_cache("tex"));
}

TEST_CASE("FileStorage: concurrent saves and loads", "[cache][file]") {
    TempDir dir;
    auto config = uvmask_test::test_config();
    config.operation_timeout = std::chrono::milliseconds(5000);
    auto storage = open_storage(dir, config);

    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&storage, &failures, t] {
            for (int i = 0; i < 10; ++i) {
                auto key = "t" + std::to_string(t) + "_" + std::to_string(i);
                if (!storage->save(key, make_entry()).is_ok()) {
                    ++failures;
                    continue;
                }
                auto loaded = storage->load(key);
                if (!loaded.is_ok() || !loaded->has_value()) {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(failures.load() == 0);
    REQUIRE(storage->count() == 80);
}

TEST_CASE("FileStorage: concurrent saves and loads of one key", "[cache][file]") {
    TempDir dir;
    auto config = uvmask_test::test_config();
    config.operation_timeout = std::chrono::milliseconds(5000);
    auto storage = open_storage(dir, config);

    std::vector<std::thread> threads;
    std::atomic<int> save_failures{0};
    std::atomic<int> misses{0};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&storage, &save_failures, &misses, t] {
            for (int i = 0; i < 100; ++i) {
                if (!storage->save("same", make_entry(1, t * 1000 + i)).is_ok()) {
                    ++save_failures;
                    continue;
                }
                auto loaded = storage->load("same");
                if (!loaded.is_ok() || !loaded->has_value()) {
                    ++misses;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(save_failures.load() == 0);
    REQUIRE(misses.load() == 0);
    REQUIRE(storage->count() == 1);
    REQUIRE(count_temp_files(dir) == 0);
    REQUIRE(storage->load("same")->has_value());
}

// =============================================================================
// OperationGate
// =============================================================================

TEST_CASE("OperationGate: bounds concurrent permits", "[cache][file]") {
    OperationGate gate(2);

    auto first = gate.acquire(std::chrono::milliseconds(10));
    auto second = gate.acquire(std::chrono::milliseconds(10));
    REQUIRE(first.acquired());
    REQUIRE(second.acquired());
    REQUIRE(gate.available() == 0);

    auto third = gate.acquire(std::chrono::milliseconds(10));
    REQUIRE_FALSE(third.acquired());

    {
        auto released = std::move(first);
    }
    REQUIRE(gate.available() == 1);

    auto fourth = gate.acquire(std::chrono::milliseconds(10));
    REQUIRE(fourth.acquired());
}

TEST_CASE("OperationGate: waiting acquire succeeds when a slot frees", "[cache][file]") {
    OperationGate gate(1);
    auto held = gate.acquire(std::chrono::milliseconds(0));
    REQUIRE(held.acquired());

    std::thread releaser([permit = std::move(held)]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        permit = OperationGate::Permit{};
    });

    auto waited = gate.acquire(std::chrono::milliseconds(2000));
    releaser.join();
    REQUIRE(waited.acquired());
}
