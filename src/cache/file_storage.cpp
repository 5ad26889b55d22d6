/// @file file_storage.cpp
/// @brief FileStorage and OperationGate implementation

#include <uvmask/cache/file_storage.hpp>
#include <uvmask/cache/codec.hpp>
#include <uvmask/cache/key.hpp>
#include <uvmask/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>

namespace uvmask_cache {

namespace fs = std::filesystem;

using uvmask_core::Err;
using uvmask_core::Error;
using uvmask_core::ErrorCode;
using uvmask_core::Ok;
using uvmask_core::Result;
using uvmask_core::StorageError;

namespace {

using Millis = std::chrono::duration<double, std::milli>;

constexpr const char* k_tier = "file";
constexpr const char* k_temp_suffix = ".tmp";

std::vector<std::uint8_t> read_file_bytes(const fs::path& path, bool& ok) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        ok = false;
        return {};
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    ok = !file.bad();
    return bytes;
}

} // anonymous namespace

// =============================================================================
// OperationGate
// =============================================================================

OperationGate::Permit OperationGate::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock lock(m_mutex);

    bool ready = m_condition.wait_for(lock, timeout, [this] {
        return m_available > 0;
    });

    if (!ready) {
        return Permit{};
    }

    --m_available;
    return Permit{this};
}

std::size_t OperationGate::available() const {
    std::lock_guard lock(m_mutex);
    return m_available;
}

void OperationGate::release() {
    {
        std::lock_guard lock(m_mutex);
        if (m_available < m_slots) {
            ++m_available;
        }
    }
    m_condition.notify_one();
}

// =============================================================================
// FileStorage
// =============================================================================

FileStorage::FileStorage(fs::path directory, const CacheConfig& config)
    : CacheStorage(config.format_version)
    , m_directory(std::move(directory))
    , m_config(config)
    , m_gate(config.max_concurrent_operations)
    , m_stats(HealthThresholds{config.min_statistics_samples, config.low_hit_rate_threshold,
                               config.slow_access_threshold_ms}) {}

Result<std::unique_ptr<FileStorage>> FileStorage::open(const fs::path& directory, const CacheConfig& config) {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec || !fs::is_directory(directory, ec)) {
        return Err<std::unique_ptr<FileStorage>>(
            StorageError::unavailable(k_tier, "cannot create cache directory " + directory.string()));
    }

    // Constructor is private, so make_unique cannot reach it
    std::unique_ptr<FileStorage> storage(new FileStorage(directory, config));
    storage->load_index();

    UVMASK_LOG_INFO("[file] opened {} ({} entries, {})", directory.string(), storage->m_index.size(),
                    format_file_size(storage->m_total_bytes));
    return Ok(std::move(storage));
}

std::string FileStorage::storage_key(const std::string& key) const {
    return sanitize_key(key, m_config.max_key_length);
}

fs::path FileStorage::entry_path(const std::string& key) const {
    return m_directory / (storage_key(key) + k_entry_extension);
}

// -----------------------------------------------------------------------------
// Index
// -----------------------------------------------------------------------------

void FileStorage::load_index() {
    m_index.clear();
    m_total_bytes = 0;

    const auto path = index_path();
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return;
    }

    std::ifstream file(path);
    if (!file) {
        UVMASK_LOG_WARN("[file] cannot read index {}, starting empty", path.string());
        return;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto j = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("entries") || !j["entries"].is_object()) {
        UVMASK_LOG_WARN("[file] index {} is corrupt, starting empty", path.string());
        return;
    }

    for (const auto& item : j["entries"].items()) {
        const std::string& key = item.key();
        const auto& record = item.value();
        if (!record.is_object()) {
            continue;
        }
        try {
            EntryHeader header;
            header.format_version = record.at("format_version").get<int>();
            header.mesh_hash = record.at("mesh_hash").get<std::int32_t>();
            header.timestamp = from_unix_millis(record.at("timestamp").get<std::int64_t>());
            header.size_bytes = record.at("size_bytes").get<std::size_t>();
            if (record.contains("checksum")) {
                header.checksum = record.at("checksum").get<std::uint32_t>();
            }

            if (!fs::exists(m_directory / (key + k_entry_extension), ec)) {
                continue;
            }
            m_total_bytes += header.size_bytes;
            m_index[key] = header;
        } catch (const nlohmann::json::exception& e) {
            UVMASK_LOG_WARN("[file] skipping malformed index record '{}': {}", key, e.what());
        }
    }
}

Result<void> FileStorage::save_index_unlocked() const {
    std::string text;
    try {
        nlohmann::json entries = nlohmann::json::object();
        for (const auto& [key, header] : m_index) {
            nlohmann::json record = {
                {"format_version", header.format_version},
                {"mesh_hash", header.mesh_hash},
                {"timestamp", to_unix_millis(header.timestamp)},
                {"size_bytes", header.size_bytes},
            };
            if (header.checksum) {
                record["checksum"] = *header.checksum;
            }
            entries[key] = std::move(record);
        }

        nlohmann::json j;
        j["version"] = k_index_version;
        j["entries"] = std::move(entries);

        text = j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        return Err(StorageError::write_failed(k_tier, k_index_file, e.what()));
    }
    return write_file_atomic(index_path(), std::vector<std::uint8_t>(text.begin(), text.end()), k_index_file);
}

Result<fs::path> FileStorage::write_temp_file(
    const fs::path& path, const std::vector<std::uint8_t>& bytes, const std::string& skey) const {

    auto temp_path = path;
    temp_path += "." + std::to_string(++m_temp_counter) + k_temp_suffix;

    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Err<fs::path>(StorageError::write_failed(k_tier, skey, "cannot open " + temp_path.string()));
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    file.flush();
    if (!file) {
        file.close();
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        return Err<fs::path>(StorageError::write_failed(k_tier, skey, "short write to " + temp_path.string()));
    }
    return Ok(std::move(temp_path));
}

Result<void> FileStorage::commit_temp_file(const fs::path& temp_path, const fs::path& path,
                                           const std::string& skey) const {
    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        return Err(StorageError::write_failed(k_tier, skey, "rename failed: " + ec.message()));
    }
    return Ok();
}

Result<void> FileStorage::write_file_atomic(
    const fs::path& path, const std::vector<std::uint8_t>& bytes, const std::string& skey) const {

    auto temp_path = write_temp_file(path, bytes, skey);
    if (!temp_path) {
        return Err(temp_path.error());
    }
    return commit_temp_file(*temp_path, path, skey);
}

// -----------------------------------------------------------------------------
// Entry operations
// -----------------------------------------------------------------------------

Result<void> FileStorage::save(const std::string& key, const CacheEntry& entry) {
    const auto skey = storage_key(key);
    const auto bytes = encode_entry(entry);

    if (bytes.size() > m_config.max_file_size_bytes) {
        return Err(StorageError::too_large(k_tier, skey, bytes.size(), m_config.max_file_size_bytes));
    }

    auto permit = m_gate.acquire(m_config.operation_timeout);
    if (!permit) {
        return Err(StorageError::timeout(k_tier, skey));
    }

    const auto path = m_directory / (skey + k_entry_extension);
    auto temp_path = write_temp_file(path, bytes, skey);
    if (!temp_path) {
        return Err(temp_path.error());
    }

    std::size_t cleaned = 0;
    Result<void> indexed = Ok();
    {
        std::unique_lock lock(m_mutex);

        auto committed = commit_temp_file(*temp_path, path, skey);
        if (!committed) {
            return committed;
        }

        auto it = m_index.find(skey);
        if (it != m_index.end()) {
            m_total_bytes -= it->second.size_bytes;
        }
        m_index[skey] = EntryHeader::of(entry, bytes.size(), compute_checksum(bytes));
        m_total_bytes += bytes.size();

        if (m_total_bytes > m_config.auto_cleanup_trigger_bytes) {
            cleaned = cleanup_oldest_unlocked();
        }
        indexed = save_index_unlocked();
    }

    if (!indexed) {
        return indexed;
    }

    m_stats.record_write();
    if (cleaned > 0) {
        m_stats.record_eviction(cleaned);
        UVMASK_LOG_INFO("[file] size cleanup removed {} entries", cleaned);
    }
    return Ok();
}

Result<std::optional<CacheEntry>> FileStorage::load(const std::string& key) {
    const auto start = std::chrono::steady_clock::now();
    const auto skey = storage_key(key);
    const auto miss = [&] {
        m_stats.record_miss(Millis(std::chrono::steady_clock::now() - start));
        return Ok(std::optional<CacheEntry>{});
    };

    if (!has(skey)) {
        return miss();
    }

    auto permit = m_gate.acquire(m_config.operation_timeout);
    if (!permit) {
        return Err<std::optional<CacheEntry>>(StorageError::timeout(k_tier, skey));
    }

    const auto path = m_directory / (skey + k_entry_extension);
    EntryHeader header;
    std::vector<std::uint8_t> bytes;
    bool present = false;
    {
        std::shared_lock lock(m_mutex);
        auto it = m_index.find(skey);
        if (it == m_index.end()) {
            return miss();
        }
        header = it->second;

        std::error_code ec;
        present = fs::exists(path, ec);
        if (present) {
            bool ok = false;
            bytes = read_file_bytes(path, ok);
            if (!ok) {
                return Err<std::optional<CacheEntry>>(
                    StorageError::read_failed(k_tier, skey, "cannot read " + path.string()));
            }
        }
    }

    if (!present) {
        UVMASK_LOG_WARN("[file] entry file for '{}' is missing, dropping from index", skey);
        std::unique_lock lock(m_mutex);
        drop_unlocked(skey, header);
        return miss();
    }

    if (header.checksum && compute_checksum(bytes) != *header.checksum) {
        UVMASK_LOG_WARN("[file] checksum mismatch for '{}'; dropping entry", skey);
        std::unique_lock lock(m_mutex);
        drop_unlocked(skey, header);
        return miss();
    }

    auto decoded = decode_entry(bytes, k_tier, skey);
    if (!decoded) {
        UVMASK_LOG_WARN("[file] {}; dropping entry", decoded.error().message());
        std::unique_lock lock(m_mutex);
        drop_unlocked(skey, header);
        return miss();
    }

    m_stats.record_hit(Millis(std::chrono::steady_clock::now() - start));
    return Ok(std::optional<CacheEntry>(std::move(*decoded)));
}

Result<std::optional<EntryHeader>> FileStorage::peek(const std::string& key) const {
    const auto skey = storage_key(key);
    std::shared_lock lock(m_mutex);
    auto it = m_index.find(skey);
    if (it == m_index.end()) {
        return Ok(std::optional<EntryHeader>{});
    }
    return Ok(std::optional<EntryHeader>(it->second));
}

bool FileStorage::has(const std::string& key) const {
    const auto skey = storage_key(key);
    std::shared_lock lock(m_mutex);
    return m_index.find(skey) != m_index.end();
}

Result<void> FileStorage::remove(const std::string& key) {
    const auto skey = storage_key(key);

    std::unique_lock lock(m_mutex);
    if (m_index.find(skey) == m_index.end()) {
        return Ok();
    }

    std::error_code ec;
    fs::remove(m_directory / (skey + k_entry_extension), ec);
    if (ec) {
        return Err(StorageError::write_failed(k_tier, skey, "cannot delete entry file: " + ec.message()));
    }

    erase_unlocked(skey);
    return save_index_unlocked();
}

Result<void> FileStorage::clear() {
    std::unique_lock lock(m_mutex);

    std::error_code ec;
    std::size_t removed = 0;
    for (fs::directory_iterator it(m_directory, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || it->path().extension() != k_entry_extension) {
            continue;
        }
        std::error_code remove_ec;
        if (fs::remove(it->path(), remove_ec)) {
            ++removed;
        } else if (remove_ec) {
            UVMASK_LOG_WARN("[file] cannot delete {}: {}", it->path().string(), remove_ec.message());
        }
    }
    if (ec) {
        return Err(StorageError::write_failed(k_tier, {}, "cannot list " + m_directory.string() + ": " + ec.message()));
    }

    m_index.clear();
    m_total_bytes = 0;
    UVMASK_LOG_INFO("[file] cleared {} entry files", removed);
    return save_index_unlocked();
}

Result<std::size_t> FileStorage::optimize(Timestamp now, std::chrono::milliseconds expiry) {
    std::unique_lock lock(m_mutex);

    std::vector<std::string> expired;
    for (const auto& [skey, header] : m_index) {
        if (header.is_expired(now, expiry)) {
            expired.push_back(skey);
        }
    }
    std::size_t purged = 0;
    for (const auto& skey : expired) {
        std::error_code ec;
        fs::remove(m_directory / (skey + k_entry_extension), ec);
        if (ec) {
            UVMASK_LOG_WARN("[file] cannot delete expired '{}': {}", skey, ec.message());
            continue;
        }
        erase_unlocked(skey);
        ++purged;
    }

    std::size_t cleaned = 0;
    if (m_total_bytes > m_config.auto_cleanup_trigger_bytes) {
        cleaned = cleanup_oldest_unlocked();
    }

    if (purged == 0 && cleaned == 0) {
        return Ok<std::size_t>(0);
    }

    auto saved = save_index_unlocked();
    if (!saved) {
        return Err<std::size_t>(saved.error());
    }

    if (cleaned > 0) {
        m_stats.record_eviction(cleaned);
    }
    UVMASK_LOG_INFO("[file] optimize removed {} expired and {} over-budget entries", purged, cleaned);
    return Ok(purged + cleaned);
}

CacheStatistics FileStorage::statistics() const {
    std::shared_lock lock(m_mutex);
    return m_stats.snapshot(m_index.size(), m_total_bytes);
}

std::size_t FileStorage::count() const {
    std::shared_lock lock(m_mutex);
    return m_index.size();
}

std::size_t FileStorage::size_bytes() const {
    std::shared_lock lock(m_mutex);
    return m_total_bytes;
}

// -----------------------------------------------------------------------------
// Cleanup
// -----------------------------------------------------------------------------

std::size_t FileStorage::cleanup_oldest_unlocked() {
    std::vector<std::pair<std::string, Timestamp>> by_age;
    by_age.reserve(m_index.size());
    for (const auto& [skey, header] : m_index) {
        by_age.emplace_back(skey, header.timestamp);
    }
    std::sort(by_age.begin(), by_age.end(), [](const auto& a, const auto& b) {
        return a.second < b.second;
    });

    std::size_t removed = 0;
    for (const auto& [skey, timestamp] : by_age) {
        if (m_total_bytes <= m_config.auto_cleanup_trigger_bytes) {
            break;
        }
        std::error_code ec;
        fs::remove(m_directory / (skey + k_entry_extension), ec);
        if (ec) {
            UVMASK_LOG_WARN("[file] cannot delete '{}' during cleanup: {}", skey, ec.message());
            continue;
        }
        erase_unlocked(skey);
        ++removed;
    }
    return removed;
}

void FileStorage::drop_unlocked(const std::string& skey, const EntryHeader& seen) {
    auto it = m_index.find(skey);
    if (it == m_index.end() || !(it->second == seen)) {
        return;
    }
    erase_unlocked(skey);
    auto saved = save_index_unlocked();
    if (!saved) {
        UVMASK_LOG_WARN("[file] {}", uvmask_core::build_error_chain(saved.error()));
    }
}

void FileStorage::erase_unlocked(const std::string& skey) {
    auto it = m_index.find(skey);
    if (it == m_index.end()) {
        return;
    }
    m_total_bytes -= it->second.size_bytes;
    m_index.erase(it);
}

} // namespace uvmask_cache
