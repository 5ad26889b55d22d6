#pragma once

/// @file file_storage.hpp
/// @brief Persistent directory-backed storage tier
///
/// Layout:
/// - `<dir>/<key>.uvc` one CBOR-encoded entry per sanitized key
/// - `<dir>/index.json` key -> {format_version, mesh_hash, timestamp, size_bytes, checksum}
///
/// Each write goes to its own temporary file, which is renamed into place
/// and indexed under the exclusive lock. Readers hold the shared lock while
/// reading a file, so they never see a file that disagrees with its index
/// record. A checksum mismatch is treated as corruption. An
/// unreadable index is treated as empty and rewritten on the next write.
/// Files not listed in the index are ignored.

#include "storage.hpp"
#include "statistics.hpp"
#include "config.hpp"

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace uvmask_cache {

// =============================================================================
// OperationGate
// =============================================================================

/// Counting gate bounding concurrent I/O operations
class OperationGate {
public:
    /// RAII slot; releases on destruction
    class Permit {
    public:
        Permit() = default;
        explicit Permit(OperationGate* gate) : m_gate(gate) {}
        ~Permit() { release(); }

        Permit(Permit&& other) noexcept : m_gate(other.m_gate) { other.m_gate = nullptr; }
        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                release();
                m_gate = other.m_gate;
                other.m_gate = nullptr;
            }
            return *this;
        }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        [[nodiscard]] bool acquired() const noexcept { return m_gate != nullptr; }
        explicit operator bool() const noexcept { return acquired(); }

    private:
        void release() {
            if (m_gate) {
                m_gate->release();
                m_gate = nullptr;
            }
        }

        OperationGate* m_gate = nullptr;
    };

    explicit OperationGate(std::size_t slots) : m_available(slots > 0 ? slots : 1), m_slots(m_available) {}

    /// Wait at most timeout for a free slot
    [[nodiscard]] Permit acquire(std::chrono::milliseconds timeout);

    [[nodiscard]] std::size_t available() const;
    [[nodiscard]] std::size_t slots() const noexcept { return m_slots; }

private:
    void release();

    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::size_t m_available;
    std::size_t m_slots;
};

// =============================================================================
// FileStorage
// =============================================================================

/// Directory-backed storage tier
class FileStorage final : public CacheStorage {
public:
    static constexpr const char* k_index_file = "index.json";
    static constexpr const char* k_entry_extension = ".uvc";
    static constexpr int k_index_version = 1;

    /// Create the directory if needed and load its index
    [[nodiscard]] static uvmask_core::Result<std::unique_ptr<FileStorage>> open(
        const std::filesystem::path& directory, const CacheConfig& config);

    [[nodiscard]] std::string name() const override { return "file"; }

    [[nodiscard]] uvmask_core::Result<void> save(const std::string& key, const CacheEntry& entry) override;
    [[nodiscard]] uvmask_core::Result<std::optional<CacheEntry>> load(const std::string& key) override;
    [[nodiscard]] uvmask_core::Result<std::optional<EntryHeader>> peek(const std::string& key) const override;
    [[nodiscard]] bool has(const std::string& key) const override;
    uvmask_core::Result<void> remove(const std::string& key) override;
    uvmask_core::Result<void> clear() override;
    uvmask_core::Result<std::size_t> optimize(Timestamp now, std::chrono::milliseconds expiry) override;
    [[nodiscard]] CacheStatistics statistics() const override;
    void reset_statistics() override { m_stats.reset(); }

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return m_directory; }

    /// Path of the entry file for a (raw or sanitized) key
    [[nodiscard]] std::filesystem::path entry_path(const std::string& key) const;

    [[nodiscard]] std::filesystem::path index_path() const { return m_directory / k_index_file; }

    [[nodiscard]] std::size_t count() const;
    [[nodiscard]] std::size_t size_bytes() const;

private:
    FileStorage(std::filesystem::path directory, const CacheConfig& config);

    [[nodiscard]] std::string storage_key(const std::string& key) const;

    /// Read index.json; any failure yields an empty index
    void load_index();
    [[nodiscard]] uvmask_core::Result<void> save_index_unlocked() const;

    /// Remove oldest entries until the total fits the cleanup trigger
    std::size_t cleanup_oldest_unlocked();
    void erase_unlocked(const std::string& skey);

    /// Drop a corrupt or missing entry unless a newer save replaced it
    void drop_unlocked(const std::string& skey, const EntryHeader& seen);

    /// Write bytes to a uniquely named temporary file beside path
    [[nodiscard]] uvmask_core::Result<std::filesystem::path> write_temp_file(
        const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes, const std::string& skey) const;
    [[nodiscard]] uvmask_core::Result<void> commit_temp_file(
        const std::filesystem::path& temp_path, const std::filesystem::path& path, const std::string& skey) const;
    [[nodiscard]] uvmask_core::Result<void> write_file_atomic(
        const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes, const std::string& skey) const;

    mutable std::shared_mutex m_mutex;
    std::filesystem::path m_directory;
    CacheConfig m_config;
    std::unordered_map<std::string, EntryHeader> m_index;
    std::size_t m_total_bytes = 0;
    mutable OperationGate m_gate;
    mutable std::atomic<std::uint64_t> m_temp_counter{0};
    StatisticsTracker m_stats;
};

} // namespace uvmask_cache
