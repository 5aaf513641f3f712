// =============================================================================
// pdf-shrink - Chunk Store
// =============================================================================
// Disk-backed, process-lifetime holder of in-flight upload sessions.
//
// Layout:
//   <root>/<sessionId>/chunk_0000000000
//   <root>/<sessionId>/chunk_0000000001
//   <root>/<sessionId>/chunk_0000000001.<seq>.part   (write in progress)
//
// Key properties:
// - Each chunk is written to a unique temporary file and renamed over its
//   final name, so the last writer for an index wins atomically.
// - Received counts and completeness are always derived from a directory
//   listing taken under the session's state mutex, never from a counter.
// - Chunk files are named by zero-padded index and are additionally sorted by
//   parsed numeric value, so index 10 never precedes index 2.
//
// The store does not coordinate with finalize; UploadService holds the
// session's shared lock around storeChunk().
// =============================================================================

#ifndef PDS_SESSION_CHUNK_STORE_H
#define PDS_SESSION_CHUNK_STORE_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "pds/common/types.h"
#include "pds/session/session_key.h"

namespace pds::session {

/// @brief Prefix of every chunk file name.
inline constexpr std::string_view kChunkFilePrefix = "chunk_";

/// @brief Suffix of in-progress chunk writes.
inline constexpr std::string_view kPartialSuffix = ".part";

/// @brief "chunk_" + index zero-padded to 10 digits.
[[nodiscard]] std::string chunkFileName(ChunkIndex index);

/// @brief Parse a final chunk file name; nullopt for anything else.
[[nodiscard]] std::optional<ChunkIndex> parseChunkFileName(std::string_view name) noexcept;

/// @brief Snapshot of one upload session's metadata.
struct SessionInfo {
    SessionId id;
    std::string displayName;
    std::filesystem::path directory;

    /// @brief Chunk count declared by the first upload.
    std::uint32_t totalChunks = 0;

    std::chrono::system_clock::time_point createdAt;
};

/// @brief A session-shaped directory found on disk, registered or not.
struct StoredSession {
    SessionId id;
    std::filesystem::path directory;

    /// @brief Final chunk files (partial writes excluded).
    std::uint32_t chunkFiles = 0;

    std::uint64_t bytes = 0;
    std::filesystem::file_time_type lastWrite;
};

/// @brief List session directories under an upload root, sorted by id.
/// @note Works without a ChunkStore; used for orphans and reporting.
/// @throws StorageFault if the root exists but can not be listed.
[[nodiscard]] std::vector<StoredSession> scanSessionDirectories(
    const std::filesystem::path& root);

class ChunkStore {
public:
    /// @brief Create the store rooted at an upload directory.
    /// @throws StorageFault if the root cannot be created.
    explicit ChunkStore(std::filesystem::path root);

    ChunkStore(const ChunkStore&) = delete;
    ChunkStore& operator=(const ChunkStore&) = delete;

    /// @brief Persist one chunk, creating the session on first use.
    /// @return Distinct indices now present and the resulting progress.
    /// @throws InvalidFileNameError, InvalidIndexError, EmptyChunkError, StorageFault
    ChunkReceipt storeChunk(std::string_view fileName, ChunkIndex index,
                            std::uint32_t totalChunks, std::span<const std::uint8_t> data);

    /// @brief True iff every index in [0, totalChunks) is present on disk.
    [[nodiscard]] bool isComplete(std::string_view fileName, std::uint32_t totalChunks) const;

    /// @brief Indices in [0, declared total) absent from disk.
    /// @return nullopt if no session exists for the file name.
    [[nodiscard]] std::optional<std::vector<ChunkIndex>> missingIndices(
        std::string_view fileName) const;

    /// @brief Stored chunks in ascending numeric index order.
    [[nodiscard]] std::vector<ChunkRecord> listChunks(std::string_view fileName) const;

    [[nodiscard]] std::optional<SessionInfo> session(std::string_view fileName) const;

    [[nodiscard]] std::optional<SessionInfo> sessionById(const SessionId& id) const;

    /// @brief Snapshot of every registered session.
    [[nodiscard]] std::vector<SessionInfo> sessions() const;

    /// @brief Drop a session from the registry (files are left to the caller).
    /// @return The removed session, if it was registered.
    std::optional<SessionInfo> forget(const SessionId& id);

    [[nodiscard]] std::filesystem::path sessionDirectory(const SessionId& id) const {
        return root_ / id;
    }

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    struct SessionState {
        SessionInfo info;

        /// @brief Serializes rename + listing so counts come from one snapshot.
        mutable std::mutex mutex;
    };

    std::shared_ptr<SessionState> findOrCreate(const SessionKey& key, std::uint32_t totalChunks);
    [[nodiscard]] std::shared_ptr<SessionState> find(const SessionId& id) const;

    /// @brief List final chunk files with index < totalChunks, sorted numerically.
    static std::vector<ChunkRecord> scanChunks(const SessionInfo& info);

    void writePartial(const std::filesystem::path& path, std::span<const std::uint8_t> data,
                      const ErrorContext& context) const;

    std::filesystem::path root_;
    std::atomic<std::uint64_t> writeSequence_{0};

    mutable std::mutex registryMutex_;
    std::unordered_map<SessionId, std::shared_ptr<SessionState>> sessions_;
};

}  // namespace pds::session

#endif  // PDS_SESSION_CHUNK_STORE_H
