// =============================================================================
// pdf-shrink - Chunk Store Implementation
// =============================================================================

#include "pds/session/chunk_store.h"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <fstream>
#include <system_error>

#include <fmt/format.h>

#include "pds/common/logger.h"

namespace pds::session {

namespace fs = std::filesystem;

// =============================================================================
// Chunk File Naming
// =============================================================================

std::string chunkFileName(ChunkIndex index) {
    return fmt::format("{}{:010}", kChunkFilePrefix, index);
}

std::optional<ChunkIndex> parseChunkFileName(std::string_view name) noexcept {
    if (!name.starts_with(kChunkFilePrefix)) {
        return std::nullopt;
    }
    name.remove_prefix(kChunkFilePrefix.size());
    if (name.empty() ||
        !std::all_of(name.begin(), name.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }

    ChunkIndex index = 0;
    auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), index);
    if (ec != std::errc{} || ptr != name.data() + name.size()) {
        return std::nullopt;
    }
    return index;
}

std::vector<StoredSession> scanSessionDirectories(const fs::path& root) {
    std::vector<StoredSession> found;

    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return found;
    }

    fs::directory_iterator iter(root, ec);
    for (; !ec && iter != fs::directory_iterator(); iter.increment(ec)) {
        std::error_code entryError;
        if (!iter->is_directory(entryError)) {
            continue;
        }
        std::string name = iter->path().filename().string();
        if (!looksLikeSessionId(name)) {
            continue;
        }

        StoredSession stored;
        stored.id = std::move(name);
        stored.directory = iter->path();
        stored.lastWrite = fs::last_write_time(stored.directory, entryError);

        fs::directory_iterator files(stored.directory, entryError);
        for (; !entryError && files != fs::directory_iterator(); files.increment(entryError)) {
            std::error_code fileError;
            if (!files->is_regular_file(fileError) ||
                !parseChunkFileName(files->path().filename().string())) {
                continue;
            }
            ++stored.chunkFiles;
            const std::uintmax_t size = files->file_size(fileError);
            if (!fileError) {
                stored.bytes += size;
            }
        }
        found.push_back(std::move(stored));
    }
    if (ec) {
        throw StorageFault("Failed to list upload root", ec, ErrorContext().withPath(root.string()));
    }

    std::sort(found.begin(), found.end(),
              [](const StoredSession& a, const StoredSession& b) { return a.id < b.id; });
    return found;
}

// =============================================================================
// ChunkStore
// =============================================================================

ChunkStore::ChunkStore(fs::path root) : root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw StorageFault("Failed to create upload root", ec,
                           ErrorContext().withPath(root_.string()));
    }
    PDS_LOG_DEBUG("Chunk store rooted at {}", root_.string());
}

ChunkReceipt ChunkStore::storeChunk(std::string_view fileName, ChunkIndex index,
                                    std::uint32_t totalChunks,
                                    std::span<const std::uint8_t> data) {
    const SessionKey key = SessionKey::fromFileName(fileName);
    ErrorContext context = ErrorContext(std::string(fileName)).withSession(key.id).withChunk(index);

    if (totalChunks == 0) {
        throw InvalidIndexError("totalChunks must be at least 1", context);
    }
    if (index >= totalChunks) {
        throw InvalidIndexError(
            fmt::format("chunk index {} outside [0, {})", index, totalChunks), context);
    }
    if (data.empty()) {
        throw EmptyChunkError(fmt::format("chunk {} is empty", index), context);
    }

    auto state = findOrCreate(key, totalChunks);
    const fs::path& dir = state->info.directory;

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw StorageFault("Failed to create session directory", ec,
                           context.withPath(dir.string()));
    }

    const fs::path finalPath = dir / chunkFileName(index);
    const fs::path partialPath =
        dir / fmt::format("{}.{}{}", chunkFileName(index),
                          writeSequence_.fetch_add(1, std::memory_order_relaxed), kPartialSuffix);

    writePartial(partialPath, data, context);

    std::vector<ChunkRecord> records;
    {
        std::lock_guard lock(state->mutex);

        fs::rename(partialPath, finalPath, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(partialPath, ignored);
            throw StorageFault("Failed to commit chunk", ec, context.withPath(finalPath.string()));
        }

        const std::uintmax_t onDisk = fs::file_size(finalPath, ec);
        if (ec) {
            throw StorageFault("Failed to verify chunk", ec, context.withPath(finalPath.string()));
        }
        if (onDisk != data.size()) {
            throw StorageFault(fmt::format("chunk size on disk is {} bytes, expected {}", onDisk,
                                           data.size()),
                               context.withPath(finalPath.string()));
        }

        records = scanChunks(state->info);
    }

    ChunkReceipt receipt;
    receipt.receivedCount = static_cast<std::uint32_t>(records.size());
    receipt.totalChunks = totalChunks;
    receipt.progressPercent =
        static_cast<double>(receipt.receivedCount) / static_cast<double>(totalChunks) * 100.0;
    receipt.chunkSizeBytes = data.size();

    PDS_LOG_INFO("Stored chunk {}/{} for session {} ({:.2f}KB), progress {:.1f}%", index + 1,
                 totalChunks, key.id, static_cast<double>(data.size()) / 1024.0,
                 receipt.progressPercent);
    return receipt;
}

void ChunkStore::writePartial(const fs::path& path, std::span<const std::uint8_t> data,
                              const ErrorContext& context) const {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw StorageFault("Failed to create chunk file",
                           std::error_code(errno, std::generic_category()),
                           ErrorContext(context).withPath(path.string()));
    }

    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
        const std::error_code writeError(errno, std::generic_category());
        out.close();
        std::error_code ignored;
        fs::remove(path, ignored);
        throw StorageFault("Failed to write chunk file", writeError,
                           ErrorContext(context).withPath(path.string()));
    }
}

bool ChunkStore::isComplete(std::string_view fileName, std::uint32_t totalChunks) const {
    if (totalChunks == 0) {
        return false;
    }

    auto state = find(makeSessionId(fileName));
    if (!state) {
        return false;
    }

    SessionInfo probe = state->info;
    probe.totalChunks = totalChunks;

    std::lock_guard lock(state->mutex);
    return scanChunks(probe).size() == totalChunks;
}

std::optional<std::vector<ChunkIndex>> ChunkStore::missingIndices(std::string_view fileName) const {
    auto state = find(makeSessionId(fileName));
    if (!state) {
        return std::nullopt;
    }

    std::vector<ChunkRecord> records;
    {
        std::lock_guard lock(state->mutex);
        records = scanChunks(state->info);
    }

    std::vector<ChunkIndex> missing;
    auto it = records.begin();
    for (ChunkIndex index = 0; index < state->info.totalChunks; ++index) {
        if (it != records.end() && it->index == index) {
            ++it;
        } else {
            missing.push_back(index);
        }
    }
    return missing;
}

std::vector<ChunkRecord> ChunkStore::listChunks(std::string_view fileName) const {
    auto state = find(makeSessionId(fileName));
    if (!state) {
        return {};
    }
    std::lock_guard lock(state->mutex);
    return scanChunks(state->info);
}

std::optional<SessionInfo> ChunkStore::session(std::string_view fileName) const {
    return sessionById(makeSessionId(fileName));
}

std::optional<SessionInfo> ChunkStore::sessionById(const SessionId& id) const {
    if (auto state = find(id)) {
        return state->info;
    }
    return std::nullopt;
}

std::vector<SessionInfo> ChunkStore::sessions() const {
    std::lock_guard lock(registryMutex_);
    std::vector<SessionInfo> result;
    result.reserve(sessions_.size());
    for (const auto& [id, state] : sessions_) {
        result.push_back(state->info);
    }
    return result;
}

std::optional<SessionInfo> ChunkStore::forget(const SessionId& id) {
    std::lock_guard lock(registryMutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    SessionInfo info = it->second->info;
    sessions_.erase(it);
    return info;
}

std::shared_ptr<ChunkStore::SessionState> ChunkStore::findOrCreate(const SessionKey& key,
                                                                   std::uint32_t totalChunks) {
    std::lock_guard lock(registryMutex_);

    auto it = sessions_.find(key.id);
    if (it != sessions_.end()) {
        if (it->second->info.totalChunks != totalChunks) {
            throw InvalidIndexError(
                fmt::format("session declared {} chunks, chunk declares {}",
                            it->second->info.totalChunks, totalChunks),
                ErrorContext().withSession(key.id));
        }
        return it->second;
    }

    auto state = std::make_shared<SessionState>();
    state->info.id = key.id;
    state->info.displayName = key.displayName;
    state->info.directory = sessionDirectory(key.id);
    state->info.totalChunks = totalChunks;
    state->info.createdAt = std::chrono::system_clock::now();
    sessions_.emplace(key.id, state);

    PDS_LOG_INFO("Opened upload session {} for '{}' ({} chunks)", key.id, key.displayName,
                 totalChunks);
    return state;
}

std::shared_ptr<ChunkStore::SessionState> ChunkStore::find(const SessionId& id) const {
    std::lock_guard lock(registryMutex_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::vector<ChunkRecord> ChunkStore::scanChunks(const SessionInfo& info) {
    std::vector<ChunkRecord> records;

    std::error_code ec;
    if (!fs::exists(info.directory, ec)) {
        return records;
    }

    fs::directory_iterator iter(info.directory, ec);
    if (ec) {
        throw StorageFault("Failed to list session directory", ec,
                           ErrorContext().withSession(info.id).withPath(info.directory.string()));
    }

    for (; iter != fs::directory_iterator(); iter.increment(ec)) {
        if (ec) {
            break;
        }
        const fs::directory_entry& entry = *iter;
        std::error_code entryError;
        if (!entry.is_regular_file(entryError)) {
            continue;
        }
        auto index = parseChunkFileName(entry.path().filename().string());
        if (!index || *index >= info.totalChunks) {
            continue;
        }
        const std::uintmax_t size = entry.file_size(entryError);
        if (entryError) {
            throw StorageFault("Failed to stat chunk", entryError,
                               ErrorContext().withSession(info.id).withChunk(*index).withPath(
                                   entry.path().string()));
        }
        records.push_back(ChunkRecord{*index, size, entry.path()});
    }
    if (ec) {
        throw StorageFault("Failed to list session directory", ec,
                           ErrorContext().withSession(info.id).withPath(info.directory.string()));
    }

    std::sort(records.begin(), records.end(),
              [](const ChunkRecord& a, const ChunkRecord& b) { return a.index < b.index; });
    return records;
}

}  // namespace pds::session
