// =============================================================================
// pdf-shrink - Assembler Implementation
// =============================================================================

#include "pds/pipeline/assembler.h"

#include <cerrno>
#include <fstream>
#include <numeric>
#include <system_error>

#include <fmt/format.h>

#include "pds/common/logger.h"

namespace pds::pipeline {

AssembledFile Assembler::assemble(std::string_view fileName) const {
    const SessionId id = session::makeSessionId(fileName);
    ErrorContext context = ErrorContext(std::string(fileName)).withSession(id);

    auto info = store_.session(fileName);
    auto missing = store_.missingIndices(fileName);
    if (!info || !missing) {
        throw IncompleteUploadError("no upload session exists for this file", context);
    }
    if (!missing->empty()) {
        throw IncompleteUploadError(std::move(*missing), info->totalChunks, context);
    }

    const auto records = store_.listChunks(fileName);
    // A chunk may have vanished between the two listings.
    for (std::size_t i = 0; i < records.size(); ++i) {
        if (records[i].index != i) {
            throw IncompleteUploadError(
                fmt::format("chunk {} disappeared during assembly", i), context);
        }
    }
    if (records.size() != info->totalChunks) {
        throw IncompleteUploadError(
            fmt::format("expected {} chunks, found {}", info->totalChunks, records.size()),
            context);
    }

    const std::uint64_t expectedSize = std::accumulate(
        records.begin(), records.end(), std::uint64_t{0},
        [](std::uint64_t sum, const ChunkRecord& r) { return sum + r.sizeBytes; });

    AssembledFile file;
    file.chunkCount = static_cast<std::uint32_t>(records.size());
    file.bytes.reserve(static_cast<std::size_t>(expectedSize));

    PDS_LOG_INFO("Assembling {} chunks for session {}", records.size(), id);

    for (const ChunkRecord& record : records) {
        std::ifstream in(record.location, std::ios::binary);
        if (!in) {
            throw StorageFault("Failed to open chunk",
                               std::error_code(errno, std::generic_category()),
                               ErrorContext(context).withChunk(record.index).withPath(
                                   record.location.string()));
        }

        const std::size_t offset = file.bytes.size();
        file.bytes.resize(offset + static_cast<std::size_t>(record.sizeBytes));
        in.read(reinterpret_cast<char*>(file.bytes.data() + offset),
                static_cast<std::streamsize>(record.sizeBytes));
        if (static_cast<std::uint64_t>(in.gcount()) != record.sizeBytes) {
            throw StorageFault(fmt::format("short read on chunk: got {} of {} bytes", in.gcount(),
                                           record.sizeBytes),
                               ErrorContext(context).withChunk(record.index).withPath(
                                   record.location.string()));
        }

        PDS_LOG_DEBUG("Chunk {}/{} appended ({:.2f}KB)", record.index + 1, records.size(),
                      static_cast<double>(record.sizeBytes) / 1024.0);
    }

    PDS_LOG_INFO("Assembled session {}: {:.2f}KB", id,
                 static_cast<double>(file.bytes.size()) / 1024.0);
    return file;
}

}  // namespace pds::pipeline
