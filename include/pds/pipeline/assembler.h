// =============================================================================
// pdf-shrink - Assembler
// =============================================================================
// Concatenates a session's chunks into one byte stream in ascending numeric
// index order, with no separators. Completeness is re-checked immediately
// before reading so a truncated file is never assembled.
// =============================================================================

#ifndef PDS_PIPELINE_ASSEMBLER_H
#define PDS_PIPELINE_ASSEMBLER_H

#include <cstdint>
#include <string_view>

#include "pds/common/types.h"
#include "pds/session/chunk_store.h"

namespace pds::pipeline {

/// @brief The reassembled upload.
struct AssembledFile {
    Bytes bytes;
    std::uint32_t chunkCount = 0;

    [[nodiscard]] std::uint64_t size() const noexcept { return bytes.size(); }
};

class Assembler {
public:
    explicit Assembler(const session::ChunkStore& store) : store_(store) {}

    /// @brief Read and concatenate every chunk of the session.
    /// @throws IncompleteUploadError if the session is unknown or has gaps.
    /// @throws StorageFault on read failure.
    [[nodiscard]] AssembledFile assemble(std::string_view fileName) const;

private:
    const session::ChunkStore& store_;
};

}  // namespace pds::pipeline

#endif  // PDS_PIPELINE_ASSEMBLER_H
