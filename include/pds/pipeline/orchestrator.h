// =============================================================================
// pdf-shrink - Compression Orchestrator
// =============================================================================
// Runs one finalize: completeness check, assembly, engine call, fallback and
// cleanup, all under the session's exclusive lock.
//
// Guarantees:
// - The returned content is never larger than the assembled upload. When the
//   engine output is not strictly smaller, the original bytes are returned
//   with ratio 0 and fallbackApplied set.
// - The session's artifacts are removed on every outcome, success or failure.
//   A cleanup fault is logged and never replaces the primary result.
// - A second finalize for the same file name waits for the first and then
//   fails with IncompleteUploadError, since the chunks are gone.
// =============================================================================

#ifndef PDS_PIPELINE_ORCHESTRATOR_H
#define PDS_PIPELINE_ORCHESTRATOR_H

#include <chrono>
#include <cstdint>
#include <string_view>

#include "pds/common/types.h"
#include "pds/engine/compression_engine.h"
#include "pds/session/chunk_store.h"
#include "pds/session/session_janitor.h"
#include "pds/session/session_locks.h"

namespace pds::pipeline {

/// @brief Timings of the last finalize, for logging and the CLI summary.
struct FinalizeStats {
    std::chrono::milliseconds lockWait{0};
    std::chrono::milliseconds assembly{0};
    std::chrono::milliseconds engine{0};
    std::uint32_t chunkCount = 0;
};

class CompressionOrchestrator {
public:
    CompressionOrchestrator(session::ChunkStore& store, engine::CompressionEngine& engine,
                            session::SessionJanitor& janitor, session::SessionLocks& locks)
        : store_(store), engine_(engine), janitor_(janitor), locks_(locks) {}

    /// @brief Assemble, compress and clean up one upload session.
    /// @throws InvalidProfileError before any state is touched.
    /// @throws IncompleteUploadError, StorageFault or any EngineError; the
    ///         session is cleaned up in every case.
    [[nodiscard]] CompressionResult finalizeAndCompress(std::string_view fileName,
                                                        const CompressionProfile& profile,
                                                        FinalizeStats* stats = nullptr);

private:
    session::ChunkStore& store_;
    engine::CompressionEngine& engine_;
    session::SessionJanitor& janitor_;
    session::SessionLocks& locks_;
};

}  // namespace pds::pipeline

#endif  // PDS_PIPELINE_ORCHESTRATOR_H
