// =============================================================================
// pdf-shrink - Upload Service
// =============================================================================
// The caller-facing facade: chunk uploads, synchronous and asynchronous
// finalize, and the startup / expiry sweeps.
//
// Usage:
//   pds::ServiceConfig config;
//   pds::service::UploadService service(config, pds::engine::makeGhostscriptEngine(config));
//   service.storeChunk("report.pdf", 0, 2, first);
//   service.storeChunk("report.pdf", 1, 2, second);
//   auto result = service.finalizeAndCompress("report.pdf", profile);
//
// Thread safety: every public member may be called concurrently.
// =============================================================================

#ifndef PDS_SERVICE_UPLOAD_SERVICE_H
#define PDS_SERVICE_UPLOAD_SERVICE_H

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>

#include <tbb/task_arena.h>

#include "pds/common/config.h"
#include "pds/common/types.h"
#include "pds/engine/compression_engine.h"
#include "pds/pipeline/orchestrator.h"
#include "pds/session/chunk_store.h"
#include "pds/session/session_janitor.h"
#include "pds/session/session_locks.h"

namespace pds::service {

class UploadService {
public:
    /// @throws UsageError if the configuration is invalid or the engine is null.
    /// @throws StorageFault if the upload root can not be created.
    UploadService(ServiceConfig config, std::unique_ptr<engine::CompressionEngine> engine);

    /// @brief Waits for finalize calls submitted with submitFinalize().
    ~UploadService();

    UploadService(const UploadService&) = delete;
    UploadService& operator=(const UploadService&) = delete;

    /// @brief Store one chunk under the session's shared lock.
    /// @throws InvalidFileNameError, InvalidIndexError, EmptyChunkError, StorageFault
    ChunkReceipt storeChunk(std::string_view fileName, ChunkIndex index,
                            std::uint32_t totalChunks, std::span<const std::uint8_t> data);

    /// @brief Finalize on the calling thread.
    [[nodiscard]] CompressionResult finalizeAndCompress(std::string_view fileName,
                                                        const CompressionProfile& profile,
                                                        pipeline::FinalizeStats* stats = nullptr);

    /// @brief Finalize with an untrusted level name and resolution.
    /// @throws InvalidProfileError if either is out of range.
    [[nodiscard]] CompressionResult finalizeAndCompress(std::string_view fileName,
                                                        std::string_view level,
                                                        int resolutionDpi);

    /// @brief Finalize on the worker arena. The job is enqueued, so it runs on an
    ///        arena worker even when the caller never joins the arena.
    /// @throws InvalidProfileError synchronously; every other failure is
    ///         delivered through the future.
    [[nodiscard]] std::future<CompressionResult> submitFinalize(std::string fileName,
                                                                CompressionProfile profile);

    /// @brief Remove sessions older than the configured TTL.
    std::size_t sweepExpired();

    /// @brief Remove session directories no session in this process owns and
    ///        that have not been written to for the configured TTL.
    std::size_t purgeOrphans();

    [[nodiscard]] const session::ChunkStore& store() const noexcept { return store_; }

    [[nodiscard]] const engine::CompressionEngine& engine() const noexcept { return *engine_; }

    [[nodiscard]] const ServiceConfig& config() const noexcept { return config_; }

    /// @brief Concurrency of the finalize arena.
    [[nodiscard]] int workerThreads() const { return arena_.max_concurrency(); }

private:
    /// @brief Mark one submitted job as finished and wake the destructor.
    void finishJob() noexcept;

    ServiceConfig config_;
    std::unique_ptr<engine::CompressionEngine> engine_;
    session::ChunkStore store_;
    session::SessionLocks locks_;
    session::SessionJanitor janitor_;
    pipeline::CompressionOrchestrator orchestrator_;
    tbb::task_arena arena_;

    std::mutex jobsMutex_;
    std::condition_variable jobsDone_;
    std::size_t pendingJobs_ = 0;
};

}  // namespace pds::service

#endif  // PDS_SERVICE_UPLOAD_SERVICE_H
