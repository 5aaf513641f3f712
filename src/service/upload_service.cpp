// =============================================================================
// pdf-shrink - Upload Service Implementation
// =============================================================================

#include "pds/service/upload_service.h"

#include <exception>
#include <mutex>
#include <utility>

#include "pds/common/logger.h"
#include "pds/session/session_key.h"

namespace pds::service {

namespace {

ServiceConfig validated(ServiceConfig config) {
    if (auto valid = config.validate(); !valid) {
        throw UsageError(valid.error().message());
    }
    return config;
}

std::unique_ptr<engine::CompressionEngine> requireEngine(
    std::unique_ptr<engine::CompressionEngine> engine) {
    if (!engine) {
        throw UsageError("no compression engine supplied");
    }
    return engine;
}

int arenaConcurrency(int workerThreads) {
    return workerThreads > 0 ? workerThreads : static_cast<int>(tbb::task_arena::automatic);
}

}  // namespace

UploadService::UploadService(ServiceConfig config,
                             std::unique_ptr<engine::CompressionEngine> engine)
    : config_(validated(std::move(config))),
      engine_(requireEngine(std::move(engine))),
      store_(config_.uploadRoot),
      janitor_(store_, locks_),
      orchestrator_(store_, *engine_, janitor_, locks_),
      // No slot is reserved for an external thread: callers only enqueue.
      arena_(arenaConcurrency(config_.workerThreads), 0) {
    PDS_LOG_INFO("Upload service ready: root={}, engine={} ({}), ttl={}s",
                 store_.root().string(), engine_->name(),
                 engine_->available() ? "available" : "unavailable", config_.sessionTtl.count());

    if (config_.purgeOrphansOnStart) {
        purgeOrphans();
    }
}

UploadService::~UploadService() {
    try {
        std::unique_lock<std::mutex> lock(jobsMutex_);
        if (pendingJobs_ > 0) {
            PDS_LOG_DEBUG("Waiting for {} pending finalize jobs", pendingJobs_);
        }
        jobsDone_.wait(lock, [this] { return pendingJobs_ == 0; });
    } catch (const std::exception& e) {
        PDS_LOG_ERROR("Waiting for pending finalize jobs failed: {}", e.what());
    }
}

void UploadService::finishJob() noexcept {
    std::lock_guard<std::mutex> lock(jobsMutex_);
    --pendingJobs_;
    // Notify under the lock; the destructor may run as soon as it is released.
    jobsDone_.notify_all();
}

ChunkReceipt UploadService::storeChunk(std::string_view fileName, ChunkIndex index,
                                       std::uint32_t totalChunks,
                                       std::span<const std::uint8_t> data) {
    const SessionId id = session::SessionKey::fromFileName(fileName).id;
    auto lock = locks_.lockShared(id);
    return store_.storeChunk(fileName, index, totalChunks, data);
}

CompressionResult UploadService::finalizeAndCompress(std::string_view fileName,
                                                     const CompressionProfile& profile,
                                                     pipeline::FinalizeStats* stats) {
    return orchestrator_.finalizeAndCompress(fileName, profile, stats);
}

CompressionResult UploadService::finalizeAndCompress(std::string_view fileName,
                                                     std::string_view level, int resolutionDpi) {
    auto profile = CompressionProfile::parse(level, resolutionDpi);
    if (!profile) {
        throw InvalidProfileError(profile.error().message());
    }
    return orchestrator_.finalizeAndCompress(fileName, *profile);
}

std::future<CompressionResult> UploadService::submitFinalize(std::string fileName,
                                                             CompressionProfile profile) {
    if (auto valid = profile.validate(); !valid) {
        throw InvalidProfileError(valid.error().message());
    }

    auto promise = std::make_shared<std::promise<CompressionResult>>();
    std::future<CompressionResult> future = promise->get_future();

    {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        ++pendingJobs_;
    }
    arena_.enqueue([this, promise, fileName = std::move(fileName), profile] {
        try {
            promise->set_value(orchestrator_.finalizeAndCompress(fileName, profile));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        finishJob();
    });
    return future;
}

std::size_t UploadService::sweepExpired() {
    return janitor_.sweepExpired(config_.sessionTtl);
}

std::size_t UploadService::purgeOrphans() {
    // Another process may be uploading into the same root; its directories
    // are only orphans once they have gone untouched for a full TTL.
    return janitor_.purgeOrphans(config_.sessionTtl);
}

}  // namespace pds::service
