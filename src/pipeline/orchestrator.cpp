// =============================================================================
// pdf-shrink - Compression Orchestrator Implementation
// =============================================================================

#include "pds/pipeline/orchestrator.h"

#include <string>
#include <utility>

#include "pds/common/logger.h"
#include "pds/pipeline/assembler.h"
#include "pds/session/session_key.h"

namespace pds::pipeline {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

/// @brief Cleans the session up when the finalize scope exits.
class SessionCleanup {
public:
    SessionCleanup(session::SessionJanitor& janitor, SessionId id) noexcept
        : janitor_(janitor), id_(std::move(id)) {}

    ~SessionCleanup() {
        auto report = janitor_.cleanupById(id_);
        if (!report.ok()) {
            PDS_LOG_ERROR("Session {} was not fully removed: {}", id_, *report.failure);
        }
    }

    SessionCleanup(const SessionCleanup&) = delete;
    SessionCleanup& operator=(const SessionCleanup&) = delete;

private:
    session::SessionJanitor& janitor_;
    SessionId id_;
};

}  // namespace

CompressionResult CompressionOrchestrator::finalizeAndCompress(std::string_view fileName,
                                                               const CompressionProfile& profile,
                                                               FinalizeStats* stats) {
    if (auto valid = profile.validate(); !valid) {
        throw InvalidProfileError(valid.error().message());
    }

    const session::SessionKey key = session::SessionKey::fromFileName(fileName);
    FinalizeStats local;

    auto start = Clock::now();
    auto lock = locks_.lockExclusive(key.id);
    local.lockWait = since(start);

    // Declared after the lock so removal finishes before the lock is released.
    SessionCleanup cleanup(janitor_, key.id);

    const std::string displayName = [&] {
        auto info = store_.session(fileName);
        return info ? info->displayName : key.displayName;
    }();

    PDS_LOG_INFO("Finalizing session {} ('{}') with /{} at {} DPI", key.id, displayName,
                 compressionLevelToString(profile.level), profile.resolutionDpi);

    start = Clock::now();
    AssembledFile assembled = Assembler(store_).assemble(fileName);
    local.assembly = since(start);
    local.chunkCount = assembled.chunkCount;

    start = Clock::now();
    Bytes compressed = engine_.compress(assembled.bytes, profile);
    local.engine = since(start);

    CompressionResult result;
    result.originalSize = assembled.size();
    result.suggestedFileName = std::string(kCompressedNamePrefix) + displayName;

    if (compressed.size() >= assembled.size()) {
        PDS_LOG_WARNING("Engine output ({} bytes) is not smaller than the original ({} bytes), "
                        "returning the original",
                        compressed.size(), assembled.size());
        result.content = std::move(assembled.bytes);
        result.ratioPercent = 0.0;
        result.fallbackApplied = true;
    } else {
        result.content = std::move(compressed);
        result.ratioPercent = compressionRatioPercent(result.originalSize, result.content.size());
    }
    result.compressedSize = result.content.size();

    PDS_LOG_INFO("Session {}: {:.2f}KB -> {:.2f}KB ({:.1f}% saved, engine {}ms)", key.id,
                 static_cast<double>(result.originalSize) / 1024.0,
                 static_cast<double>(result.compressedSize) / 1024.0, result.ratioPercent,
                 local.engine.count());

    if (stats != nullptr) {
        *stats = local;
    }
    return result;
}

}  // namespace pds::pipeline
