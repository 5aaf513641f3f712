// =============================================================================
// pdf-shrink - Service Configuration Implementation
// =============================================================================

#include "pds/common/config.h"

#include <format>
#include <system_error>

namespace pds {

std::vector<std::string> defaultEngineSearchPaths() {
    return {
        "/usr/local/bin/gs",
        "/opt/homebrew/bin/gs",
        "/usr/bin/gs",
        "/usr/local/Cellar/ghostscript/*/bin/gs",
    };
}

std::filesystem::path defaultUploadRoot() {
    std::error_code ec;
    std::filesystem::path tmp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    return tmp / kDefaultUploadDirName;
}

VoidResult ServiceConfig::validate() const {
    if (uploadRoot.empty()) {
        return makeVoidError(ErrorCode::kUsageError, "upload root must not be empty");
    }
    if (workerThreads < 0) {
        return makeVoidError(ErrorCode::kUsageError,
                             std::format("worker threads must be >= 0 (got {})", workerThreads));
    }
    if (sessionTtl.count() <= 0) {
        return makeVoidError(ErrorCode::kUsageError, "session TTL must be positive");
    }
    if (compatibilityLevel.empty()) {
        return makeVoidError(ErrorCode::kUsageError, "compatibility level must not be empty");
    }
    if (enginePath.has_value() && enginePath->empty()) {
        return makeVoidError(ErrorCode::kUsageError, "explicit engine path is empty");
    }
    return makeVoidSuccess();
}

}  // namespace pds
