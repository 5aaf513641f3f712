// =============================================================================
// pdf-shrink - Error Handling Framework Implementation
// =============================================================================

#include "pds/common/error.h"

#include <format>
#include <sstream>

namespace pds {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    auto separate = [&]() {
        if (hasContent) {
            oss << ", ";
        }
        hasContent = true;
    };

    if (!fileName.empty()) {
        separate();
        oss << "file: " << fileName;
    }

    if (!sessionId.empty()) {
        separate();
        oss << "session: " << sessionId;
    }

    if (chunkIndex.has_value()) {
        separate();
        oss << "chunk: " << *chunkIndex;
    }

    if (!path.empty()) {
        separate();
        oss << "path: " << path;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// PDSException Implementation
// =============================================================================

void PDSException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// Specific Exception Formatting
// =============================================================================

std::string IncompleteUploadError::formatMissing(const std::vector<std::uint32_t>& missing,
                                                 std::uint32_t totalChunks) {
    // Long gaps are truncated; the full list stays available through missing().
    constexpr std::size_t kMaxListed = 16;

    std::ostringstream oss;
    oss << "upload incomplete: " << missing.size() << " of " << totalChunks
        << " chunks missing [";
    for (std::size_t i = 0; i < missing.size() && i < kMaxListed; ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << missing[i];
    }
    if (missing.size() > kMaxListed) {
        oss << ", ...";
    }
    oss << "]";
    return oss.str();
}

std::string StorageFault::formatWithSystemError(const std::string& message, std::error_code ec) {
    return std::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string CompressionEngineFailure::formatFailure(int exitStatus,
                                                    const std::string& diagnostics) {
    if (diagnostics.empty()) {
        return std::format("engine exited with status {} (no diagnostics)", exitStatus);
    }
    return std::format("engine exited with status {}:\n{}", exitStatus, diagnostics);
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kStorageFault:
            throw StorageFault(message_);
        case ErrorCode::kInvalidIndex:
            throw InvalidIndexError(message_);
        case ErrorCode::kEmptyChunk:
            throw EmptyChunkError(message_);
        case ErrorCode::kInvalidProfile:
            throw InvalidProfileError(message_);
        case ErrorCode::kIncompleteUpload:
            throw IncompleteUploadError(message_);
        case ErrorCode::kInvalidFileName:
            throw InvalidFileNameError(message_);
        case ErrorCode::kEngineUnavailable:
            throw EngineUnavailableError(message_);
        case ErrorCode::kEngineFailure:
            throw CompressionEngineFailure(-1, message_);
        case ErrorCode::kEmptyResult:
            throw EmptyResultFailure(message_);
        case ErrorCode::kInvalidOutput:
            throw InvalidOutputFailure(message_);
        case ErrorCode::kSuccess:
            throw PDSException(ErrorCode::kSuccess, message_);
    }
    throw PDSException(code_, message_);
}

}  // namespace pds
