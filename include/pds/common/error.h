// =============================================================================
// pdf-shrink - Error Handling Framework
// =============================================================================
// Error taxonomy for the upload session manager and compression pipeline.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - PDSException hierarchy grouped into client-input, storage and engine errors
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context (file name, session id, chunk index)
//
// Error classes:
// - Client input: invalid index, empty chunk, bad profile, incomplete upload,
//   unusable file name. Reported to the caller with enough detail to retry.
// - Storage: disk I/O failure while writing or reading chunks.
// - Engine: engine missing, non-zero exit, empty or invalid output. Never
//   retried automatically.
// =============================================================================

#ifndef PDS_COMMON_ERROR_H
#define PDS_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace pds {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error (command line).
    kUsageError = 1,

    /// @brief Storage fault while writing or reading session artifacts.
    kStorageFault = 2,

    /// @brief Chunk index outside [0, totalChunks) or inconsistent chunk count.
    kInvalidIndex = 3,

    /// @brief Zero-length chunk payload.
    kEmptyChunk = 4,

    /// @brief Compression level or resolution out of range.
    kInvalidProfile = 5,

    /// @brief Finalize requested while chunks are missing.
    kIncompleteUpload = 6,

    /// @brief File name empty or unusable as a session key.
    kInvalidFileName = 7,

    /// @brief No compression engine binary was found at startup.
    kEngineUnavailable = 8,

    /// @brief Engine exited with a non-zero status.
    kEngineFailure = 9,

    /// @brief Engine produced no output or an empty output file.
    kEmptyResult = 10,

    /// @brief Engine output failed the format signature check.
    kInvalidOutput = 11
};

/// @brief Broad error class used by callers to decide who has to act.
enum class ErrorClass : std::uint8_t {
    kNone = 0,
    kClientInput,
    kStorage,
    kEngine
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kStorageFault:
            return "storage fault";
        case ErrorCode::kInvalidIndex:
            return "invalid index";
        case ErrorCode::kEmptyChunk:
            return "empty chunk";
        case ErrorCode::kInvalidProfile:
            return "invalid profile";
        case ErrorCode::kIncompleteUpload:
            return "incomplete upload";
        case ErrorCode::kInvalidFileName:
            return "invalid file name";
        case ErrorCode::kEngineUnavailable:
            return "engine unavailable";
        case ErrorCode::kEngineFailure:
            return "compression engine failure";
        case ErrorCode::kEmptyResult:
            return "empty result";
        case ErrorCode::kInvalidOutput:
            return "invalid output";
    }
    return "unknown error";
}

/// @brief Classify an error code.
[[nodiscard]] constexpr ErrorClass classify(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return ErrorClass::kNone;
        case ErrorCode::kStorageFault:
            return ErrorClass::kStorage;
        case ErrorCode::kEngineUnavailable:
        case ErrorCode::kEngineFailure:
        case ErrorCode::kEmptyResult:
        case ErrorCode::kInvalidOutput:
            return ErrorClass::kEngine;
        case ErrorCode::kUsageError:
        case ErrorCode::kInvalidIndex:
        case ErrorCode::kEmptyChunk:
        case ErrorCode::kInvalidProfile:
        case ErrorCode::kIncompleteUpload:
        case ErrorCode::kInvalidFileName:
            return ErrorClass::kClientInput;
    }
    return ErrorClass::kNone;
}

[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

[[nodiscard]] constexpr bool isError(ErrorCode code) noexcept {
    return code != ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief Caller-supplied file name (as received, for diagnostics only).
    std::string fileName;

    /// @brief Opaque session identifier (if known).
    std::string sessionId;

    /// @brief Chunk index involved (if applicable).
    std::optional<std::uint32_t> chunkIndex;

    /// @brief Filesystem path involved (if applicable).
    std::string path;

    /// @brief Source location where the error was created.
    std::source_location location;

    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    explicit ErrorContext(std::string name,
                          std::source_location loc = std::source_location::current())
        : fileName(std::move(name)), location(loc) {}

    ErrorContext& withSession(std::string id) {
        sessionId = std::move(id);
        return *this;
    }

    ErrorContext& withChunk(std::uint32_t index) {
        chunkIndex = index;
        return *this;
    }

    ErrorContext& withPath(std::string p) {
        path = std::move(p);
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all pdf-shrink errors.
class PDSException : public std::exception {
public:
    PDSException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    PDSException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~PDSException() override = default;

    PDSException(const PDSException&) = default;
    PDSException(PDSException&&) noexcept = default;
    PDSException& operator=(const PDSException&) = default;
    PDSException& operator=(PDSException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] ErrorClass errorClass() const noexcept { return classify(code_); }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

/// @brief Exception for command-line usage errors (exit code 1).
class UsageError : public PDSException {
public:
    explicit UsageError(std::string message)
        : PDSException(ErrorCode::kUsageError, std::move(message)) {}
};

// =============================================================================
// Client Input Errors
// =============================================================================

/// @brief Base class for errors caused by the caller's input.
/// @note Never fatal to the server; the caller can correct and retry.
class ClientInputError : public PDSException {
protected:
    ClientInputError(ErrorCode code, std::string message)
        : PDSException(code, std::move(message)) {}

    ClientInputError(ErrorCode code, std::string message, ErrorContext context)
        : PDSException(code, std::move(message), std::move(context)) {}
};

/// @brief Chunk index outside [0, totalChunks), zero totalChunks, or a chunk
///        count that disagrees with the session's declared count.
class InvalidIndexError : public ClientInputError {
public:
    explicit InvalidIndexError(std::string message)
        : ClientInputError(ErrorCode::kInvalidIndex, std::move(message)) {}

    InvalidIndexError(std::string message, ErrorContext context)
        : ClientInputError(ErrorCode::kInvalidIndex, std::move(message), std::move(context)) {}
};

/// @brief Zero-length chunk; signals a corrupted client-side split.
class EmptyChunkError : public ClientInputError {
public:
    explicit EmptyChunkError(std::string message)
        : ClientInputError(ErrorCode::kEmptyChunk, std::move(message)) {}

    EmptyChunkError(std::string message, ErrorContext context)
        : ClientInputError(ErrorCode::kEmptyChunk, std::move(message), std::move(context)) {}
};

/// @brief Compression level or resolution rejected.
class InvalidProfileError : public ClientInputError {
public:
    explicit InvalidProfileError(std::string message)
        : ClientInputError(ErrorCode::kInvalidProfile, std::move(message)) {}
};

/// @brief Session unknown, or one or more chunk indices missing at finalize.
class IncompleteUploadError : public ClientInputError {
public:
    explicit IncompleteUploadError(std::string message)
        : ClientInputError(ErrorCode::kIncompleteUpload, std::move(message)) {}

    IncompleteUploadError(std::string message, ErrorContext context)
        : ClientInputError(ErrorCode::kIncompleteUpload, std::move(message),
                           std::move(context)) {}

    /// @brief Construct with the missing indices so the client can re-upload them.
    IncompleteUploadError(std::vector<std::uint32_t> missing, std::uint32_t totalChunks,
                          ErrorContext context)
        : ClientInputError(ErrorCode::kIncompleteUpload,
                           formatMissing(missing, totalChunks), std::move(context)),
          missing_(std::move(missing)) {}

    /// @brief Indices that were absent at finalize time (empty if the session is unknown).
    [[nodiscard]] const std::vector<std::uint32_t>& missing() const noexcept { return missing_; }

private:
    static std::string formatMissing(const std::vector<std::uint32_t>& missing,
                                     std::uint32_t totalChunks);

    std::vector<std::uint32_t> missing_;
};

/// @brief File name empty or reducible to nothing usable.
class InvalidFileNameError : public ClientInputError {
public:
    explicit InvalidFileNameError(std::string message)
        : ClientInputError(ErrorCode::kInvalidFileName, std::move(message)) {}
};

// =============================================================================
// Storage Errors
// =============================================================================

/// @brief Disk I/O failure during chunk write or assembly.
/// @note The session is left intact so the failing chunk can be retried.
class StorageFault : public PDSException {
public:
    explicit StorageFault(std::string message)
        : PDSException(ErrorCode::kStorageFault, std::move(message)) {}

    StorageFault(std::string message, ErrorContext context)
        : PDSException(ErrorCode::kStorageFault, std::move(message), std::move(context)) {}

    StorageFault(std::string message, std::error_code ec)
        : PDSException(ErrorCode::kStorageFault, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    StorageFault(std::string message, std::error_code ec, ErrorContext context)
        : PDSException(ErrorCode::kStorageFault, formatWithSystemError(message, ec),
                       std::move(context)),
          systemError_(ec) {}

    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

// =============================================================================
// Engine Errors
// =============================================================================

/// @brief Base class for failures of the external compression engine.
class EngineError : public PDSException {
protected:
    EngineError(ErrorCode code, std::string message) : PDSException(code, std::move(message)) {}
};

/// @brief No engine binary was resolved at startup ("fix your deployment").
class EngineUnavailableError : public EngineError {
public:
    explicit EngineUnavailableError(std::string message)
        : EngineError(ErrorCode::kEngineUnavailable, std::move(message)) {}
};

/// @brief Engine exited non-zero; carries its diagnostics verbatim.
class CompressionEngineFailure : public EngineError {
public:
    CompressionEngineFailure(int exitStatus, std::string diagnostics)
        : EngineError(ErrorCode::kEngineFailure, formatFailure(exitStatus, diagnostics)),
          exitStatus_(exitStatus),
          diagnostics_(std::move(diagnostics)) {}

    /// @brief Process exit status, or 128 + signal number when killed by a signal.
    [[nodiscard]] int exitStatus() const noexcept { return exitStatus_; }

    /// @brief Engine stdout and stderr as captured.
    [[nodiscard]] const std::string& diagnostics() const noexcept { return diagnostics_; }

private:
    static std::string formatFailure(int exitStatus, const std::string& diagnostics);

    int exitStatus_;
    std::string diagnostics_;
};

/// @brief Engine produced no output file or a zero-length one.
class EmptyResultFailure : public EngineError {
public:
    explicit EmptyResultFailure(std::string message)
        : EngineError(ErrorCode::kEmptyResult, std::move(message)) {}
};

/// @brief Engine output does not carry the expected document signature.
class InvalidOutputFailure : public EngineError {
public:
    explicit InvalidOutputFailure(std::string message)
        : EngineError(ErrorCode::kInvalidOutput, std::move(message)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    explicit Error(const PDSException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the exception type matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

template <typename T, typename E = Error>
using Result = std::expected<T, E>;

template <typename T>
[[nodiscard]] Result<T> makeSuccess(T value) {
    return Result<T>{std::move(value)};
}

template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Return the value or throw the matching exception.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Execute a value-returning function and convert exceptions to Result.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) -> Result<decltype(func())> {
    try {
        return func();
    } catch (const PDSException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kStorageFault, ex.what()});
    }
}

}  // namespace pds

#endif  // PDS_COMMON_ERROR_H
