// =============================================================================
// pdf-shrink - Logger Module
// =============================================================================
// Asynchronous logging using Quill.
//
// Usage:
//   pds::log::init("", pds::log::Level::kInfo);
//   PDS_LOG_INFO("Stored chunk {}/{} for session {}", index + 1, total, id);
//
// All PDS_LOG_* macros are safe from any thread once init() has returned.
// =============================================================================

#ifndef PDS_COMMON_LOGGER_H
#define PDS_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace pds::log {

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    /// @brief Enable console output.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "pds";
};

/// @brief Initialize the global logger. Subsequent calls are ignored.
void init(const Config& config);

/// @brief Initialize the global logger with console output and an optional file.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Get the global logger instance.
/// @note Returns nullptr if init() has not been called.
[[nodiscard]] quill::Logger* logger() noexcept;

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Change the minimum level of an initialized logger.
void setLevel(Level level);

/// @brief Block until all pending log messages are written.
void flush();

/// @brief Flush and stop the backend thread.
void shutdown();

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Parse a level name (case-insensitive); unknown names map to kInfo.
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace pds::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define PDS_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(pds::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define PDS_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(pds::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define PDS_LOG_INFO(fmt, ...) \
    LOG_INFO(pds::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define PDS_LOG_WARNING(fmt, ...) \
    LOG_WARNING(pds::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define PDS_LOG_ERROR(fmt, ...) \
    LOG_ERROR(pds::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define PDS_LOG_CRITICAL(fmt, ...) \
    LOG_CRITICAL(pds::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // PDS_COMMON_LOGGER_H
