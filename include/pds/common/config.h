// =============================================================================
// pdf-shrink - Service Configuration
// =============================================================================
// Process-wide settings resolved once at startup and passed down explicitly.
//
// This module provides:
// - ServiceConfig: upload root, engine location, worker sizing, session TTL
// - Default engine search paths (probed once by engine::EngineLocator)
// =============================================================================

#ifndef PDS_COMMON_CONFIG_H
#define PDS_COMMON_CONFIG_H

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "pds/common/error.h"

namespace pds {

// =============================================================================
// Constants
// =============================================================================

/// @brief Directory name created under the system temp directory.
inline constexpr const char* kDefaultUploadDirName = "pdf_uploads";

/// @brief Environment variable naming an explicit engine binary.
inline constexpr const char* kEnginePathEnvVar = "GHOSTSCRIPT_PATH";

/// @brief Sessions untouched for this long are swept by the janitor.
inline constexpr std::chrono::minutes kDefaultSessionTtl{60};

/// @brief PDF compatibility level passed to the engine.
inline constexpr const char* kDefaultCompatibilityLevel = "1.4";

/// @brief Well-known engine install locations, probed in order.
/// @note Entries may contain a single '*' path component (Homebrew Cellar).
[[nodiscard]] std::vector<std::string> defaultEngineSearchPaths();

/// @brief <system temp>/pdf_uploads.
[[nodiscard]] std::filesystem::path defaultUploadRoot();

// =============================================================================
// ServiceConfig
// =============================================================================

struct ServiceConfig {
    /// @brief Root directory holding one subdirectory per active session.
    std::filesystem::path uploadRoot = defaultUploadRoot();

    /// @brief Explicit engine binary; skips probing when set.
    std::optional<std::filesystem::path> enginePath;

    /// @brief Locations probed when enginePath is not set.
    std::vector<std::string> engineSearchPaths = defaultEngineSearchPaths();

    /// @brief Consult GHOSTSCRIPT_PATH before the search paths.
    bool honorEngineEnv = true;

    /// @brief Worker threads for asynchronous finalize (0 = hardware concurrency).
    int workerThreads = 0;

    /// @brief Maximum age of an unfinished session before it is swept.
    std::chrono::seconds sessionTtl = kDefaultSessionTtl;

    /// @brief Remove session directories left by a previous process at startup.
    bool purgeOrphansOnStart = true;

    /// @brief -dCompatibilityLevel passed to the engine.
    std::string compatibilityLevel = kDefaultCompatibilityLevel;

    [[nodiscard]] VoidResult validate() const;
};

}  // namespace pds

#endif  // PDS_COMMON_CONFIG_H
