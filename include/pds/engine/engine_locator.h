// =============================================================================
// pdf-shrink - Engine Locator
// =============================================================================
// Resolves the Ghostscript binary once at startup. Order:
//   1. an explicit path from the configuration
//   2. $GHOSTSCRIPT_PATH (when honored)
//   3. the configured search paths, where a '*' path component is expanded
//      against the directory listing (lexically greatest match first)
// A candidate qualifies only if it is a regular file the process may execute.
// =============================================================================

#ifndef PDS_ENGINE_ENGINE_LOCATOR_H
#define PDS_ENGINE_ENGINE_LOCATOR_H

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pds/common/config.h"

namespace pds::engine {

/// @brief Regular file with execute permission for this process.
[[nodiscard]] bool isExecutableFile(const std::filesystem::path& path) noexcept;

/// @brief Expand one '*' path component; returns matches sorted ascending.
/// @note Patterns without '*' yield the pattern itself.
[[nodiscard]] std::vector<std::filesystem::path> expandSearchPattern(std::string_view pattern);

class EngineLocator {
public:
    explicit EngineLocator(const ServiceConfig& config);

    /// @brief Probe the candidates in order.
    /// @return The first executable candidate, or nullopt.
    [[nodiscard]] std::optional<std::filesystem::path> locate() const;

    /// @brief Every candidate that would be probed, in order (for diagnostics).
    [[nodiscard]] std::vector<std::filesystem::path> candidates() const;

private:
    std::optional<std::filesystem::path> explicitPath_;
    std::vector<std::string> searchPaths_;
    bool honorEnv_;
};

}  // namespace pds::engine

#endif  // PDS_ENGINE_ENGINE_LOCATOR_H
