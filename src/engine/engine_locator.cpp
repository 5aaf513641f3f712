// =============================================================================
// pdf-shrink - Engine Locator Implementation
// =============================================================================

#include "pds/engine/engine_locator.h"

#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <system_error>

#include "pds/common/logger.h"

namespace pds::engine {

namespace fs = std::filesystem;

bool isExecutableFile(const fs::path& path) noexcept {
    std::error_code ec;
    if (path.empty() || !fs::is_regular_file(path, ec) || ec) {
        return false;
    }
    return ::access(path.c_str(), X_OK) == 0;
}

std::vector<fs::path> expandSearchPattern(std::string_view pattern) {
    const fs::path full{std::string(pattern)};

    fs::path prefix;
    fs::path suffix;
    bool wildcard = false;
    for (const fs::path& part : full) {
        if (!wildcard && part == "*") {
            wildcard = true;
            continue;
        }
        if (wildcard) {
            suffix /= part;
        } else {
            prefix /= part;
        }
    }
    if (!wildcard) {
        return {full};
    }

    std::vector<fs::path> matches;
    std::error_code ec;
    fs::directory_iterator iter(prefix, ec);
    for (; !ec && iter != fs::directory_iterator(); iter.increment(ec)) {
        std::error_code entryError;
        if (iter->is_directory(entryError)) {
            matches.push_back(suffix.empty() ? iter->path() : iter->path() / suffix);
        }
    }
    std::sort(matches.begin(), matches.end());
    return matches;
}

EngineLocator::EngineLocator(const ServiceConfig& config)
    : explicitPath_(config.enginePath),
      searchPaths_(config.engineSearchPaths),
      honorEnv_(config.honorEngineEnv) {}

std::vector<fs::path> EngineLocator::candidates() const {
    std::vector<fs::path> result;
    if (explicitPath_) {
        result.push_back(*explicitPath_);
        return result;
    }

    if (honorEnv_) {
        if (const char* env = std::getenv(kEnginePathEnvVar); env != nullptr && *env != '\0') {
            result.emplace_back(env);
        }
    }

    for (const std::string& pattern : searchPaths_) {
        auto expanded = expandSearchPattern(pattern);
        // Lexically greatest match first (newest Cellar version in practice).
        std::reverse(expanded.begin(), expanded.end());
        result.insert(result.end(), expanded.begin(), expanded.end());
    }
    return result;
}

std::optional<fs::path> EngineLocator::locate() const {
    for (const fs::path& candidate : candidates()) {
        if (isExecutableFile(candidate)) {
            PDS_LOG_INFO("Using compression engine at {}", candidate.string());
            return candidate;
        }
        PDS_LOG_DEBUG("Engine candidate rejected: {}", candidate.string());
    }

    if (explicitPath_) {
        PDS_LOG_ERROR("Configured engine {} is not an executable file", explicitPath_->string());
    } else {
        PDS_LOG_WARNING("No compression engine found; set {} or install Ghostscript",
                        kEnginePathEnvVar);
    }
    return std::nullopt;
}

}  // namespace pds::engine
