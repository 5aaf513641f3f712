// =============================================================================
// pdf-shrink - Session Key Implementation
// =============================================================================

#include "pds/session/session_key.h"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>
#include <xxhash.h>

namespace pds::session {

namespace {

[[nodiscard]] bool isAllowedDisplayChar(unsigned char c) noexcept {
    return std::isalnum(c) != 0 || c == '.' || c == '_' || c == '-' || c == ' ';
}

}  // namespace

SessionId makeSessionId(std::string_view fileName) {
    const std::uint64_t hash = XXH64(fileName.data(), fileName.size(), kSessionHashSeed);
    return fmt::format("{:016x}", hash);
}

std::string sanitizeDisplayName(std::string_view fileName) {
    // Keep only the last path component, for either separator style.
    const auto slash = fileName.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        fileName.remove_prefix(slash + 1);
    }

    std::string result;
    result.reserve(std::min(fileName.size(), kMaxDisplayNameLength));
    for (char ch : fileName) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::iscntrl(c) != 0) {
            continue;
        }
        result.push_back(isAllowedDisplayChar(c) ? ch : '_');
        if (result.size() == kMaxDisplayNameLength) {
            break;
        }
    }

    // No hidden files and no "." / ".." survivors.
    const auto firstKept = result.find_first_not_of(". ");
    if (firstKept == std::string::npos) {
        return std::string(kFallbackDisplayName);
    }
    result.erase(0, firstKept);
    while (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    return result;
}

bool looksLikeSessionId(std::string_view name) noexcept {
    return name.size() == kSessionIdLength &&
           std::all_of(name.begin(), name.end(), [](char c) {
               return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
           });
}

SessionKey SessionKey::fromFileName(std::string_view fileName) {
    if (fileName.empty()) {
        throw InvalidFileNameError("file name must not be empty");
    }
    if (fileName.find('\0') != std::string_view::npos) {
        throw InvalidFileNameError("file name must not contain NUL bytes");
    }
    return SessionKey{makeSessionId(fileName), sanitizeDisplayName(fileName)};
}

std::string SessionKey::suggestedFileName() const {
    return std::string(kCompressedNamePrefix) + displayName;
}

}  // namespace pds::session
