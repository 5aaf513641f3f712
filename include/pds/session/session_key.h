// =============================================================================
// pdf-shrink - Session Key
// =============================================================================
// Maps an untrusted, caller-supplied file name onto storage keys.
//
// The file name never reaches the filesystem: the session directory is named
// by the xxHash64 of the raw name (16 lowercase hex digits). A separately
// sanitized display name is kept only for the suggested output file name.
// =============================================================================

#ifndef PDS_SESSION_SESSION_KEY_H
#define PDS_SESSION_SESSION_KEY_H

#include <cstdint>
#include <string>
#include <string_view>

#include "pds/common/types.h"

namespace pds::session {

/// @brief Seed for the file name hash; changing it orphans live sessions.
inline constexpr std::uint64_t kSessionHashSeed = 0x7064732d73657373ULL;

/// @brief Length of a session id in characters.
inline constexpr std::size_t kSessionIdLength = 16;

/// @brief Longest display name kept (bytes, before the prefix is added).
inline constexpr std::size_t kMaxDisplayNameLength = 200;

/// @brief Display name used when nothing printable survives sanitizing.
inline constexpr std::string_view kFallbackDisplayName = "document.pdf";

struct SessionKey {
    /// @brief Opaque directory name.
    SessionId id;

    /// @brief Basename restricted to [A-Za-z0-9._ -], for output naming only.
    std::string displayName;

    /// @brief Derive the key for a file name.
    /// @throws InvalidFileNameError if the name is empty or contains NUL.
    [[nodiscard]] static SessionKey fromFileName(std::string_view fileName);

    /// @brief "compressed_<displayName>".
    [[nodiscard]] std::string suggestedFileName() const;
};

/// @brief Hash a file name into a session id.
[[nodiscard]] SessionId makeSessionId(std::string_view fileName);

/// @brief Reduce an untrusted name to a safe basename.
[[nodiscard]] std::string sanitizeDisplayName(std::string_view fileName);

/// @brief True for strings shaped like a session id (used to spot orphans).
[[nodiscard]] bool looksLikeSessionId(std::string_view name) noexcept;

}  // namespace pds::session

#endif  // PDS_SESSION_SESSION_KEY_H
