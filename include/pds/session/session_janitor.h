// =============================================================================
// pdf-shrink - Session Janitor
// =============================================================================
// Removes session artifacts. Every entry point is best-effort and noexcept:
// failures are logged and reported, never thrown, so a cleanup fault can not
// replace the primary result of a finalize call.
// =============================================================================

#ifndef PDS_SESSION_SESSION_JANITOR_H
#define PDS_SESSION_SESSION_JANITOR_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "pds/session/chunk_store.h"
#include "pds/session/session_locks.h"

namespace pds::session {

/// @brief Outcome of one cleanup.
struct CleanupReport {
    SessionId sessionId;

    /// @brief Whether the session was registered in the store.
    bool wasRegistered = false;

    /// @brief Filesystem entries removed (files plus the directory itself).
    std::uintmax_t removedEntries = 0;

    /// @brief Error text when removal failed.
    std::optional<std::string> failure;

    [[nodiscard]] bool ok() const noexcept { return !failure.has_value(); }
};

class SessionJanitor {
public:
    SessionJanitor(ChunkStore& store, SessionLocks& locks) : store_(store), locks_(locks) {}

    /// @brief Remove every artifact of the session for a file name.
    /// @note Idempotent. The caller is expected to hold the exclusive session
    ///       lock (the orchestrator does).
    CleanupReport cleanup(std::string_view fileName) noexcept;

    /// @brief Same as cleanup() for an already-derived session id.
    CleanupReport cleanupById(const SessionId& id) noexcept;

    /// @brief Remove session directories under the root that the store does not
    ///        know about (left by a previous process).
    /// @param minAge  Only directories last written at least this long ago.
    /// @return Number of directories removed.
    std::size_t purgeOrphans(std::chrono::seconds minAge = std::chrono::seconds{0}) noexcept;

    /// @brief Remove sessions created more than maxAge before now.
    /// @note Sessions whose lock is held (upload or finalize running) are skipped.
    /// @return Number of sessions removed.
    std::size_t sweepExpired(
        std::chrono::seconds maxAge,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) noexcept;

private:
    ChunkStore& store_;
    SessionLocks& locks_;
};

}  // namespace pds::session

#endif  // PDS_SESSION_SESSION_JANITOR_H
