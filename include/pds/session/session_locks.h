// =============================================================================
// pdf-shrink - Per-Session Locks
// =============================================================================
// Reader/writer exclusion keyed by session id.
//
// - Chunk uploads hold the shared side, so uploads to one session run
//   concurrently with each other.
// - Finalize holds the exclusive side for its whole validate / assemble /
//   compress / cleanup sequence, so at most one compression runs per session
//   and no upload lands in a directory that is being removed.
//
// Entries are reference counted and erased when the last guard is released,
// so the table only holds sessions that are in use.
// =============================================================================

#ifndef PDS_SESSION_SESSION_LOCKS_H
#define PDS_SESSION_SESSION_LOCKS_H

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

#include "pds/common/types.h"

namespace pds::session {

class SessionLocks {
private:
    struct Entry {
        std::shared_mutex mutex;
        std::size_t users = 0;
    };

public:
    /// @brief RAII holder of one side of a session lock.
    class Guard {
    public:
        Guard() = default;
        ~Guard();

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&& other) noexcept;

        [[nodiscard]] bool ownsLock() const noexcept { return entry_ != nullptr; }

        [[nodiscard]] bool exclusive() const noexcept { return exclusive_; }

        /// @brief Release early; the destructor then does nothing.
        void unlock() noexcept;

    private:
        friend class SessionLocks;

        Guard(SessionLocks* owner, SessionId id, Entry* entry, bool exclusive) noexcept
            : owner_(owner), id_(std::move(id)), entry_(entry), exclusive_(exclusive) {}

        SessionLocks* owner_ = nullptr;
        SessionId id_;
        Entry* entry_ = nullptr;
        bool exclusive_ = false;
    };

    SessionLocks() = default;

    SessionLocks(const SessionLocks&) = delete;
    SessionLocks& operator=(const SessionLocks&) = delete;

    /// @brief Block until the session can be held exclusively.
    [[nodiscard]] Guard lockExclusive(const SessionId& id);

    /// @brief Exclusive lock without waiting; nullopt if the session is busy.
    [[nodiscard]] std::optional<Guard> tryLockExclusive(const SessionId& id);

    /// @brief Block until the session can be held shared.
    [[nodiscard]] Guard lockShared(const SessionId& id);

    /// @brief Number of sessions with at least one holder or waiter.
    [[nodiscard]] std::size_t activeCount() const;

private:
    Entry* acquireEntry(const SessionId& id);
    void releaseEntry(const SessionId& id) noexcept;

    mutable std::mutex mutex_;
    std::unordered_map<SessionId, std::unique_ptr<Entry>> entries_;
};

}  // namespace pds::session

#endif  // PDS_SESSION_SESSION_LOCKS_H
