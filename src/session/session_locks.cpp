// =============================================================================
// pdf-shrink - Per-Session Locks Implementation
// =============================================================================

#include "pds/session/session_locks.h"

#include <utility>

namespace pds::session {

// =============================================================================
// Guard
// =============================================================================

SessionLocks::Guard::~Guard() {
    unlock();
}

SessionLocks::Guard::Guard(Guard&& other) noexcept
    : owner_(std::exchange(other.owner_, nullptr)),
      id_(std::move(other.id_)),
      entry_(std::exchange(other.entry_, nullptr)),
      exclusive_(other.exclusive_) {}

SessionLocks::Guard& SessionLocks::Guard::operator=(Guard&& other) noexcept {
    if (this != &other) {
        unlock();
        owner_ = std::exchange(other.owner_, nullptr);
        id_ = std::move(other.id_);
        entry_ = std::exchange(other.entry_, nullptr);
        exclusive_ = other.exclusive_;
    }
    return *this;
}

void SessionLocks::Guard::unlock() noexcept {
    if (entry_ == nullptr) {
        return;
    }
    if (exclusive_) {
        entry_->mutex.unlock();
    } else {
        entry_->mutex.unlock_shared();
    }
    entry_ = nullptr;
    owner_->releaseEntry(id_);
    owner_ = nullptr;
}

// =============================================================================
// SessionLocks
// =============================================================================

SessionLocks::Entry* SessionLocks::acquireEntry(const SessionId& id) {
    std::lock_guard lock(mutex_);
    auto& slot = entries_[id];
    if (!slot) {
        slot = std::make_unique<Entry>();
    }
    ++slot->users;
    return slot.get();
}

void SessionLocks::releaseEntry(const SessionId& id) noexcept {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return;
    }
    if (--it->second->users == 0) {
        entries_.erase(it);
    }
}

SessionLocks::Guard SessionLocks::lockExclusive(const SessionId& id) {
    Entry* entry = acquireEntry(id);
    entry->mutex.lock();
    return Guard(this, id, entry, true);
}

std::optional<SessionLocks::Guard> SessionLocks::tryLockExclusive(const SessionId& id) {
    Entry* entry = acquireEntry(id);
    if (!entry->mutex.try_lock()) {
        releaseEntry(id);
        return std::nullopt;
    }
    return Guard(this, id, entry, true);
}

SessionLocks::Guard SessionLocks::lockShared(const SessionId& id) {
    Entry* entry = acquireEntry(id);
    entry->mutex.lock_shared();
    return Guard(this, id, entry, false);
}

std::size_t SessionLocks::activeCount() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

}  // namespace pds::session
