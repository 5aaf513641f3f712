// =============================================================================
// pdf-shrink - Session Janitor Implementation
// =============================================================================

#include "pds/session/session_janitor.h"

#include <filesystem>
#include <system_error>

#include "pds/common/logger.h"

namespace pds::session {

namespace fs = std::filesystem;

CleanupReport SessionJanitor::cleanup(std::string_view fileName) noexcept {
    try {
        return cleanupById(makeSessionId(fileName));
    } catch (const std::exception& e) {
        PDS_LOG_ERROR("Cleanup failed before removal: {}", e.what());
        CleanupReport report;
        report.failure = e.what();
        return report;
    }
}

CleanupReport SessionJanitor::cleanupById(const SessionId& id) noexcept {
    CleanupReport report;
    try {
        report.sessionId = id;
        report.wasRegistered = store_.forget(id).has_value();

        const fs::path dir = store_.sessionDirectory(id);
        std::error_code ec;
        if (!fs::exists(dir, ec)) {
            if (ec) {
                report.failure = ec.message();
                PDS_LOG_ERROR("Cleanup of session {} could not stat {}: {}", id, dir.string(),
                              ec.message());
            }
            return report;
        }

        const std::uintmax_t removed = fs::remove_all(dir, ec);
        if (ec) {
            report.failure = ec.message();
            PDS_LOG_ERROR("Cleanup of session {} failed: {}", id, ec.message());
            return report;
        }

        report.removedEntries = removed;
        PDS_LOG_INFO("Cleaned session {} ({} entries removed)", id, removed);
    } catch (const std::exception& e) {
        report.failure = e.what();
        PDS_LOG_ERROR("Cleanup of session {} failed: {}", id, e.what());
    }
    return report;
}

std::size_t SessionJanitor::purgeOrphans(std::chrono::seconds minAge) noexcept {
    std::size_t purged = 0;
    try {
        const auto now = fs::file_time_type::clock::now();
        for (const StoredSession& stored : scanSessionDirectories(store_.root())) {
            if (minAge.count() > 0 && now - stored.lastWrite < minAge) {
                continue;
            }
            auto guard = locks_.tryLockExclusive(stored.id);
            if (!guard || store_.sessionById(stored.id).has_value()) {
                continue;
            }
            if (cleanupById(stored.id).ok()) {
                ++purged;
            }
        }
    } catch (const std::exception& e) {
        PDS_LOG_ERROR("Orphan purge of {} aborted: {}", store_.root().string(), e.what());
    }

    if (purged > 0) {
        PDS_LOG_INFO("Purged {} orphaned session directories", purged);
    }
    return purged;
}

std::size_t SessionJanitor::sweepExpired(std::chrono::seconds maxAge,
                                         std::chrono::system_clock::time_point now) noexcept {
    std::size_t swept = 0;
    try {
        for (const SessionInfo& info : store_.sessions()) {
            if (now - info.createdAt < maxAge) {
                continue;
            }
            auto guard = locks_.tryLockExclusive(info.id);
            if (!guard) {
                PDS_LOG_DEBUG("Session {} is busy, skipping expiry", info.id);
                continue;
            }
            PDS_LOG_WARNING("Session {} for '{}' expired with upload unfinished", info.id,
                            info.displayName);
            if (cleanupById(info.id).ok()) {
                ++swept;
            }
        }
    } catch (const std::exception& e) {
        PDS_LOG_ERROR("Expiry sweep aborted: {}", e.what());
    }
    return swept;
}

}  // namespace pds::session
