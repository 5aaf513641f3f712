// =============================================================================
// pdf-shrink - Clean Command Implementation
// =============================================================================

#include "clean_command.h"

#include <iostream>

#include "pds/common/logger.h"
#include "pds/session/chunk_store.h"
#include "pds/session/session_janitor.h"
#include "pds/session/session_locks.h"

namespace pds::commands {

int CleanCommand::execute() {
    try {
        if (options_.maxAge.count() < 0) {
            throw UsageError("--max-age must not be negative");
        }

        if (options_.dryRun) {
            const auto now = std::filesystem::file_time_type::clock::now();
            std::size_t candidates = 0;
            for (const auto& stored : session::scanSessionDirectories(options_.service.uploadRoot)) {
                if (now - stored.lastWrite >= options_.maxAge) {
                    std::cout << "would remove " << stored.directory.string() << std::endl;
                    ++candidates;
                }
            }
            std::cout << candidates << " session directories would be removed" << std::endl;
            return 0;
        }

        session::ChunkStore store(options_.service.uploadRoot);
        session::SessionLocks locks;
        session::SessionJanitor janitor(store, locks);

        const std::size_t removed = janitor.purgeOrphans(options_.maxAge);
        std::cout << removed << " session directories removed" << std::endl;
        return 0;

    } catch (const PDSException& e) {
        PDS_LOG_ERROR("Clean command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        PDS_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kStorageFault);
    }
}

}  // namespace pds::commands
