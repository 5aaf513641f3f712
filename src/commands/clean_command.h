// =============================================================================
// pdf-shrink - Clean Command
// =============================================================================
// Removes session directories left under the upload root by processes that
// exited before finalizing.
// =============================================================================

#ifndef PDS_COMMANDS_CLEAN_COMMAND_H
#define PDS_COMMANDS_CLEAN_COMMAND_H

#include <chrono>
#include <utility>

#include "pds/common/config.h"

namespace pds::commands {

/// @brief Configuration options for clean command.
struct CleanOptions {
    ServiceConfig service;

    /// @brief Only remove directories untouched for at least this long.
    std::chrono::seconds maxAge = kDefaultSessionTtl;

    /// @brief List what would be removed without removing it.
    bool dryRun = false;
};

class CleanCommand {
public:
    explicit CleanCommand(CleanOptions options) : options_(std::move(options)) {}

    /// @brief Execute the clean command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

private:
    CleanOptions options_;
};

}  // namespace pds::commands

#endif  // PDS_COMMANDS_CLEAN_COMMAND_H
