// =============================================================================
// pdf-shrink - Subprocess Runner
// =============================================================================
// Spawns an external program with argv (no shell), stdin from /dev/null and
// stdout + stderr captured to a file, then waits for it.
// =============================================================================

#ifndef PDS_ENGINE_SUBPROCESS_H
#define PDS_ENGINE_SUBPROCESS_H

#include <filesystem>
#include <string>
#include <vector>

namespace pds::engine {

/// @brief Outcome of one child process.
struct ProcessResult {
    /// @brief Exit status, or 128 + signal number when killed by a signal.
    int exitStatus = 0;

    bool signaled = false;

    /// @brief Combined stdout and stderr.
    std::string output;

    [[nodiscard]] bool succeeded() const noexcept { return !signaled && exitStatus == 0; }
};

/// @brief Run a program to completion.
/// @param executable  Absolute path of the program.
/// @param arguments   argv[1..]; argv[0] is the executable path.
/// @param outputFile  File receiving stdout and stderr (created or truncated).
/// @throws std::system_error if the process can not be spawned or waited for.
[[nodiscard]] ProcessResult runProcess(const std::filesystem::path& executable,
                                       const std::vector<std::string>& arguments,
                                       const std::filesystem::path& outputFile);

}  // namespace pds::engine

#endif  // PDS_ENGINE_SUBPROCESS_H
