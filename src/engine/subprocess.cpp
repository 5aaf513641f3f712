// =============================================================================
// pdf-shrink - Subprocess Runner Implementation
// =============================================================================

#include "pds/engine/subprocess.h"

#include <fcntl.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

#include "pds/common/logger.h"
#include "pds/io/file_io.h"

extern char** environ;

namespace pds::engine {

namespace {

/// @brief Owns a posix_spawn_file_actions_t.
class FileActions {
public:
    FileActions() {
        if (int rc = ::posix_spawn_file_actions_init(&actions_); rc != 0) {
            throw std::system_error(rc, std::generic_category(), "posix_spawn_file_actions_init");
        }
    }

    ~FileActions() { ::posix_spawn_file_actions_destroy(&actions_); }

    FileActions(const FileActions&) = delete;
    FileActions& operator=(const FileActions&) = delete;

    void open(int fd, const std::string& path, int flags, mode_t mode) {
        if (int rc = ::posix_spawn_file_actions_addopen(&actions_, fd, path.c_str(), flags, mode);
            rc != 0) {
            throw std::system_error(rc, std::generic_category(), "posix_spawn_file_actions_addopen");
        }
    }

    void dup2(int fd, int newFd) {
        if (int rc = ::posix_spawn_file_actions_adddup2(&actions_, fd, newFd); rc != 0) {
            throw std::system_error(rc, std::generic_category(), "posix_spawn_file_actions_adddup2");
        }
    }

    [[nodiscard]] const posix_spawn_file_actions_t* get() const noexcept { return &actions_; }

private:
    posix_spawn_file_actions_t actions_;
};

}  // namespace

ProcessResult runProcess(const std::filesystem::path& executable,
                         const std::vector<std::string>& arguments,
                         const std::filesystem::path& outputFile) {
    const std::string program = executable.string();
    const std::string capture = outputFile.string();

    FileActions actions;
    actions.open(STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    actions.open(STDOUT_FILENO, capture, O_WRONLY | O_CREAT | O_TRUNC, 0600);
    actions.dup2(STDOUT_FILENO, STDERR_FILENO);

    std::vector<char*> argv;
    argv.reserve(arguments.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const std::string& arg : arguments) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    if (int rc = ::posix_spawn(&pid, program.c_str(), actions.get(), nullptr, argv.data(), environ);
        rc != 0) {
        throw std::system_error(rc, std::generic_category(), "posix_spawn " + program);
    }
    PDS_LOG_DEBUG("Spawned {} (pid {})", program, pid);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
    }

    ProcessResult result;
    if (WIFEXITED(status)) {
        result.exitStatus = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.exitStatus = 128 + WTERMSIG(status);
    } else {
        result.exitStatus = -1;
    }

    std::error_code ec;
    if (std::filesystem::exists(outputFile, ec)) {
        result.output = io::readTextFile(outputFile);
    }

    PDS_LOG_DEBUG("Process {} finished with status {}", pid, result.exitStatus);
    return result;
}

}  // namespace pds::engine
