// =============================================================================
// pdf-shrink - Info Command
// =============================================================================
// Command handler for displaying the resolved engine and the session
// directories currently present under the upload root.
//
// This module provides:
// - InfoCommand: text or JSON report
// =============================================================================

#ifndef PDS_COMMANDS_INFO_COMMAND_H
#define PDS_COMMANDS_INFO_COMMAND_H

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "pds/common/config.h"
#include "pds/session/chunk_store.h"

namespace pds::commands {

/// @brief Configuration options for info command.
struct InfoOptions {
    ServiceConfig service;

    /// @brief Output as JSON.
    bool jsonOutput = false;
};

class InfoCommand {
public:
    explicit InfoCommand(InfoOptions options);

    ~InfoCommand();

    InfoCommand(const InfoCommand&) = delete;
    InfoCommand& operator=(const InfoCommand&) = delete;
    InfoCommand(InfoCommand&&) noexcept;
    InfoCommand& operator=(InfoCommand&&) noexcept;

    /// @brief Execute the info command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const InfoOptions& options() const noexcept { return options_; }

private:
    struct Report {
        std::optional<std::filesystem::path> engine;
        std::vector<std::filesystem::path> candidates;
        std::vector<session::StoredSession> sessions;
    };

    [[nodiscard]] Report collect() const;

    void printTextInfo(const Report& report) const;

    void printJsonInfo(const Report& report) const;

    InfoOptions options_;
};

/// @brief Create an info command from CLI options.
[[nodiscard]] std::unique_ptr<InfoCommand> createInfoCommand(const ServiceConfig& service,
                                                             bool jsonOutput);

}  // namespace pds::commands

#endif  // PDS_COMMANDS_INFO_COMMAND_H
