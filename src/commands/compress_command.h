// =============================================================================
// pdf-shrink - Compress Command
// =============================================================================
// Command handler that pushes a local PDF through the full upload path:
// split into chunks, storeChunk() each one, finalize on the worker arena and
// write the result.
// =============================================================================

#ifndef PDS_COMMANDS_COMPRESS_COMMAND_H
#define PDS_COMMANDS_COMPRESS_COMMAND_H

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

#include "pds/common/config.h"
#include "pds/common/types.h"

namespace pds::commands {

/// @brief Default chunk size used when splitting the input (1 MiB).
inline constexpr std::size_t kDefaultChunkSize = 1024 * 1024;

/// @brief Configuration options for compression.
struct CompressOptions {
    /// @brief Input PDF file.
    std::filesystem::path inputPath;

    /// @brief Output file; empty = suggested name beside the input.
    std::filesystem::path outputPath;

    /// @brief Level name (screen, ebook, printer, prepress, default).
    std::string level = "screen";

    /// @brief Image resolution in DPI.
    int resolutionDpi = kDefaultResolutionDpi;

    /// @brief Bytes per uploaded chunk.
    std::size_t chunkSize = kDefaultChunkSize;

    /// @brief Overwrite an existing output file.
    bool forceOverwrite = false;

    /// @brief Print the summary to stdout.
    bool printSummary = true;

    ServiceConfig service;
};

class CompressCommand {
public:
    explicit CompressCommand(CompressOptions options);

    ~CompressCommand();

    CompressCommand(const CompressCommand&) = delete;
    CompressCommand& operator=(const CompressCommand&) = delete;
    CompressCommand(CompressCommand&&) noexcept;
    CompressCommand& operator=(CompressCommand&&) noexcept;

    /// @brief Execute the compression.
    /// @return Exit code (0 = success, otherwise the ErrorCode value).
    [[nodiscard]] int execute();

    [[nodiscard]] const CompressOptions& options() const noexcept { return options_; }

private:
    /// @brief Reject bad options before any work is done.
    void validateOptions() const;

    [[nodiscard]] std::filesystem::path resolveOutputPath(const CompressionResult& result) const;

    void printSummary(const CompressionResult& result, const std::filesystem::path& output,
                      std::uint32_t chunks) const;

    CompressOptions options_;
};

}  // namespace pds::commands

#endif  // PDS_COMMANDS_COMPRESS_COMMAND_H
