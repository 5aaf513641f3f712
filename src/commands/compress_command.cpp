// =============================================================================
// pdf-shrink - Compress Command Implementation
// =============================================================================

#include "compress_command.h"

#include <algorithm>
#include <iostream>
#include <span>

#include <fmt/format.h>

#include "pds/common/logger.h"
#include "pds/engine/ghostscript_engine.h"
#include "pds/io/file_io.h"
#include "pds/service/upload_service.h"

namespace pds::commands {

namespace fs = std::filesystem;

CompressCommand::CompressCommand(CompressOptions options) : options_(std::move(options)) {}

CompressCommand::~CompressCommand() = default;

CompressCommand::CompressCommand(CompressCommand&&) noexcept = default;
CompressCommand& CompressCommand::operator=(CompressCommand&&) noexcept = default;

int CompressCommand::execute() {
    try {
        validateOptions();

        auto profile = unwrapOrThrow(CompressionProfile::parse(options_.level,
                                                               options_.resolutionDpi));

        const Bytes input = io::readFile(options_.inputPath);
        if (input.empty()) {
            throw UsageError("Input file is empty: " + options_.inputPath.string());
        }

        const std::string fileName = options_.inputPath.filename().string();
        const std::size_t chunkSize = options_.chunkSize;
        const std::uint32_t totalChunks = unwrapOrThrow(chunkCountFor(input.size(), chunkSize));

        service::UploadService service(options_.service,
                                       engine::makeGhostscriptEngine(options_.service));

        PDS_LOG_INFO("Uploading {} ({:.2f}KB) as {} chunks", fileName,
                     static_cast<double>(input.size()) / 1024.0, totalChunks);

        const std::span<const std::uint8_t> all(input);
        for (std::uint32_t index = 0; index < totalChunks; ++index) {
            const std::size_t offset = static_cast<std::size_t>(index) * chunkSize;
            const std::size_t length = std::min(chunkSize, input.size() - offset);
            auto receipt = service.storeChunk(fileName, index, totalChunks,
                                              all.subspan(offset, length));
            PDS_LOG_DEBUG("Chunk {}/{} stored, progress {}", index + 1, totalChunks,
                          receipt.progressLabel());
        }

        CompressionResult result = service.submitFinalize(fileName, profile).get();

        const fs::path output = resolveOutputPath(result);
        io::writeFile(output, result.content);

        if (options_.printSummary) {
            printSummary(result, output, totalChunks);
        }
        return 0;

    } catch (const PDSException& e) {
        PDS_LOG_ERROR("Compression failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        PDS_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kStorageFault);
    }
}

void CompressCommand::validateOptions() const {
    if (options_.chunkSize == 0) {
        throw UsageError("Chunk size must be positive");
    }

    std::error_code ec;
    if (!fs::is_regular_file(options_.inputPath, ec)) {
        throw UsageError("Input file not found: " + options_.inputPath.string());
    }

    if (!options_.outputPath.empty() && !options_.forceOverwrite &&
        fs::exists(options_.outputPath, ec)) {
        throw UsageError("Output file exists (use --force to overwrite): " +
                         options_.outputPath.string());
    }
}

fs::path CompressCommand::resolveOutputPath(const CompressionResult& result) const {
    if (!options_.outputPath.empty()) {
        return options_.outputPath;
    }

    fs::path output = options_.inputPath.parent_path() / result.suggestedFileName;
    std::error_code ec;
    if (!options_.forceOverwrite && fs::exists(output, ec)) {
        throw UsageError("Output file exists (use --force to overwrite): " + output.string());
    }
    return output;
}

void CompressCommand::printSummary(const CompressionResult& result, const fs::path& output,
                                   std::uint32_t chunks) const {
    std::cout << fmt::format("Input:        {} ({} bytes, {} chunks)\n",
                             options_.inputPath.string(), result.originalSize, chunks);
    std::cout << fmt::format("Output:       {} ({} bytes)\n", output.string(),
                             result.compressedSize);
    std::cout << fmt::format("Profile:      /{} at {} DPI\n", options_.level,
                             options_.resolutionDpi);
    if (result.fallbackApplied) {
        std::cout << "Result:       engine output was not smaller, original kept\n";
    } else {
        std::cout << fmt::format("Reduction:    {:.1f}%\n", result.ratioPercent);
    }
}

}  // namespace pds::commands
