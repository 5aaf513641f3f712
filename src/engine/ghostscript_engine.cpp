// =============================================================================
// pdf-shrink - Ghostscript Engine Implementation
// =============================================================================

#include "pds/engine/ghostscript_engine.h"

#include <algorithm>
#include <memory>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "pds/common/logger.h"
#include "pds/engine/engine_locator.h"
#include "pds/engine/subprocess.h"
#include "pds/io/file_io.h"

namespace pds::engine {

namespace fs = std::filesystem;

namespace {

constexpr const char* kInputName = "input.pdf";
constexpr const char* kOutputName = "output.pdf";
constexpr const char* kLogName = "engine.log";

/// @brief Scratch parent under the upload root; never mistaken for a session.
constexpr const char* kEngineScratchDirName = "engine";

/// @brief Longest diagnostics excerpt written to the log.
constexpr std::size_t kMaxLoggedDiagnostics = 2048;

std::string excerpt(const std::string& text) {
    if (text.size() <= kMaxLoggedDiagnostics) {
        return text;
    }
    return text.substr(0, kMaxLoggedDiagnostics) + "...";
}

}  // namespace

bool hasPdfSignature(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < kPdfSignature.size()) {
        return false;
    }
    return std::equal(kPdfSignature.begin(), kPdfSignature.end(), data.begin(),
                      [](char expected, std::uint8_t actual) {
                          return static_cast<std::uint8_t>(expected) == actual;
                      });
}

GhostscriptEngine::GhostscriptEngine(GhostscriptOptions options) : options_(std::move(options)) {}

std::vector<std::string> GhostscriptEngine::buildArguments(const CompressionProfile& profile,
                                                           const fs::path& input,
                                                           const fs::path& output) const {
    const int dpi = profile.resolutionDpi;
    return {
        "-dSAFER",
        "-sDEVICE=pdfwrite",
        fmt::format("-dCompatibilityLevel={}", options_.compatibilityLevel),
        fmt::format("-dPDFSETTINGS=/{}", compressionLevelToString(profile.level)),
        "-dNOPAUSE",
        "-dQUIET",
        "-dBATCH",
        fmt::format("-r{}", dpi),
        "-dColorImageDownsampleType=/Bicubic",
        fmt::format("-dColorImageResolution={}", dpi),
        "-dGrayImageDownsampleType=/Bicubic",
        fmt::format("-dGrayImageResolution={}", dpi),
        "-dMonoImageDownsampleType=/Bicubic",
        fmt::format("-dMonoImageResolution={}", dpi),
        "-dAutoFilterColorImages=false",
        "-dColorImageFilter=/DCTEncode",
        "-dAutoFilterGrayImages=false",
        "-dGrayImageFilter=/DCTEncode",
        fmt::format("-sOutputFile={}", output.string()),
        input.string(),
    };
}

Bytes GhostscriptEngine::compress(std::span<const std::uint8_t> input,
                                  const CompressionProfile& profile) {
    if (!options_.executable) {
        throw EngineUnavailableError(
            fmt::format("Ghostscript was not found; install it or set {}", kEnginePathEnvVar));
    }
    if (auto valid = profile.validate(); !valid) {
        throw InvalidProfileError(valid.error().message());
    }

    const fs::path scratchRoot =
        options_.scratchRoot.empty() ? fs::temp_directory_path() : options_.scratchRoot;
    io::ScopedTempDir scratch(scratchRoot, "pds-gs-");
    const fs::path inputPath = scratch.path() / kInputName;
    const fs::path outputPath = scratch.path() / kOutputName;
    const fs::path logPath = scratch.path() / kLogName;

    io::writeFile(inputPath, input);

    const auto arguments = buildArguments(profile, inputPath, outputPath);
    const std::string commandLine =
        fmt::format("{} {}", options_.executable->string(), fmt::join(arguments, " "));
    PDS_LOG_DEBUG("Running {}", commandLine);

    ProcessResult run;
    try {
        run = runProcess(*options_.executable, arguments, logPath);
    } catch (const std::system_error& e) {
        if (e.code() == std::errc::no_such_file_or_directory ||
            e.code() == std::errc::permission_denied) {
            throw EngineUnavailableError(fmt::format("Ghostscript at {} can not be executed: {}",
                                                     options_.executable->string(), e.what()));
        }
        throw CompressionEngineFailure(-1, e.what());
    }

    if (!run.succeeded()) {
        PDS_LOG_ERROR("Ghostscript exited with status {}: {}", run.exitStatus,
                      excerpt(run.output));
        throw CompressionEngineFailure(run.exitStatus, std::move(run.output));
    }
    if (!run.output.empty()) {
        PDS_LOG_DEBUG("Ghostscript output: {}", excerpt(run.output));
    }

    std::error_code ec;
    if (!fs::exists(outputPath, ec)) {
        throw EmptyResultFailure("Ghostscript produced no output file");
    }

    Bytes result = io::readFile(outputPath);
    if (result.empty()) {
        throw EmptyResultFailure("Ghostscript produced an empty output file");
    }
    if (!hasPdfSignature(result)) {
        throw InvalidOutputFailure("Ghostscript output is not a PDF document");
    }

    PDS_LOG_INFO("Ghostscript /{} at {} DPI: {:.2f}KB -> {:.2f}KB",
                 compressionLevelToString(profile.level), profile.resolutionDpi,
                 static_cast<double>(input.size()) / 1024.0,
                 static_cast<double>(result.size()) / 1024.0);
    return result;
}

std::unique_ptr<CompressionEngine> makeGhostscriptEngine(const ServiceConfig& config) {
    GhostscriptOptions options;
    options.executable = EngineLocator(config).locate();
    options.compatibilityLevel = config.compatibilityLevel;
    options.scratchRoot = config.uploadRoot / kEngineScratchDirName;
    return std::make_unique<GhostscriptEngine>(std::move(options));
}

}  // namespace pds::engine
