// =============================================================================
// pdf-shrink - Chunked PDF Compression
// =============================================================================
// Main entry point for the pdfshrink command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: compress, info, clean
// - Global options: threads, verbose, quiet, upload root, engine path
// - Exit codes equal to the ErrorCode of the failure
// =============================================================================

#include <CLI/CLI.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

#include "pds/common/config.h"
#include "pds/common/error.h"
#include "pds/common/logger.h"
#include "pds/common/types.h"

#include "commands/clean_command.h"
#include "commands/compress_command.h"
#include "commands/info_command.h"

namespace pds::commands {
int runCompress(CLI::App* app);
int runInfo(CLI::App* app);
int runClean(CLI::App* app);
}  // namespace pds::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "pdfshrink: chunked PDF upload and compression through Ghostscript\n"
    "Uploads a document in chunks, reassembles it and rewrites it with the\n"
    "pdfwrite device. The original is kept when the rewrite is not smaller.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int threads = 0;    // 0 = auto-detect
    int verbosity = 0;  // 0 = normal, 1 = verbose, 2 = trace
    bool quiet = false;
    std::string uploadRoot;
    std::string engine;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Compress Command Options
// =============================================================================

struct CliCompressOptions {
    std::string input;
    std::string output;
    std::string level = "screen";
    int resolution = pds::kDefaultResolutionDpi;
    std::size_t chunkSize = pds::commands::kDefaultChunkSize;
    bool force = false;
};

CliCompressOptions gCompressOpts;

// =============================================================================
// Info Command Options
// =============================================================================

struct CliInfoOptions {
    bool json = false;
};

CliInfoOptions gInfoOpts;

// =============================================================================
// Clean Command Options
// =============================================================================

struct CliCleanOptions {
    long long maxAgeMinutes = pds::kDefaultSessionTtl.count();
    bool dryRun = false;
};

CliCleanOptions gCleanOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupCompressCommand(CLI::App& app) {
    auto* compress = app.add_subcommand("compress", "Compress a PDF through the upload pipeline");
    compress->alias("c");

    compress->add_option("-i,--input", gCompressOpts.input, "Input PDF file")
        ->required()
        ->check(CLI::ExistingFile);

    compress->add_option("-o,--output", gCompressOpts.output,
                         "Output file (default: compressed_<name> beside the input)");

    compress->add_option("-l,--level", gCompressOpts.level,
                         "Compression level: screen, ebook, printer, prepress, default")
        ->default_val("screen")
        ->check(CLI::IsMember({"screen", "ebook", "printer", "prepress", "default"}));

    compress->add_option("-r,--resolution", gCompressOpts.resolution, "Image resolution in DPI")
        ->default_val(pds::kDefaultResolutionDpi)
        ->check(CLI::Range(pds::kMinResolutionDpi, pds::kMaxResolutionDpi));

    compress->add_option("--chunk-size", gCompressOpts.chunkSize, "Upload chunk size in bytes")
        ->default_val(pds::commands::kDefaultChunkSize)
        ->check(CLI::PositiveNumber);

    compress->add_flag("-f,--force", gCompressOpts.force, "Overwrite existing output file");
}

void setupInfoCommand(CLI::App& app) {
    auto* info = app.add_subcommand("info", "Show the engine and pending upload sessions");
    info->alias("i");

    info->add_flag("--json", gInfoOpts.json, "Output as JSON");
}

void setupCleanCommand(CLI::App& app) {
    auto* clean = app.add_subcommand("clean", "Remove abandoned upload sessions");

    clean->add_option("--max-age", gCleanOpts.maxAgeMinutes,
                      "Only remove sessions untouched for this many minutes")
        ->default_val(pds::kDefaultSessionTtl.count())
        ->check(CLI::NonNegativeNumber);

    clean->add_flag("-n,--dry-run", gCleanOpts.dryRun, "List sessions without removing them");
}

/// @brief ServiceConfig from the global options.
pds::ServiceConfig buildServiceConfig() {
    pds::ServiceConfig config;
    config.workerThreads = gOptions.threads;
    if (!gOptions.uploadRoot.empty()) {
        config.uploadRoot = gOptions.uploadRoot;
    }
    if (!gOptions.engine.empty()) {
        config.enginePath = std::filesystem::path(gOptions.engine);
    }
    return config;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_option("-t,--threads", gOptions.threads, "Finalize worker threads (0 = auto-detect)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v, -vv for trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--upload-root", gOptions.uploadRoot,
                   "Directory holding upload sessions (default: <tmp>/pdf_uploads)");

    app.add_option("--engine", gOptions.engine,
                   "Ghostscript binary (default: $GHOSTSCRIPT_PATH, then well-known paths)");

    app.add_option("--log-file", gOptions.logFile, "Also write logs to this file");

    setupCompressCommand(app);
    setupInfoCommand(app);
    setupCleanCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    try {
        auto logLevel = pds::log::Level::kInfo;
        if (gOptions.quiet) {
            logLevel = pds::log::Level::kError;
        } else if (gOptions.verbosity >= 2) {
            logLevel = pds::log::Level::kTrace;
        } else if (gOptions.verbosity >= 1) {
            logLevel = pds::log::Level::kDebug;
        }
        pds::log::init(gOptions.logFile, logLevel);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return pds::toExitCode(pds::ErrorCode::kUsageError);
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("compress")) {
            exitCode = pds::commands::runCompress(app.get_subcommand("compress"));
        } else if (app.got_subcommand("info")) {
            exitCode = pds::commands::runInfo(app.get_subcommand("info"));
        } else if (app.got_subcommand("clean")) {
            exitCode = pds::commands::runClean(app.get_subcommand("clean"));
        }
    } catch (const pds::PDSException& ex) {
        PDS_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        PDS_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = pds::toExitCode(pds::ErrorCode::kStorageFault);
    }

    pds::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace pds::commands {

int runCompress([[maybe_unused]] CLI::App* app) {
    CompressOptions opts;
    opts.inputPath = gCompressOpts.input;
    opts.outputPath = gCompressOpts.output;
    opts.level = gCompressOpts.level;
    opts.resolutionDpi = gCompressOpts.resolution;
    opts.chunkSize = gCompressOpts.chunkSize;
    opts.forceOverwrite = gCompressOpts.force;
    opts.printSummary = !gOptions.quiet;
    opts.service = buildServiceConfig();

    auto cmd = std::make_unique<CompressCommand>(std::move(opts));
    return cmd->execute();
}

int runInfo([[maybe_unused]] CLI::App* app) {
    auto cmd = createInfoCommand(buildServiceConfig(), gInfoOpts.json);
    return cmd->execute();
}

int runClean([[maybe_unused]] CLI::App* app) {
    CleanOptions opts;
    opts.service = buildServiceConfig();
    opts.maxAge = std::chrono::minutes(gCleanOpts.maxAgeMinutes);
    opts.dryRun = gCleanOpts.dryRun;

    CleanCommand cmd(std::move(opts));
    return cmd.execute();
}

}  // namespace pds::commands
