// =============================================================================
// pdf-shrink - Info Command Implementation
// =============================================================================

#include "info_command.h"

#include <chrono>
#include <iostream>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "pds/common/logger.h"
#include "pds/engine/engine_locator.h"

namespace pds::commands {

namespace {

/// @brief Minimal JSON string escaping for paths.
std::string jsonEscape(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    for (char c : text) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out += c;
                }
        }
    }
    return out;
}

/// @brief Seconds since the directory was last written.
long long ageSeconds(std::filesystem::file_time_type lastWrite) {
    const auto age = std::filesystem::file_time_type::clock::now() - lastWrite;
    return std::chrono::duration_cast<std::chrono::seconds>(age).count();
}

}  // namespace

InfoCommand::InfoCommand(InfoOptions options) : options_(std::move(options)) {}

InfoCommand::~InfoCommand() = default;

InfoCommand::InfoCommand(InfoCommand&&) noexcept = default;
InfoCommand& InfoCommand::operator=(InfoCommand&&) noexcept = default;

int InfoCommand::execute() {
    try {
        const Report report = collect();
        if (options_.jsonOutput) {
            printJsonInfo(report);
        } else {
            printTextInfo(report);
        }
        return 0;

    } catch (const PDSException& e) {
        PDS_LOG_ERROR("Info command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        PDS_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kStorageFault);
    }
}

InfoCommand::Report InfoCommand::collect() const {
    const engine::EngineLocator locator(options_.service);

    Report report;
    report.candidates = locator.candidates();
    report.engine = locator.locate();
    report.sessions = session::scanSessionDirectories(options_.service.uploadRoot);
    return report;
}

void InfoCommand::printTextInfo(const Report& report) const {
    std::cout << "=== pdf-shrink ===" << std::endl;
    std::cout << std::endl;
    std::cout << "Engine:         "
              << (report.engine ? report.engine->string() : std::string("NOT FOUND")) << std::endl;
    for (const auto& candidate : report.candidates) {
        std::cout << "  probed:       " << candidate.string() << std::endl;
    }
    std::cout << "Upload root:    " << options_.service.uploadRoot.string() << std::endl;
    std::cout << "Session TTL:    " << options_.service.sessionTtl.count() << "s" << std::endl;
    std::cout << std::endl;

    std::cout << "--- Sessions (" << report.sessions.size() << ") ---" << std::endl;
    for (const auto& stored : report.sessions) {
        std::cout << fmt::format("{}  {:>5} chunks  {:>12} bytes  {:>8}s old", stored.id,
                                 stored.chunkFiles, stored.bytes, ageSeconds(stored.lastWrite))
                  << std::endl;
    }
}

void InfoCommand::printJsonInfo(const Report& report) const {
    std::cout << "{" << std::endl;
    if (report.engine) {
        std::cout << "  \"engine\": \"" << jsonEscape(report.engine->string()) << "\","
                  << std::endl;
    } else {
        std::cout << "  \"engine\": null," << std::endl;
    }
    std::cout << "  \"upload_root\": \"" << jsonEscape(options_.service.uploadRoot.string())
              << "\"," << std::endl;
    std::cout << "  \"session_ttl_seconds\": " << options_.service.sessionTtl.count() << ","
              << std::endl;
    std::cout << "  \"sessions\": [";
    for (std::size_t i = 0; i < report.sessions.size(); ++i) {
        const auto& stored = report.sessions[i];
        std::cout << (i == 0 ? "\n" : ",\n");
        std::cout << fmt::format(
            "    {{\"id\": \"{}\", \"chunks\": {}, \"bytes\": {}, \"age_seconds\": {}}}",
            stored.id, stored.chunkFiles, stored.bytes, ageSeconds(stored.lastWrite));
    }
    std::cout << (report.sessions.empty() ? "]" : "\n  ]") << std::endl;
    std::cout << "}" << std::endl;
}

std::unique_ptr<InfoCommand> createInfoCommand(const ServiceConfig& service, bool jsonOutput) {
    InfoOptions opts;
    opts.service = service;
    opts.jsonOutput = jsonOutput;
    return std::make_unique<InfoCommand>(std::move(opts));
}

}  // namespace pds::commands
