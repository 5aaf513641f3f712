// =============================================================================
// pdf-shrink - Ghostscript Engine
// =============================================================================
// CompressionEngine backed by the Ghostscript pdfwrite device.
//
// Each call gets a private scratch directory holding input.pdf, output.pdf
// and the engine log, removed when the call returns on every path. The binary
// is resolved once (EngineLocator) and passed in; a missing binary surfaces as
// EngineUnavailableError on the first compress() rather than at construction.
// =============================================================================

#ifndef PDS_ENGINE_GHOSTSCRIPT_ENGINE_H
#define PDS_ENGINE_GHOSTSCRIPT_ENGINE_H

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "pds/common/config.h"
#include "pds/engine/compression_engine.h"

namespace pds::engine {

/// @brief Ghostscript invocation settings.
struct GhostscriptOptions {
    /// @brief Resolved binary; nullopt if none was found.
    std::optional<std::filesystem::path> executable;

    /// @brief -dCompatibilityLevel value.
    std::string compatibilityLevel = kDefaultCompatibilityLevel;

    /// @brief Parent of the per-call scratch directories (empty = system temp).
    std::filesystem::path scratchRoot;
};

class GhostscriptEngine final : public CompressionEngine {
public:
    explicit GhostscriptEngine(GhostscriptOptions options);

    [[nodiscard]] Bytes compress(std::span<const std::uint8_t> input,
                                 const CompressionProfile& profile) override;

    [[nodiscard]] std::string name() const override { return "ghostscript"; }

    [[nodiscard]] bool available() const noexcept override {
        return options_.executable.has_value();
    }

    /// @brief Command-line arguments (argv[1..]) for one conversion.
    [[nodiscard]] std::vector<std::string> buildArguments(
        const CompressionProfile& profile, const std::filesystem::path& input,
        const std::filesystem::path& output) const;

    [[nodiscard]] const GhostscriptOptions& options() const noexcept { return options_; }

private:
    GhostscriptOptions options_;
};

/// @brief Locate the binary per the configuration and build the engine.
[[nodiscard]] std::unique_ptr<CompressionEngine> makeGhostscriptEngine(const ServiceConfig& config);

}  // namespace pds::engine

#endif  // PDS_ENGINE_GHOSTSCRIPT_ENGINE_H
