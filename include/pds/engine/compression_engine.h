// =============================================================================
// pdf-shrink - Compression Engine Interface
// =============================================================================
// Abstract seam between the orchestrator and whatever rewrites the document.
// The production implementation drives Ghostscript (ghostscript_engine.h);
// tests substitute in-process fakes.
// =============================================================================

#ifndef PDS_ENGINE_COMPRESSION_ENGINE_H
#define PDS_ENGINE_COMPRESSION_ENGINE_H

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "pds/common/types.h"

namespace pds::engine {

/// @brief Leading bytes of every PDF document.
inline constexpr std::string_view kPdfSignature = "%PDF";

/// @brief True if the buffer starts with the PDF signature.
[[nodiscard]] bool hasPdfSignature(std::span<const std::uint8_t> data) noexcept;

class CompressionEngine {
public:
    virtual ~CompressionEngine() = default;

    /// @brief Rewrite a document according to the profile.
    /// @return Non-empty output starting with the PDF signature.
    /// @throws EngineUnavailableError, CompressionEngineFailure,
    ///         EmptyResultFailure, InvalidOutputFailure, StorageFault
    [[nodiscard]] virtual Bytes compress(std::span<const std::uint8_t> input,
                                         const CompressionProfile& profile) = 0;

    /// @brief Short name used in logs.
    [[nodiscard]] virtual std::string name() const = 0;

    /// @brief Whether compress() can run at all.
    [[nodiscard]] virtual bool available() const noexcept = 0;

protected:
    CompressionEngine() = default;
    CompressionEngine(const CompressionEngine&) = default;
    CompressionEngine& operator=(const CompressionEngine&) = default;
};

}  // namespace pds::engine

#endif  // PDS_ENGINE_COMPRESSION_ENGINE_H
