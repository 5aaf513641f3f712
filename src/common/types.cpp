// =============================================================================
// pdf-shrink - Common Type Implementation
// =============================================================================

#include "pds/common/types.h"

#include <array>
#include <format>
#include <limits>

namespace pds {

Result<CompressionLevel> parseCompressionLevel(std::string_view name) {
    static constexpr std::array kLevels = {
        CompressionLevel::kScreen,   CompressionLevel::kEbook,  CompressionLevel::kPrinter,
        CompressionLevel::kPrepress, CompressionLevel::kDefault,
    };

    for (CompressionLevel level : kLevels) {
        if (compressionLevelToString(level) == name) {
            return level;
        }
    }
    return makeError<CompressionLevel>(
        ErrorCode::kInvalidProfile,
        std::format("invalid compression level '{}' (expected screen, ebook, printer, "
                    "prepress or default)",
                    name));
}

VoidResult CompressionProfile::validate() const {
    if (compressionLevelToString(level) == "unknown") {
        return makeVoidError(ErrorCode::kInvalidProfile,
                             std::format("invalid compression level value {}",
                                         static_cast<int>(level)));
    }
    if (resolutionDpi < kMinResolutionDpi || resolutionDpi > kMaxResolutionDpi) {
        return makeVoidError(ErrorCode::kInvalidProfile,
                             std::format("resolution {} DPI outside [{}, {}]", resolutionDpi,
                                         kMinResolutionDpi, kMaxResolutionDpi));
    }
    return makeVoidSuccess();
}

Result<CompressionProfile> CompressionProfile::parse(std::string_view level, int resolutionDpi) {
    auto parsedLevel = parseCompressionLevel(level);
    if (!parsedLevel) {
        return std::unexpected(parsedLevel.error());
    }

    CompressionProfile profile{*parsedLevel, resolutionDpi};
    if (auto valid = profile.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return profile;
}

std::string ChunkReceipt::progressLabel() const {
    return std::format("{:.1f}%", progressPercent);
}

Result<std::uint32_t> chunkCountFor(std::uint64_t totalBytes, std::uint64_t chunkSize) {
    if (chunkSize == 0) {
        return std::unexpected(Error{ErrorCode::kUsageError, "Chunk size must be positive"});
    }
    const std::uint64_t count = totalBytes / chunkSize + (totalBytes % chunkSize != 0 ? 1 : 0);
    if (count > std::numeric_limits<std::uint32_t>::max()) {
        return std::unexpected(Error{
            ErrorCode::kUsageError,
            std::format("{} bytes in {}-byte chunks needs {} chunks, more than the {} allowed",
                        totalBytes, chunkSize, count,
                        std::numeric_limits<std::uint32_t>::max())});
    }
    return static_cast<std::uint32_t>(count);
}

double compressionRatioPercent(std::uint64_t originalSize, std::uint64_t compressedSize) noexcept {
    if (originalSize == 0) {
        return 0.0;
    }
    return (1.0 - static_cast<double>(compressedSize) / static_cast<double>(originalSize)) * 100.0;
}

}  // namespace pds
