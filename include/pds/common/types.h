// =============================================================================
// pdf-shrink - Common Type Definitions
// =============================================================================
// Core value types shared by the session store, the engine adapter and the
// orchestrator.
//
// This module defines:
// - ChunkIndex, SessionId: type aliases
// - CompressionLevel: named engine preset
// - CompressionProfile: level + image resolution, with validation
// - ChunkRecord: one stored chunk
// - ChunkReceipt: progress reported after each chunk upload
// - CompressionResult: the output of one finalize call
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef PDS_COMMON_TYPES_H
#define PDS_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "pds/common/error.h"

namespace pds {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Zero-based position of a chunk within its upload.
using ChunkIndex = std::uint32_t;

/// @brief Opaque session identifier derived from the caller's file name.
using SessionId = std::string;

/// @brief Raw byte buffer.
using Bytes = std::vector<std::uint8_t>;

// =============================================================================
// Constants
// =============================================================================

/// @brief Lowest accepted image resolution (DPI).
inline constexpr int kMinResolutionDpi = 72;

/// @brief Highest accepted image resolution (DPI).
inline constexpr int kMaxResolutionDpi = 300;

/// @brief Resolution used when a caller does not provide one.
inline constexpr int kDefaultResolutionDpi = 72;

/// @brief Prefix of the suggested output file name.
inline constexpr std::string_view kCompressedNamePrefix = "compressed_";

// =============================================================================
// Compression Level Enumeration
// =============================================================================

/// @brief Engine quality preset, mapped to -dPDFSETTINGS=/<name>.
enum class CompressionLevel : std::uint8_t {
    kScreen = 0,
    kEbook = 1,
    kPrinter = 2,
    kPrepress = 3,
    kDefault = 4
};

[[nodiscard]] constexpr std::string_view compressionLevelToString(CompressionLevel level) noexcept {
    switch (level) {
        case CompressionLevel::kScreen:
            return "screen";
        case CompressionLevel::kEbook:
            return "ebook";
        case CompressionLevel::kPrinter:
            return "printer";
        case CompressionLevel::kPrepress:
            return "prepress";
        case CompressionLevel::kDefault:
            return "default";
    }
    return "unknown";
}

/// @brief Parse a level name (exact, lowercase).
/// @return The level, or kInvalidProfile for anything outside the enumeration.
[[nodiscard]] Result<CompressionLevel> parseCompressionLevel(std::string_view name);

// =============================================================================
// Compression Profile
// =============================================================================

/// @brief Parameters handed to the compression engine.
struct CompressionProfile {
    CompressionLevel level = CompressionLevel::kScreen;

    /// @brief Image downsampling resolution in DPI, [72, 300].
    int resolutionDpi = kDefaultResolutionDpi;

    /// @brief Reject out-of-range values.
    [[nodiscard]] VoidResult validate() const;

    /// @brief Build a validated profile from untrusted text input.
    [[nodiscard]] static Result<CompressionProfile> parse(std::string_view level, int resolutionDpi);

    [[nodiscard]] bool operator==(const CompressionProfile& other) const noexcept = default;
};

// =============================================================================
// Chunk Types
// =============================================================================

/// @brief One stored chunk of an upload session.
struct ChunkRecord {
    ChunkIndex index = 0;
    std::uint64_t sizeBytes = 0;
    std::filesystem::path location;
};

/// @brief Progress returned after a chunk upload.
struct ChunkReceipt {
    /// @brief Distinct indices present on disk after this upload.
    std::uint32_t receivedCount = 0;

    std::uint32_t totalChunks = 0;

    /// @brief receivedCount / totalChunks * 100.
    double progressPercent = 0.0;

    /// @brief Size of this chunk as verified on disk.
    std::uint64_t chunkSizeBytes = 0;

    /// @brief True once every index is present.
    [[nodiscard]] bool complete() const noexcept {
        return totalChunks > 0 && receivedCount == totalChunks;
    }

    /// @brief Progress rendered with one decimal, e.g. "33.3%".
    [[nodiscard]] std::string progressLabel() const;
};

/// @brief Number of chunks needed to upload totalBytes in chunkSize pieces.
/// @return kUsageError if chunkSize is 0 or the count does not fit a ChunkIndex.
[[nodiscard]] Result<std::uint32_t> chunkCountFor(std::uint64_t totalBytes,
                                                  std::uint64_t chunkSize);

// =============================================================================
// Compression Result
// =============================================================================

/// @brief Output of one finalize call.
/// @note compressedSize always equals content.size(); when fallbackApplied the
///       content is the original upload and ratioPercent is 0.
struct CompressionResult {
    Bytes content;
    std::uint64_t originalSize = 0;
    std::uint64_t compressedSize = 0;
    double ratioPercent = 0.0;
    std::string suggestedFileName;
    bool fallbackApplied = false;
};

/// @brief (1 - compressed / original) * 100, or 0 when original is 0.
[[nodiscard]] double compressionRatioPercent(std::uint64_t originalSize,
                                             std::uint64_t compressedSize) noexcept;

}  // namespace pds

#endif  // PDS_COMMON_TYPES_H
