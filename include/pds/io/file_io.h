// =============================================================================
// pdf-shrink - File I/O Helpers
// =============================================================================
// Whole-file binary read/write and a scoped temporary directory.
// =============================================================================

#ifndef PDS_IO_FILE_IO_H
#define PDS_IO_FILE_IO_H

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

#include "pds/common/types.h"

namespace pds::io {

/// @brief Read a whole file.
/// @throws StorageFault if the file can not be opened or read.
[[nodiscard]] Bytes readFile(const std::filesystem::path& path);

/// @brief Read a whole file as text (diagnostics, logs).
[[nodiscard]] std::string readTextFile(const std::filesystem::path& path);

/// @brief Create or truncate a file and write the bytes.
/// @throws StorageFault on failure.
void writeFile(const std::filesystem::path& path, std::span<const std::uint8_t> data);

/// @brief Temporary directory removed (recursively) on destruction.
class ScopedTempDir {
public:
    /// @brief Create <parent>/<prefix>XXXXXX.
    /// @throws StorageFault if the directory can not be created.
    explicit ScopedTempDir(const std::filesystem::path& parent, std::string_view prefix = "pds-");

    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace pds::io

#endif  // PDS_IO_FILE_IO_H
