// =============================================================================
// pdf-shrink - File I/O Helpers Implementation
// =============================================================================

#include "pds/io/file_io.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <system_error>
#include <vector>

#include "pds/common/logger.h"

namespace pds::io {

namespace fs = std::filesystem;

Bytes readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) {
        throw StorageFault("Failed to open file for reading",
                           std::error_code(errno, std::generic_category()),
                           ErrorContext().withPath(path.string()));
    }

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);
    if (size < 0 || !in) {
        throw StorageFault("Failed to determine file size", ErrorContext().withPath(path.string()));
    }

    Bytes data(static_cast<std::size_t>(size));
    if (size > 0 && !in.read(reinterpret_cast<char*>(data.data()), size)) {
        throw StorageFault("Failed to read file", ErrorContext().withPath(path.string()));
    }
    return data;
}

std::string readTextFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw StorageFault("Failed to open file for reading",
                           std::error_code(errno, std::generic_category()),
                           ErrorContext().withPath(path.string()));
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void writeFile(const fs::path& path, std::span<const std::uint8_t> data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw StorageFault("Failed to create file", std::error_code(errno, std::generic_category()),
                           ErrorContext().withPath(path.string()));
    }
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
        throw StorageFault("Failed to write file", std::error_code(errno, std::generic_category()),
                           ErrorContext().withPath(path.string()));
    }
}

// =============================================================================
// ScopedTempDir
// =============================================================================

ScopedTempDir::ScopedTempDir(const fs::path& parent, std::string_view prefix) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw StorageFault("Failed to create temp parent", ec,
                           ErrorContext().withPath(parent.string()));
    }

    std::string pattern = (parent / (std::string(prefix) + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw StorageFault("Failed to create temp directory",
                           std::error_code(errno, std::generic_category()),
                           ErrorContext().withPath(pattern));
    }
    path_ = fs::path(buffer.data());
}

ScopedTempDir::~ScopedTempDir() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        PDS_LOG_WARNING("Failed to remove temp directory {}: {}", path_.string(), ec.message());
    }
}

}  // namespace pds::io
