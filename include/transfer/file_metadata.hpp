#ifndef PNEUMATIC_TRANSFER_FILE_METADATA_HPP
#define PNEUMATIC_TRANSFER_FILE_METADATA_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pneumatic {
namespace transfer {

using FileTime = std::chrono::system_clock::time_point;

struct FileMetadata {
    // Relative to the discovery root, '/' separated
    std::string relative_path;
    // Not every filesystem reports a birth time
    std::optional<FileTime> created_at;
    std::optional<FileTime> modified_at;
    uint64_t size = 0;
};

// Files of one directory, sent as a unit
using FileBatch = std::vector<FileMetadata>;

inline bool operator==(const FileMetadata& lhs, const FileMetadata& rhs) {
    return lhs.relative_path == rhs.relative_path &&
           lhs.created_at == rhs.created_at &&
           lhs.modified_at == rhs.modified_at &&
           lhs.size == rhs.size;
}

} // namespace transfer
} // namespace pneumatic

#endif // PNEUMATIC_TRANSFER_FILE_METADATA_HPP
