#ifndef PNEUMATIC_TRANSFER_FILE_SYSTEM_HPP
#define PNEUMATIC_TRANSFER_FILE_SYSTEM_HPP

#include <string>
#include <vector>
#include "transfer/file_metadata.hpp"

namespace pneumatic {
namespace transfer {

struct DirectoryEntry {
    std::string relative_path;
    bool is_directory = false;
};

/**
 * Read-only view of a directory tree. Paths are relative to root(),
 * the empty string naming the root itself.
 * Implementations must be safe to call from several threads at once.
 */
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual const std::string& root() const = 0;

    // Direct children of a directory. Throws DiscoveryError.
    virtual std::vector<DirectoryEntry> list_directory(const std::string& relative_path) const = 0;

    // Throws DiscoveryError
    virtual FileMetadata metadata(const std::string& relative_path) const = 0;

protected:
    FileSystem() = default;
};

// Joins a parent relative path and a child name
inline std::string join_relative(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "/" + name;
}

} // namespace transfer
} // namespace pneumatic

#endif // PNEUMATIC_TRANSFER_FILE_SYSTEM_HPP
