#ifndef PNEUMATIC_TRANSFER_LOCAL_FILE_SYSTEM_HPP
#define PNEUMATIC_TRANSFER_LOCAL_FILE_SYSTEM_HPP

#include <filesystem>
#include <string>
#include <vector>
#include "transfer/file_system.hpp"

namespace pneumatic {
namespace transfer {

// Disk-backed tree. Symbolic links are reported as files and never followed.
class LocalFileSystem : public FileSystem {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws DiscoveryError if the root is not a directory
  explicit LocalFileSystem(const std::string& root);


  // ---- FILESYSTEM OPERATIONS ----
  const std::string& root() const override { return root_string_; }
  std::vector<DirectoryEntry> list_directory(const std::string& relative_path) const override;
  FileMetadata metadata(const std::string& relative_path) const override;

private:
  // ---- PARAMETERS ----
  std::filesystem::path root_;
  std::string root_string_;

  std::filesystem::path resolve(const std::string& relative_path) const;
};

} // namespace transfer
} // namespace pneumatic

#endif // PNEUMATIC_TRANSFER_LOCAL_FILE_SYSTEM_HPP
