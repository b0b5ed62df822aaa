#ifndef PNEUMATIC_TRANSFER_MEMORY_FILE_SYSTEM_HPP
#define PNEUMATIC_TRANSFER_MEMORY_FILE_SYSTEM_HPP

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "transfer/file_system.hpp"

namespace pneumatic {
namespace transfer {

// In-memory tree. Parent directories are created implicitly.
class MemoryFileSystem : public FileSystem {
public:
  explicit MemoryFileSystem(std::string root = "memory:");


  // ---- TREE CONSTRUCTION ----
  void add_directory(const std::string& relative_path);
  void add_file(const FileMetadata& metadata);
  void add_file(const std::string& relative_path, uint64_t size);
  // Any later listing or metadata read of this path throws DiscoveryError
  void fail_on(const std::string& relative_path);


  // ---- FILESYSTEM OPERATIONS ----
  const std::string& root() const override { return root_; }
  std::vector<DirectoryEntry> list_directory(const std::string& relative_path) const override;
  FileMetadata metadata(const std::string& relative_path) const override;

private:
  // ---- PARAMETERS ----
  const std::string root_;
  mutable std::mutex mutex_;
  // Directory path to the names of its children
  std::map<std::string, std::set<std::string>> directories_;
  std::map<std::string, FileMetadata> files_;
  std::set<std::string> failing_;

  void add_to_parent(const std::string& relative_path);
  void check_failure(const std::string& relative_path) const;
};

} // namespace transfer
} // namespace pneumatic

#endif // PNEUMATIC_TRANSFER_MEMORY_FILE_SYSTEM_HPP
