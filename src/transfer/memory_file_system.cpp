#include "transfer/memory_file_system.hpp"
#include "transfer/transfer_error.hpp"

namespace pneumatic {
namespace transfer {

MemoryFileSystem::MemoryFileSystem(std::string root)
  : root_(std::move(root)) {
  directories_[""];
}

//==============================================
// TREE CONSTRUCTION
//==============================================

void MemoryFileSystem::add_directory(const std::string& relative_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (relative_path.empty()) {
    return;
  }
  directories_[relative_path];
  add_to_parent(relative_path);
}

void MemoryFileSystem::add_file(const FileMetadata& metadata) {
  std::lock_guard<std::mutex> lock(mutex_);
  files_[metadata.relative_path] = metadata;
  add_to_parent(metadata.relative_path);
}

void MemoryFileSystem::add_file(const std::string& relative_path, uint64_t size) {
  FileMetadata metadata;
  metadata.relative_path = relative_path;
  metadata.size = size;
  add_file(metadata);
}

void MemoryFileSystem::fail_on(const std::string& relative_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  failing_.insert(relative_path);
}

// Caller holds mutex_
void MemoryFileSystem::add_to_parent(const std::string& relative_path) {
  std::string child = relative_path;
  while (true) {
    const std::size_t slash = child.rfind('/');
    const std::string parent = slash == std::string::npos ? "" : child.substr(0, slash);
    const std::string name = slash == std::string::npos ? child : child.substr(slash + 1);

    const bool parent_known = directories_.count(parent) > 0;
    directories_[parent].insert(name);
    if (parent_known || parent.empty()) {
      return;
    }
    child = parent;
  }
}

//==============================================
// FILESYSTEM OPERATIONS
//==============================================

std::vector<DirectoryEntry> MemoryFileSystem::list_directory(const std::string& relative_path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  check_failure(relative_path);

  auto it = directories_.find(relative_path);
  if (it == directories_.end()) {
    throw DiscoveryError("no such directory: " + relative_path);
  }

  std::vector<DirectoryEntry> entries;
  for (const auto& name : it->second) {
    DirectoryEntry entry;
    entry.relative_path = join_relative(relative_path, name);
    entry.is_directory = directories_.count(entry.relative_path) > 0;
    entries.push_back(std::move(entry));
  }
  return entries;
}

FileMetadata MemoryFileSystem::metadata(const std::string& relative_path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  check_failure(relative_path);

  auto it = files_.find(relative_path);
  if (it == files_.end()) {
    throw DiscoveryError("no such file: " + relative_path);
  }
  return it->second;
}

void MemoryFileSystem::check_failure(const std::string& relative_path) const {
  if (failing_.count(relative_path) > 0) {
    throw DiscoveryError("injected failure on " + (relative_path.empty() ? root_ : relative_path));
  }
}

} // namespace transfer
} // namespace pneumatic
