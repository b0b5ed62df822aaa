#include "transfer/local_file_system.hpp"
#include "transfer/transfer_error.hpp"
#include <boost/log/trivial.hpp>
#include <fcntl.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>

namespace pneumatic {
namespace transfer {

namespace {

FileTime to_file_time(const struct statx_timestamp& timestamp) {
  return FileTime(std::chrono::duration_cast<FileTime::duration>(
    std::chrono::seconds(timestamp.tv_sec) + std::chrono::nanoseconds(timestamp.tv_nsec)));
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

LocalFileSystem::LocalFileSystem(const std::string& root)
  : root_(root)
  , root_string_(root) {
  BOOST_LOG_TRIVIAL(info) << "Local filesystem: Using root " << root;

  std::error_code ec;
  if (!std::filesystem::is_directory(root_, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Local filesystem: Root is not a directory: " << root;
    throw DiscoveryError("root is not a directory: " + root);
  }
}

//==============================================
// FILESYSTEM OPERATIONS
//==============================================

std::vector<DirectoryEntry> LocalFileSystem::list_directory(const std::string& relative_path) const {
  const std::filesystem::path directory = resolve(relative_path);
  BOOST_LOG_TRIVIAL(trace) << "Local filesystem: Listing " << directory.string();

  std::error_code ec;
  std::filesystem::directory_iterator it(directory, ec);
  if (ec) {
    throw DiscoveryError("cannot list " + directory.string() + ": " + ec.message());
  }

  std::vector<DirectoryEntry> entries;
  for (const std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
    // symlink_status so links to directories are not descended into
    const std::filesystem::file_status status = it->symlink_status(ec);
    if (ec) {
      throw DiscoveryError("cannot stat " + it->path().string() + ": " + ec.message());
    }

    DirectoryEntry entry;
    entry.relative_path = join_relative(relative_path, it->path().filename().string());
    entry.is_directory = std::filesystem::is_directory(status);
    entries.push_back(std::move(entry));
  }
  if (ec) {
    throw DiscoveryError("cannot list " + directory.string() + ": " + ec.message());
  }

  return entries;
}

FileMetadata LocalFileSystem::metadata(const std::string& relative_path) const {
  const std::filesystem::path file_path = resolve(relative_path);

  struct statx info;
  std::memset(&info, 0, sizeof(info));
  const unsigned int mask = STATX_SIZE | STATX_MTIME | STATX_BTIME;
  if (::statx(AT_FDCWD, file_path.c_str(), AT_SYMLINK_NOFOLLOW, mask, &info) != 0) {
    const int error = errno;
    throw DiscoveryError("cannot read metadata of " + file_path.string() + ": " + std::strerror(error));
  }

  FileMetadata metadata;
  metadata.relative_path = relative_path;
  metadata.size = info.stx_size;
  if (info.stx_mask & STATX_BTIME) {
    metadata.created_at = to_file_time(info.stx_btime);
  }
  if (info.stx_mask & STATX_MTIME) {
    metadata.modified_at = to_file_time(info.stx_mtime);
  }
  return metadata;
}

std::filesystem::path LocalFileSystem::resolve(const std::string& relative_path) const {
  return relative_path.empty() ? root_ : root_ / relative_path;
}

} // namespace transfer
} // namespace pneumatic
