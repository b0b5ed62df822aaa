#ifndef PNEUMATIC_TRANSFER_FILE_DISCOVERY_HPP
#define PNEUMATIC_TRANSFER_FILE_DISCOVERY_HPP

#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <vector>
#include "transfer/discovery_queue.hpp"
#include "transfer/file_metadata.hpp"
#include "transfer/file_system.hpp"
#include "utils/bounded_channel.hpp"

namespace pneumatic {
namespace transfer {

/**
 * Walks a FileSystem with a fixed pool of worker threads.
 *
 * Every directory produces exactly one batch on the output channel, possibly
 * empty. Batches arrive in no particular order.
 */
class FileDiscovery {
public:
  static constexpr std::size_t DEFAULT_WORKER_COUNT = 16;
  static constexpr std::size_t DEFAULT_CHANNEL_CAPACITY = 16;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FileDiscovery(std::shared_ptr<const FileSystem> file_system,
                         std::size_t worker_count = DEFAULT_WORKER_COUNT);


  // ---- DISCOVERY ----
  // Blocks until traversal ends, then closes output.
  // The first listing or metadata failure aborts every worker and is rethrown as DiscoveryError.
  void discover(utils::BoundedChannel<FileBatch>& output);

  // Runs discover() on a background thread and gathers every batch
  std::vector<FileMetadata> collect(std::size_t channel_capacity = DEFAULT_CHANNEL_CAPACITY);


  // ---- GETTERS ----
  std::size_t worker_count() const { return worker_count_; }

private:
  // ---- PARAMETERS ----
  std::shared_ptr<const FileSystem> file_system_;
  const std::size_t worker_count_;


  // ---- WORKER ----
  struct Traversal {
    DiscoveryQueue queue;
    utils::BoundedChannel<FileBatch>& output;
    std::mutex error_mutex;
    std::exception_ptr first_error;

    explicit Traversal(utils::BoundedChannel<FileBatch>& channel) : output(channel) {}
  };

  void run_worker(Traversal& traversal) const;
  // Lists one directory, queues its sub-directories and returns its files
  FileBatch scan_directory(const std::string& relative_path, DiscoveryQueue& queue) const;
};

} // namespace transfer
} // namespace pneumatic

#endif // PNEUMATIC_TRANSFER_FILE_DISCOVERY_HPP
