#include "transfer/file_discovery.hpp"
#include "transfer/transfer_error.hpp"
#include <boost/log/trivial.hpp>
#include <iterator>
#include <system_error>
#include <thread>

namespace pneumatic {
namespace transfer {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileDiscovery::FileDiscovery(std::shared_ptr<const FileSystem> file_system, std::size_t worker_count)
  : file_system_(std::move(file_system))
  , worker_count_(worker_count) {
  if (!file_system_) {
    throw std::invalid_argument("FileDiscovery: file system must not be null");
  }
  if (worker_count_ == 0) {
    throw std::invalid_argument("FileDiscovery: worker count must be positive");
  }
}

//==============================================
// DISCOVERY
//==============================================

void FileDiscovery::discover(utils::BoundedChannel<FileBatch>& output) {
  BOOST_LOG_TRIVIAL(info) << "File discovery: Scanning " << file_system_->root()
                          << " with " << worker_count_ << " workers";

  Traversal traversal(output);
  std::vector<std::thread> workers;
  workers.reserve(worker_count_);

  try {
    for (std::size_t i = 0; i < worker_count_; ++i) {
      workers.emplace_back(&FileDiscovery::run_worker, this, std::ref(traversal));
    }
  }
  catch (const std::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "File discovery: Failed to start worker: " << e.what();
    std::lock_guard<std::mutex> lock(traversal.error_mutex);
    if (!traversal.first_error) {
      traversal.first_error = std::current_exception();
    }
    traversal.queue.abort();
    output.close();
  }

  for (auto& worker : workers) {
    worker.join();
  }
  output.close();

  if (!traversal.first_error) {
    BOOST_LOG_TRIVIAL(info) << "File discovery: Finished scanning " << file_system_->root();
    return;
  }

  try {
    std::rethrow_exception(traversal.first_error);
  }
  catch (const DiscoveryError&) {
    throw;
  }
  catch (const std::exception& e) {
    throw DiscoveryError(e.what());
  }
}

std::vector<FileMetadata> FileDiscovery::collect(std::size_t channel_capacity) {
  utils::BoundedChannel<FileBatch> channel(channel_capacity);
  std::exception_ptr error;

  std::thread producer([this, &channel, &error]() {
    try {
      discover(channel);
    }
    catch (const std::exception&) {
      error = std::current_exception();
    }
  });

  std::vector<FileMetadata> files;
  FileBatch batch;
  while (channel.receive(batch)) {
    files.insert(files.end(),
                 std::make_move_iterator(batch.begin()),
                 std::make_move_iterator(batch.end()));
  }
  producer.join();

  if (error) {
    std::rethrow_exception(error);
  }

  BOOST_LOG_TRIVIAL(debug) << "File discovery: Collected " << files.size() << " files";
  return files;
}

//==============================================
// WORKER
//==============================================

void FileDiscovery::run_worker(Traversal& traversal) const {
  std::string directory;

  while (traversal.queue.pop(directory)) {
    try {
      FileBatch batch = scan_directory(directory, traversal.queue);
      const std::size_t count = batch.size();
      if (!traversal.output.send(std::move(batch))) {
        BOOST_LOG_TRIVIAL(debug) << "File discovery: Output closed, worker stopping";
        traversal.queue.abort();
        return;
      }
      BOOST_LOG_TRIVIAL(trace) << "File discovery: Sent " << count << " files from '" << directory << "'";
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "File discovery: Aborting at '" << directory << "': " << e.what();
      {
        std::lock_guard<std::mutex> lock(traversal.error_mutex);
        if (!traversal.first_error) {
          traversal.first_error = std::current_exception();
        }
      }
      traversal.queue.abort();
      traversal.output.close();
      return;
    }

    traversal.queue.complete_one();
  }
}

FileBatch FileDiscovery::scan_directory(const std::string& relative_path, DiscoveryQueue& queue) const {
  FileBatch batch;

  for (const auto& entry : file_system_->list_directory(relative_path)) {
    if (entry.is_directory) {
      queue.push(entry.relative_path);
    } else {
      batch.push_back(file_system_->metadata(entry.relative_path));
    }
  }

  return batch;
}

} // namespace transfer
} // namespace pneumatic
