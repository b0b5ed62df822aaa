#ifndef PNEUMATIC_TRANSFER_DISCOVERY_QUEUE_HPP
#define PNEUMATIC_TRANSFER_DISCOVERY_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <string>

namespace pneumatic {
namespace transfer {

/**
 * Pending directories shared by the discovery workers.
 *
 * The outstanding counter covers every directory that was pushed and not yet
 * completed, so it starts at 1 for the root. Traversal is complete once it
 * drops to zero.
 */
class DiscoveryQueue {
public:
  explicit DiscoveryQueue(std::string root_relative_path = "");

  DiscoveryQueue(const DiscoveryQueue&) = delete;
  DiscoveryQueue& operator=(const DiscoveryQueue&) = delete;


  // ---- QUEUE CONTROL METHODS ----
  // Counts the directory as outstanding before any worker can see it
  void push(std::string relative_path);
  // Blocks until a directory is available. False once traversal is complete or aborted.
  bool pop(std::string& relative_path);
  // Marks one popped directory as fully processed
  void complete_one();
  // Wakes every waiting worker; later pops return false
  void abort();


  // ---- QUERY METHODS ----
  std::size_t outstanding() const { return outstanding_.load(); }
  bool is_aborted() const { return aborted_.load(); }

private:
  // ---- PARAMETERS ----
  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::queue<std::string> pending_;
  std::atomic<std::size_t> outstanding_{1};
  std::atomic<bool> aborted_{false};
};

} // namespace transfer
} // namespace pneumatic

#endif // PNEUMATIC_TRANSFER_DISCOVERY_QUEUE_HPP
