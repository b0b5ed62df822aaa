#include "transfer/discovery_queue.hpp"
#include <boost/log/trivial.hpp>

namespace pneumatic {
namespace transfer {

DiscoveryQueue::DiscoveryQueue(std::string root_relative_path) {
  pending_.push(std::move(root_relative_path));
}

void DiscoveryQueue::push(std::string relative_path) {
  outstanding_.fetch_add(1);

  std::lock_guard<std::mutex> lock(mutex_);
  pending_.push(std::move(relative_path));
  ready_.notify_one();
}

bool DiscoveryQueue::pop(std::string& relative_path) {
  std::unique_lock<std::mutex> lock(mutex_);
  ready_.wait(lock, [this]() {
    return aborted_.load() || !pending_.empty() || outstanding_.load() == 0;
  });

  if (aborted_.load() || pending_.empty()) {
    return false;
  }

  relative_path = std::move(pending_.front());
  pending_.pop();
  return true;
}

void DiscoveryQueue::complete_one() {
  // Notify under the lock so a waiter cannot miss the final wakeup
  std::lock_guard<std::mutex> lock(mutex_);
  if (outstanding_.fetch_sub(1) == 1) {
    BOOST_LOG_TRIVIAL(debug) << "Discovery queue: Traversal complete";
    ready_.notify_all();
  }
}

void DiscoveryQueue::abort() {
  std::lock_guard<std::mutex> lock(mutex_);
  aborted_ = true;
  ready_.notify_all();
}

} // namespace transfer
} // namespace pneumatic
