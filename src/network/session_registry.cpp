#include "network/session_registry.hpp"
#include <boost/log/trivial.hpp>
#include <mutex>

namespace pneumatic {
namespace network {

bool SessionRegistry::insert(const std::shared_ptr<Session>& session) {
  if (!session) {
    BOOST_LOG_TRIVIAL(error) << "Session registry: Attempted to add null session";
    return false;
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto result = sessions_.emplace(session->address(), session);
  if (!result.second) {
    BOOST_LOG_TRIVIAL(warning) << "Session registry: Session already registered for " << session->address();
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "Session registry: Added session " << session->address()
                          << " (" << sessions_.size() << " active)";
  return true;
}

bool SessionRegistry::remove(const std::string& address) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto it = sessions_.find(address);
  if (it == sessions_.end()) {
    BOOST_LOG_TRIVIAL(warning) << "Session registry: Attempted to remove non-existent session: " << address;
    return false;
  }

  sessions_.erase(it);
  BOOST_LOG_TRIVIAL(info) << "Session registry: Removed session " << address
                          << " (" << sessions_.size() << " active)";
  return true;
}

std::shared_ptr<Session> SessionRegistry::get(const std::string& address) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  auto it = sessions_.find(address);
  if (it != sessions_.end()) {
    return it->second;
  }

  return nullptr;
}

bool SessionRegistry::has(const std::string& address) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return sessions_.find(address) != sessions_.end();
}

std::size_t SessionRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return sessions_.size();
}

std::vector<std::string> SessionRegistry::addresses() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  std::vector<std::string> result;
  result.reserve(sessions_.size());
  for (const auto& session_pair : sessions_) {
    result.push_back(session_pair.first);
  }
  return result;
}

void SessionRegistry::close_all() {
  std::vector<std::shared_ptr<Session>> sessions;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& session_pair : sessions_) {
      sessions.push_back(session_pair.second);
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Session registry: Closing " << sessions.size() << " sessions";

  // Closing blocks on each session's own lock, so the registry lock is not held here
  for (auto& session : sessions) {
    try {
      session->close();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Session registry: Error closing session " << session->address()
                               << ": " << e.what();
    }
  }
}

void SessionRegistry::clear() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  BOOST_LOG_TRIVIAL(debug) << "Session registry: Clearing " << sessions_.size() << " sessions";
  sessions_.clear();
}

} // namespace network
} // namespace pneumatic
