#ifndef PNEUMATIC_SESSION_REGISTRY_HPP
#define PNEUMATIC_SESSION_REGISTRY_HPP

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>
#include "network/session.hpp"

namespace pneumatic {
namespace network {

// Live sessions keyed by peer address. Readers share the lock, writers exclude everyone.
class SessionRegistry {
public:
  // Delete copy constructor and assignment operator
  SessionRegistry(const SessionRegistry&) = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  SessionRegistry() = default;
  ~SessionRegistry() = default;


  // ---- SESSION MANAGEMENT ----
  // Returns false if the session is null or its address is already registered
  bool insert(const std::shared_ptr<Session>& session);
  // Returns false if no session is registered under the address
  bool remove(const std::string& address);
  std::shared_ptr<Session> get(const std::string& address) const;
  bool has(const std::string& address) const;


  // ---- UTILITY METHODS ----
  std::size_t size() const;
  std::vector<std::string> addresses() const;
  // Closes every registered session without removing it
  void close_all();
  // Drops every entry without closing
  void clear();

private:
  // ---- PARAMETERS ----
  std::map<std::string, std::shared_ptr<Session>> sessions_;
  mutable std::shared_mutex mutex_;
};

} // namespace network
} // namespace pneumatic

#endif // PNEUMATIC_SESSION_REGISTRY_HPP
