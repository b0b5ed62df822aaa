#ifndef PNEUMATIC_NETWORK_SERVER_HPP
#define PNEUMATIC_NETWORK_SERVER_HPP

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "network/session.hpp"
#include "network/session_registry.hpp"

namespace pneumatic {
namespace network {

class Server {
public:
  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Server(const std::string& address, uint16_t port,
         UnsupportedProtocolPolicy policy = UnsupportedProtocolPolicy::KEEP_OPEN);
  ~Server();


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  // Stops accepting, closes every session and joins every handler
  void shutdown();


  // ---- GETTERS ----
  // Bound port, resolved when the server was started on port 0
  uint16_t local_port() const { return bound_port_; }
  bool is_running() const { return is_running_; }
  const SessionRegistry& registry() const { return registry_; }

private:
  // ---- PARAMETERS ----
  // Network Parameters
  const std::string address_;
  const uint16_t port_;
  const UnsupportedProtocolPolicy policy_;
  std::atomic<uint16_t> bound_port_{0};

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  // Started until shutdown(); running only while the acceptor is live
  std::atomic<bool> is_started_{false};
  std::atomic<bool> is_running_{false};

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // Sessions are destroyed before the io_context their sockets belong to
  SessionRegistry registry_;

  // One handler thread per session, reaped once it reports completion
  std::mutex handlers_mutex_;
  std::map<std::thread::id, std::thread> handlers_;
  std::vector<std::thread::id> finished_handlers_;


  // ---- CONNECTION ACCEPTANCE ----
  // Main listening loop that handles incoming connections
  void start_accept();
  // Registers the session, then spawns its handler
  void register_session(boost::asio::ip::tcp::socket socket);


  // ---- SESSION HANDLING ----
  // Handshake and message loop for one session, run on its own thread
  void handle_session(std::shared_ptr<Session> session);
  // Removes the registry entry exactly once
  void finish_session(const std::shared_ptr<Session>& session);
  // Joins handler threads that have finished
  void reap_handlers();
};

} // namespace network
} // namespace pneumatic

#endif // PNEUMATIC_NETWORK_SERVER_HPP
