#ifndef PNEUMATIC_NETWORK_SESSION_HPP
#define PNEUMATIC_NETWORK_SESSION_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "network/message.hpp"
#include "network/secure_channel.hpp"
#include "network/session_state.hpp"
#include "network/stream.hpp"

namespace pneumatic {
namespace network {

// Whether the server ends a session after answering an unsupported Greeting
enum class UnsupportedProtocolPolicy {
  KEEP_OPEN,
  CLOSE
};

// Server side of one accepted connection
class Session {
public:
  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Session(std::string address, std::unique_ptr<Stream> stream);
  ~Session();


  // ---- LIFECYCLE ----
  // Runs the handshake. CONNECTING -> ESTABLISHED, throws HandshakeError
  void establish();
  // Answers messages until the session leaves ESTABLISHED
  void serve(UnsupportedProtocolPolicy policy);
  // Tears the channel down from any thread. Idempotent. Unless the peer
  // sent Disconnect, a Disconnect is sent first on a best-effort basis.
  void close();
  // Returns true exactly once, for the caller that must remove the registry entry
  bool mark_finished();


  // ---- MESSAGE HANDLING ----
  // Applies one received message to the state machine and returns the reply, if any.
  // Throws ProtocolViolation for messages a server never accepts.
  std::optional<Message> handle_message(const Message& message, UnsupportedProtocolPolicy policy);


  // ---- GETTERS ----
  const std::string& address() const { return address_; }
  SessionState::State state() const { return state_.get_state(); }

private:
  // ---- PARAMETERS ----
  const std::string address_;
  SessionState state_;

  // Guards the stream to channel handover against concurrent close()
  mutable std::mutex mutex_;
  std::unique_ptr<Stream> pending_stream_;
  std::unique_ptr<SecureChannel> channel_;
  std::atomic<bool> finished_{false};
  std::atomic<bool> peer_disconnected_{false};

  // Caller holds mutex_. Failures are logged, not thrown.
  void send_disconnect();
};

} // namespace network
} // namespace pneumatic

#endif // PNEUMATIC_NETWORK_SESSION_HPP
