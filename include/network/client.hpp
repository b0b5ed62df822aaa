#ifndef PNEUMATIC_NETWORK_CLIENT_HPP
#define PNEUMATIC_NETWORK_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include "network/message.hpp"
#include "network/secure_channel.hpp"
#include "network/session_state.hpp"

namespace pneumatic {
namespace network {

// Initiating side of a session
class Client {
public:
  static constexpr std::chrono::milliseconds DEFAULT_CLOSE_TIMEOUT{2000};

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;


  // ---- CONNECTION ----
  // Connects and runs the handshake. Throws HandshakeError.
  static std::unique_ptr<Client> connect(const std::string& host, uint16_t port);

  explicit Client(std::unique_ptr<SecureChannel> channel);
  ~Client();


  // ---- MESSAGING ----
  // Sends a Greeting and waits for the matching GreetingResponse
  GreetingResponse greet(uint32_t protocol_version = PROTOCOL_VERSION);
  void send(const Message& message);
  // A Disconnect from the peer is returned and leaves the client CLOSED
  Message receive();


  // ---- TEARDOWN ----
  // Sends Disconnect, waiting at most timeout for it to leave, then closes.
  // Returns true if the Disconnect was delivered to the transport.
  bool close(std::chrono::milliseconds timeout = DEFAULT_CLOSE_TIMEOUT);


  // ---- GETTERS ----
  SessionState::State state() const { return state_.get_state(); }
  const std::string& remote_address() const { return channel_->remote_address(); }

private:
  // ---- PARAMETERS ----
  std::unique_ptr<SecureChannel> channel_;
  SessionState state_;

  void require_established(const char* operation) const;
};

} // namespace network
} // namespace pneumatic

#endif // PNEUMATIC_NETWORK_CLIENT_HPP
