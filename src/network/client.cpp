#include "network/client.hpp"
#include "network/tcp_stream.hpp"
#include <boost/log/trivial.hpp>
#include <boost/system/system_error.hpp>
#include <future>

namespace pneumatic {
namespace network {

//==============================================
// CONNECTION
//==============================================

std::unique_ptr<Client> Client::connect(const std::string& host, uint16_t port) {
  BOOST_LOG_TRIVIAL(info) << "Client: Connecting to " << host << ":" << port;

  std::unique_ptr<TCP_Stream> stream;
  try {
    stream = TCP_Stream::connect(host, port);
  }
  catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Client: Failed to connect to " << host << ":" << port << ": " << e.what();
    throw HandshakeError(std::string("connect failed: ") + e.what());
  }

  return std::make_unique<Client>(SecureChannel::establish(std::move(stream)));
}

Client::Client(std::unique_ptr<SecureChannel> channel)
  : channel_(std::move(channel)) {
  if (!channel_) {
    throw HandshakeError("no channel");
  }
  state_.transition_to(SessionState::State::ESTABLISHED);
  BOOST_LOG_TRIVIAL(info) << "Client: Session with " << channel_->remote_address() << " established";
}

Client::~Client() {
  if (state_.get_state() == SessionState::State::ESTABLISHED) {
    BOOST_LOG_TRIVIAL(warning) << "Client: Session with " << channel_->remote_address()
                               << " dropped without close(), sending Disconnect";
    try {
      close(DEFAULT_CLOSE_TIMEOUT);
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Client: Disconnect on destruction failed: " << e.what();
    }
  }
  channel_->close();
}

//==============================================
// MESSAGING
//==============================================

GreetingResponse Client::greet(uint32_t protocol_version) {
  send(Greeting{protocol_version});

  const Message reply = receive();
  const auto* response = std::get_if<GreetingResponse>(&reply);
  if (!response) {
    throw ProtocolViolation("expected GreetingResponse, got " + message_type_to_string(message_type(reply)));
  }

  BOOST_LOG_TRIVIAL(info) << "Client: Greeting answered with " << greeting_status_to_string(response->status);
  return *response;
}

void Client::send(const Message& message) {
  require_established("send");
  channel_->send(message);
}

Message Client::receive() {
  require_established("receive");
  Message message = channel_->receive();

  if (std::holds_alternative<Disconnect>(message)) {
    BOOST_LOG_TRIVIAL(info) << "Client: " << channel_->remote_address() << " ended the session";
    if (state_.transition_to(SessionState::State::DISCONNECTING)) {
      channel_->close();
      state_.transition_to(SessionState::State::CLOSED);
    }
  }
  return message;
}

//==============================================
// TEARDOWN
//==============================================

bool Client::close(std::chrono::milliseconds timeout) {
  if (!state_.transition_to(SessionState::State::DISCONNECTING)) {
    // Already closing or never established
    state_.transition_to(SessionState::State::CLOSED);
    channel_->close();
    return false;
  }

  BOOST_LOG_TRIVIAL(debug) << "Client: Sending Disconnect to " << channel_->remote_address();

  SecureChannel* channel = channel_.get();
  std::future<void> pending = std::async(std::launch::async, [channel]() {
    channel->send(Disconnect{});
  });

  bool delivered = false;
  if (pending.wait_for(timeout) == std::future_status::ready) {
    try {
      pending.get();
      delivered = true;
    }
    catch (const NetworkException& e) {
      BOOST_LOG_TRIVIAL(warning) << "Client: Disconnect not delivered: " << e.what();
    }
  } else {
    BOOST_LOG_TRIVIAL(warning) << "Client: Disconnect timed out after " << timeout.count() << "ms";
  }

  // Closing the stream unblocks a send that is still stuck
  channel_->close();
  if (pending.valid()) {
    try {
      pending.get();
    }
    catch (const NetworkException&) {
      BOOST_LOG_TRIVIAL(debug) << "Client: Abandoned Disconnect failed after close";
    }
  }

  state_.transition_to(SessionState::State::CLOSED);
  BOOST_LOG_TRIVIAL(info) << "Client: Session closed";
  return delivered;
}

void Client::require_established(const char* operation) const {
  if (state_.get_state() != SessionState::State::ESTABLISHED) {
    throw ProtocolViolation(std::string(operation) + " in state " + state_.get_state_string());
  }
}

} // namespace network
} // namespace pneumatic
