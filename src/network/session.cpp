#include "network/session.hpp"
#include "crypto/crypto_error.hpp"
#include <boost/log/trivial.hpp>

namespace pneumatic {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Session::Session(std::string address, std::unique_ptr<Stream> stream)
  : address_(std::move(address))
  , pending_stream_(std::move(stream)) {
  BOOST_LOG_TRIVIAL(debug) << "Session: Created session for " << address_;
}

Session::~Session() {
  close();
  BOOST_LOG_TRIVIAL(debug) << "Session: Destroyed session for " << address_;
}

//==============================================
// LIFECYCLE
//==============================================

void Session::establish() {
  Stream* stream = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_stream_ || state_.get_state() != SessionState::State::CONNECTING) {
      throw HandshakeError("session " + address_ + " is not awaiting a handshake");
    }
    stream = pending_stream_.get();
  }

  // The stream stays owned by the session while the handshake blocks, so close() can reach it
  ChannelKeys keys = SecureChannel::handshake(*stream);

  std::lock_guard<std::mutex> lock(mutex_);
  if (!state_.transition_to(SessionState::State::ESTABLISHED)) {
    throw HandshakeError("session " + address_ + " was closed during the handshake");
  }
  channel_ = std::make_unique<SecureChannel>(std::move(pending_stream_), keys);
  BOOST_LOG_TRIVIAL(info) << "Session: Session with " << address_ << " established";
}

void Session::serve(UnsupportedProtocolPolicy policy) {
  SecureChannel* channel = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    channel = channel_.get();
  }
  if (!channel) {
    throw ProtocolViolation("session " + address_ + " has no established channel");
  }

  while (state_.get_state() == SessionState::State::ESTABLISHED) {
    const Message message = channel->receive();
    const std::optional<Message> reply = handle_message(message, policy);
    if (reply) {
      channel->send(*reply);
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Session: Stopped serving " << address_ << " in state " << state_.get_state();
}

void Session::close() {
  std::lock_guard<std::mutex> lock(mutex_);

  const SessionState::State previous = state_.get_state();
  if (previous != SessionState::State::CLOSED) {
    state_.transition_to(SessionState::State::CLOSED);
    BOOST_LOG_TRIVIAL(info) << "Session: Closing session with " << address_ << " (was " << previous << ")";
  }

  // The server is ending the session itself, so the peer is told
  const bool server_initiated = previous == SessionState::State::ESTABLISHED ||
                                (previous == SessionState::State::DISCONNECTING && !peer_disconnected_);
  if (channel_ && server_initiated) {
    send_disconnect();
  }

  if (channel_) {
    channel_->close();
  } else if (pending_stream_) {
    pending_stream_->close();
  }
}

void Session::send_disconnect() {
  try {
    channel_->send(Disconnect{});
    BOOST_LOG_TRIVIAL(debug) << "Session: Sent Disconnect to " << address_;
  }
  catch (const NetworkException& e) {
    BOOST_LOG_TRIVIAL(debug) << "Session: Disconnect to " << address_ << " not delivered: " << e.what();
  }
  catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Session: Could not seal Disconnect for " << address_ << ": " << e.what();
  }
}

bool Session::mark_finished() {
  return !finished_.exchange(true);
}

//==============================================
// MESSAGE HANDLING
//==============================================

std::optional<Message> Session::handle_message(const Message& message, UnsupportedProtocolPolicy policy) {
  if (state_.get_state() != SessionState::State::ESTABLISHED) {
    throw ProtocolViolation(message_type_to_string(message_type(message)) + " received in state " +
                            state_.get_state_string());
  }

  if (const auto* greeting = std::get_if<Greeting>(&message)) {
    if (greeting->protocol_version == PROTOCOL_VERSION) {
      BOOST_LOG_TRIVIAL(info) << "Session: " << address_ << " greeted with protocol " << greeting->protocol_version;
      return Message{GreetingResponse{GreetingStatus::PROTOCOL_OK}};
    }

    BOOST_LOG_TRIVIAL(warning) << "Session: " << address_ << " requested unsupported protocol "
                               << greeting->protocol_version << " (supported: " << PROTOCOL_VERSION << ")";
    if (policy == UnsupportedProtocolPolicy::CLOSE) {
      state_.transition_to(SessionState::State::DISCONNECTING);
    }
    return Message{GreetingResponse{GreetingStatus::UNSUPPORTED_PROTOCOL}};
  }

  if (std::holds_alternative<Disconnect>(message)) {
    BOOST_LOG_TRIVIAL(info) << "Session: " << address_ << " disconnecting";
    peer_disconnected_ = true;
    state_.transition_to(SessionState::State::DISCONNECTING);
    return std::nullopt;
  }

  throw ProtocolViolation("server does not accept " + message_type_to_string(message_type(message)));
}

} // namespace network
} // namespace pneumatic
