#include "network/secure_channel.hpp"
#include "network/message_codec.hpp"
#include "crypto/key_exchange.hpp"
#include "crypto/key_derivation.hpp"
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <boost/system/system_error.hpp>
#include <openssl/crypto.h>
#include <algorithm>
#include <cstring>

namespace pneumatic {
namespace network {

namespace {

void write_exact(Stream& stream, const uint8_t* data, std::size_t size) {
  boost::system::error_code ec;
  stream.write(data, size, ec);
  if (ec) {
    throw boost::system::system_error(ec);
  }
}

void read_exact(Stream& stream, uint8_t* data, std::size_t size) {
  boost::system::error_code ec;
  stream.read(data, size, ec);
  if (ec) {
    throw boost::system::system_error(ec);
  }
}

} // namespace

ChannelKeys::~ChannelKeys() {
  OPENSSL_cleanse(encrypt_key.data(), encrypt_key.size());
  OPENSSL_cleanse(decrypt_key.data(), decrypt_key.size());
}

//==============================================
// ESTABLISHMENT
//==============================================

ChannelKeys SecureChannel::handshake(Stream& stream) {
  BOOST_LOG_TRIVIAL(debug) << "Secure channel: Starting handshake with " << stream.remote_address();

  try {
    // Both sides write before reading, no turn order
    crypto::EphemeralKeyPair key_pair;
    write_exact(stream, key_pair.public_key().data(), key_pair.public_key().size());

    crypto::EphemeralKeyPair::PublicKey peer_public_key{};
    read_exact(stream, peer_public_key.data(), peer_public_key.size());
    BOOST_LOG_TRIVIAL(trace) << "Secure channel: Exchanged public keys";

    const crypto::Salt own_salt = crypto::generate_salt();
    write_exact(stream, own_salt.data(), own_salt.size());

    crypto::Salt peer_salt{};
    read_exact(stream, peer_salt.data(), peer_salt.size());
    BOOST_LOG_TRIVIAL(trace) << "Secure channel: Exchanged salts";

    // A reflected salt would key both directions identically
    if (CRYPTO_memcmp(own_salt.data(), peer_salt.data(), own_salt.size()) == 0) {
      throw HandshakeError("peer echoed the local salt");
    }

    std::vector<uint8_t> shared_secret = key_pair.agree(peer_public_key);

    ChannelKeys keys;
    keys.encrypt_key = crypto::derive_channel_key(own_salt, shared_secret);
    keys.decrypt_key = crypto::derive_channel_key(peer_salt, shared_secret);
    OPENSSL_cleanse(shared_secret.data(), shared_secret.size());

    BOOST_LOG_TRIVIAL(info) << "Secure channel: Handshake complete with " << stream.remote_address();
    return keys;
  }
  catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Secure channel: Handshake I/O failure with " << stream.remote_address()
                             << ": " << e.what();
    throw HandshakeError(e.what());
  }
  catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Secure channel: Handshake crypto failure with " << stream.remote_address()
                             << ": " << e.what();
    throw HandshakeError(e.what());
  }
}

std::unique_ptr<SecureChannel> SecureChannel::establish(std::unique_ptr<Stream> stream) {
  if (!stream) {
    throw HandshakeError("no stream");
  }

  ChannelKeys keys;
  try {
    keys = handshake(*stream);
  }
  catch (const HandshakeError&) {
    stream->close();
    throw;
  }

  try {
    return std::make_unique<SecureChannel>(std::move(stream), keys);
  }
  catch (const crypto::CryptoError& e) {
    // The stream was handed to the failed constructor and is already gone
    throw HandshakeError(e.what());
  }
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SecureChannel::SecureChannel(std::unique_ptr<Stream> stream, const ChannelKeys& keys)
  : stream_(std::move(stream))
  , encrypt_cipher_(keys.encrypt_key)
  , decrypt_cipher_(keys.decrypt_key) {
}

SecureChannel::~SecureChannel() {
  close();
}

//==============================================
// MESSAGING
//==============================================

void SecureChannel::send(const Message& message) {
  BOOST_LOG_TRIVIAL(debug) << "Secure channel: Sending " << message << " to " << remote_address();
  send_frame(MessageCodec::encode(message));
}

Message SecureChannel::receive() {
  Message message = MessageCodec::decode(receive_frame());
  BOOST_LOG_TRIVIAL(debug) << "Secure channel: Received " << message << " from " << remote_address();
  return message;
}

//==============================================
// FRAMING
//==============================================

void SecureChannel::send_frame(std::vector<uint8_t> plaintext) {
  std::lock_guard<std::mutex> lock(send_mutex_);

  if (poisoned_) {
    throw FrameError("channel to " + remote_address() + " is no longer usable");
  }
  if (plaintext.size() + crypto::AeadCipher::TAG_SIZE > MAX_FRAME_SIZE) {
    throw SerializationError("payload of " + std::to_string(plaintext.size()) + " bytes exceeds frame limit");
  }

  encrypt_cipher_.seal_in_place(plaintext);

  // Length prefix and body go out in one write
  const uint32_t network_length = boost::endian::native_to_big(static_cast<uint32_t>(plaintext.size()));
  std::vector<uint8_t> frame(LENGTH_PREFIX_SIZE + plaintext.size());
  std::memcpy(frame.data(), &network_length, LENGTH_PREFIX_SIZE);
  std::copy(plaintext.begin(), plaintext.end(), frame.begin() + LENGTH_PREFIX_SIZE);

  boost::system::error_code ec;
  stream_->write(frame.data(), frame.size(), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Secure channel: Write to " << remote_address() << " failed: " << ec.message();
    throw ConnectionClosedError("write failed: " + ec.message());
  }

  BOOST_LOG_TRIVIAL(trace) << "Secure channel: Wrote frame of " << plaintext.size() << " bytes";
}

std::vector<uint8_t> SecureChannel::receive_frame() {
  std::lock_guard<std::mutex> lock(receive_mutex_);

  if (poisoned_) {
    throw FrameError("channel to " + remote_address() + " is no longer usable");
  }

  uint32_t network_length = 0;
  boost::system::error_code ec;
  std::size_t bytes_read = stream_->read(reinterpret_cast<uint8_t*>(&network_length), LENGTH_PREFIX_SIZE, ec);
  if (ec) {
    if (bytes_read == 0) {
      throw ConnectionClosedError(ec.message());
    }
    fail("truncated length prefix");
  }

  const uint32_t length = boost::endian::big_to_native(network_length);
  if (length < crypto::AeadCipher::TAG_SIZE || length > MAX_FRAME_SIZE) {
    fail("invalid frame length " + std::to_string(length));
  }

  std::vector<uint8_t> buffer(length);
  bytes_read = stream_->read(buffer.data(), buffer.size(), ec);
  if (ec) {
    fail("truncated frame, got " + std::to_string(bytes_read) + " of " + std::to_string(length) + " bytes");
  }

  try {
    decrypt_cipher_.open_in_place(buffer);
  }
  catch (const crypto::CryptoError& e) {
    fail(e.what());
  }

  BOOST_LOG_TRIVIAL(trace) << "Secure channel: Read frame of " << length << " bytes";
  return buffer;
}

//==============================================
// TEARDOWN
//==============================================

void SecureChannel::close() {
  if (stream_) {
    stream_->close();
  }
}

void SecureChannel::fail(const std::string& reason) {
  poisoned_ = true;
  BOOST_LOG_TRIVIAL(error) << "Secure channel: Closing channel to " << remote_address() << ": " << reason;
  close();
  throw FrameError(reason);
}

} // namespace network
} // namespace pneumatic
