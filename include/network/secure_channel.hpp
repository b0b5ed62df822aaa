#ifndef PNEUMATIC_NETWORK_SECURE_CHANNEL_HPP
#define PNEUMATIC_NETWORK_SECURE_CHANNEL_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "crypto/aead_cipher.hpp"
#include "network/message.hpp"
#include "network/network_error.hpp"
#include "network/stream.hpp"

namespace pneumatic {
namespace network {

// Directional keys produced by the handshake
struct ChannelKeys {
  crypto::AeadCipher::Key encrypt_key{};
  crypto::AeadCipher::Key decrypt_key{};

  ~ChannelKeys();
};

/**
 * Authenticated, length-prefixed frames over an exclusively owned stream.
 *
 * Wire format per frame: u32 big-endian length, then AES-256-GCM ciphertext with
 * the 16-byte tag appended. Each direction has its own key and nonce sequence.
 * One thread may send while another receives.
 */
class SecureChannel {
public:
  static constexpr std::size_t LENGTH_PREFIX_SIZE = sizeof(uint32_t);
  static constexpr std::size_t MAX_FRAME_SIZE = 1024 * 1024;

  SecureChannel(const SecureChannel&) = delete;
  SecureChannel& operator=(const SecureChannel&) = delete;


  // ---- ESTABLISHMENT ----
  // Runs the handshake and takes ownership of the stream.
  // Throws HandshakeError; the stream is closed on failure.
  static std::unique_ptr<SecureChannel> establish(std::unique_ptr<Stream> stream);
  // X25519 public key exchange, salt exchange and HKDF derivation on a raw stream
  static ChannelKeys handshake(Stream& stream);


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  SecureChannel(std::unique_ptr<Stream> stream, const ChannelKeys& keys);
  ~SecureChannel();


  // ---- MESSAGING ----
  void send(const Message& message);
  // Throws ConnectionClosedError, FrameError or SerializationError
  Message receive();


  // ---- FRAMING ----
  void send_frame(std::vector<uint8_t> plaintext);
  // A tampered length prefix that still lies within MAX_FRAME_SIZE is only
  // caught once the body is read, so this blocks until that many bytes arrive
  // or the stream ends, then throws FrameError.
  std::vector<uint8_t> receive_frame();


  // ---- TEARDOWN ----
  void close();
  // True once a corrupt frame has been seen; every later call throws FrameError
  bool is_poisoned() const { return poisoned_; }


  // ---- GETTERS ----
  const std::string& remote_address() const { return stream_->remote_address(); }

private:
  // ---- PARAMETERS ----
  std::unique_ptr<Stream> stream_;
  crypto::AeadCipher encrypt_cipher_;
  crypto::AeadCipher decrypt_cipher_;
  std::mutex send_mutex_;
  std::mutex receive_mutex_;
  std::atomic<bool> poisoned_{false};

  // Marks the channel unusable, tears the stream down and throws FrameError
  [[noreturn]] void fail(const std::string& reason);
};

} // namespace network
} // namespace pneumatic

#endif // PNEUMATIC_NETWORK_SECURE_CHANNEL_HPP
