#ifndef PNEUMATIC_CRYPTO_AEAD_CIPHER_HPP
#define PNEUMATIC_CRYPTO_AEAD_CIPHER_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <vector>
#include "crypto_error.hpp"

namespace pneumatic::crypto {

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// AES-256-GCM bound to one key and one monotonically increasing nonce sequence.
// Every seal or open consumes the next nonce; a nonce is never handed out twice.
class AeadCipher {
public:
  static constexpr size_t KEY_SIZE = 32;     // 256 bits for AES-256
  static constexpr size_t NONCE_SIZE = 12;   // 96 bit GCM nonce
  static constexpr size_t TAG_SIZE = 16;     // Appended authentication tag
  static constexpr uint64_t INITIAL_COUNTER = 1;

  using Key = std::array<uint8_t, KEY_SIZE>;
  using Nonce = std::array<uint8_t, NONCE_SIZE>;

  AeadCipher(const AeadCipher&) = delete;
  AeadCipher& operator=(const AeadCipher&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit AeadCipher(const Key& key);
  ~AeadCipher();


  // ---- SEAL/OPEN OPERATIONS ----
  // Encrypts buffer in place and appends the tag
  void seal_in_place(std::vector<uint8_t>& buffer);
  // Verifies and decrypts buffer in place, removing the tag.
  // On failure the buffer is wiped and AuthenticationError is thrown.
  void open_in_place(std::vector<uint8_t>& buffer);


  // ---- NONCE SEQUENCE ----
  // Low 64 bits little-endian counter, upper 32 bits zero
  static Nonce make_nonce(uint64_t counter);
  uint64_t counter() const { return counter_; }

private:
  // ---- PARAMETERS ----
  Key key_;
  uint64_t counter_ = INITIAL_COUNTER;
  std::unique_ptr<CipherContext> context_;


  // Increments the counter and returns the nonce for this operation
  Nonce advance();
};

} // namespace pneumatic::crypto

#endif // PNEUMATIC_CRYPTO_AEAD_CIPHER_HPP
