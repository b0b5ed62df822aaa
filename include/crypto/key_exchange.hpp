#ifndef PNEUMATIC_CRYPTO_KEY_EXCHANGE_HPP
#define PNEUMATIC_CRYPTO_KEY_EXCHANGE_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <vector>
#include "crypto_error.hpp"

namespace pneumatic::crypto {

// Forward declaration for the OpenSSL key handle
struct PrivateKeyHandle;

// Single-use X25519 key pair. agree() consumes the private key.
class EphemeralKeyPair {
public:
  static constexpr size_t PUBLIC_KEY_SIZE = 32;
  static constexpr size_t SHARED_SECRET_SIZE = 32;

  using PublicKey = std::array<uint8_t, PUBLIC_KEY_SIZE>;

  EphemeralKeyPair(const EphemeralKeyPair&) = delete;
  EphemeralKeyPair& operator=(const EphemeralKeyPair&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Generates a fresh key pair
  EphemeralKeyPair();
  ~EphemeralKeyPair();


  // ---- KEY AGREEMENT ----
  const PublicKey& public_key() const { return public_key_; }
  // Computes the shared secret with the peer's raw public key.
  // Throws KeyExchangeError on a second call or on a degenerate peer key.
  std::vector<uint8_t> agree(const PublicKey& peer_public_key);

private:
  std::unique_ptr<PrivateKeyHandle> private_key_;
  PublicKey public_key_{};
};

} // namespace pneumatic::crypto

#endif // PNEUMATIC_CRYPTO_KEY_EXCHANGE_HPP
