#include "crypto/key_exchange.hpp"
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <boost/log/trivial.hpp>

namespace pneumatic::crypto {

//==============================================
// RAII WRAPPERS FOR OPENSSL KEY OBJECTS
//==============================================

struct PrivateKeyHandle {
  EVP_PKEY* pkey = nullptr;

  ~PrivateKeyHandle() {
    if (pkey) {
      EVP_PKEY_free(pkey);
    }
  }
};

namespace {

struct KeyContext {
  EVP_PKEY_CTX* ctx = nullptr;

  explicit KeyContext(EVP_PKEY_CTX* context) : ctx(context) {
    if (!ctx) {
      throw KeyExchangeError("Failed to create key context");
    }
  }

  ~KeyContext() {
    EVP_PKEY_CTX_free(ctx);
  }

  EVP_PKEY_CTX* get() { return ctx; }
};

struct PeerKey {
  EVP_PKEY* pkey = nullptr;

  ~PeerKey() {
    if (pkey) {
      EVP_PKEY_free(pkey);
    }
  }
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

EphemeralKeyPair::EphemeralKeyPair()
  : private_key_(std::make_unique<PrivateKeyHandle>()) {
  KeyContext context(EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr));

  if (EVP_PKEY_keygen_init(context.get()) <= 0 ||
      EVP_PKEY_keygen(context.get(), &private_key_->pkey) <= 0) {
    throw KeyExchangeError("Failed to generate X25519 key pair");
  }

  size_t length = public_key_.size();
  if (EVP_PKEY_get_raw_public_key(private_key_->pkey, public_key_.data(), &length) <= 0 ||
      length != PUBLIC_KEY_SIZE) {
    throw KeyExchangeError("Failed to export X25519 public key");
  }

  BOOST_LOG_TRIVIAL(debug) << "Key exchange: Generated ephemeral X25519 key pair";
}

EphemeralKeyPair::~EphemeralKeyPair() = default;

//==============================================
// KEY AGREEMENT
//==============================================

std::vector<uint8_t> EphemeralKeyPair::agree(const PublicKey& peer_public_key) {
  if (!private_key_) {
    throw KeyExchangeError("Ephemeral private key already consumed");
  }

  // The private key is single use whatever the outcome
  std::unique_ptr<PrivateKeyHandle> private_key = std::move(private_key_);

  PeerKey peer;
  peer.pkey = EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr,
                                          peer_public_key.data(), peer_public_key.size());
  if (!peer.pkey) {
    throw KeyExchangeError("Invalid peer public key");
  }

  KeyContext context(EVP_PKEY_CTX_new(private_key->pkey, nullptr));
  if (EVP_PKEY_derive_init(context.get()) <= 0 ||
      EVP_PKEY_derive_set_peer(context.get(), peer.pkey) <= 0) {
    throw KeyExchangeError("Failed to initialize key agreement");
  }

  size_t length = SHARED_SECRET_SIZE;
  std::vector<uint8_t> secret(length);
  if (EVP_PKEY_derive(context.get(), secret.data(), &length) <= 0 || length != SHARED_SECRET_SIZE) {
    OPENSSL_cleanse(secret.data(), secret.size());
    throw KeyExchangeError("Key agreement failed");
  }

  // Low-order peer points collapse the secret to zero
  static const std::array<uint8_t, SHARED_SECRET_SIZE> zeros{};
  if (CRYPTO_memcmp(secret.data(), zeros.data(), SHARED_SECRET_SIZE) == 0) {
    throw KeyExchangeError("Degenerate shared secret");
  }

  BOOST_LOG_TRIVIAL(debug) << "Key exchange: Computed X25519 shared secret";
  return secret;
}

} // namespace pneumatic::crypto
