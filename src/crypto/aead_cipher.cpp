#include "crypto/aead_cipher.hpp"
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cstring>
#include <limits>

namespace pneumatic::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw CryptoError("AEAD cipher: Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  EVP_CIPHER_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

AeadCipher::AeadCipher(const Key& key)
  : key_(key)
  , context_(std::make_unique<CipherContext>()) {
  BOOST_LOG_TRIVIAL(debug) << "AEAD cipher: Bound AES-256-GCM key";
}

AeadCipher::~AeadCipher() {
  OPENSSL_cleanse(key_.data(), key_.size());
}

//==============================================
// NONCE SEQUENCE
//==============================================

AeadCipher::Nonce AeadCipher::make_nonce(uint64_t counter) {
  Nonce nonce{};
  uint64_t little_endian = boost::endian::native_to_little(counter);
  std::memcpy(nonce.data(), &little_endian, sizeof(little_endian));
  return nonce;
}

AeadCipher::Nonce AeadCipher::advance() {
  if (counter_ == std::numeric_limits<uint64_t>::max()) {
    throw EncryptionError("AEAD cipher: Nonce sequence exhausted");
  }
  ++counter_;
  return make_nonce(counter_);
}

//==============================================
// SEAL/OPEN OPERATIONS
//==============================================

void AeadCipher::seal_in_place(std::vector<uint8_t>& buffer) {
  const Nonce nonce = advance();
  EVP_CIPHER_CTX* ctx = context_->get();
  EVP_CIPHER_CTX_reset(ctx);

  if (!EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) ||
      !EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) ||
      !EVP_EncryptInit_ex(ctx, nullptr, nullptr, key_.data(), nonce.data())) {
    throw EncryptionError("AEAD cipher: Failed to initialize encryption context");
  }

  int outlen = 0;
  if (!buffer.empty() &&
      !EVP_EncryptUpdate(ctx, buffer.data(), &outlen, buffer.data(), static_cast<int>(buffer.size()))) {
    throw EncryptionError("AEAD cipher: Failed to encrypt buffer");
  }

  // GCM produces no trailing block
  uint8_t final_block[EVP_MAX_BLOCK_LENGTH];
  int final_len = 0;
  if (!EVP_EncryptFinal_ex(ctx, final_block, &final_len)) {
    throw EncryptionError("AEAD cipher: Failed to finalize encryption");
  }

  std::array<uint8_t, TAG_SIZE> tag{};
  if (!EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE), tag.data())) {
    throw EncryptionError("AEAD cipher: Failed to read authentication tag");
  }
  buffer.insert(buffer.end(), tag.begin(), tag.end());

  BOOST_LOG_TRIVIAL(trace) << "AEAD cipher: Sealed " << buffer.size() << " bytes with nonce counter " << counter_;
}

void AeadCipher::open_in_place(std::vector<uint8_t>& buffer) {
  const Nonce nonce = advance();

  if (buffer.size() < TAG_SIZE) {
    buffer.clear();
    throw AuthenticationError("AEAD cipher: Sealed buffer shorter than tag");
  }

  std::array<uint8_t, TAG_SIZE> tag{};
  std::copy(buffer.end() - TAG_SIZE, buffer.end(), tag.begin());
  buffer.resize(buffer.size() - TAG_SIZE);

  EVP_CIPHER_CTX* ctx = context_->get();
  EVP_CIPHER_CTX_reset(ctx);

  if (!EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) ||
      !EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) ||
      !EVP_DecryptInit_ex(ctx, nullptr, nullptr, key_.data(), nonce.data())) {
    buffer.clear();
    throw CryptoError("AEAD cipher: Failed to initialize decryption context");
  }

  int outlen = 0;
  if (!buffer.empty() &&
      !EVP_DecryptUpdate(ctx, buffer.data(), &outlen, buffer.data(), static_cast<int>(buffer.size()))) {
    OPENSSL_cleanse(buffer.data(), buffer.size());
    buffer.clear();
    throw AuthenticationError("AEAD cipher: Failed to decrypt buffer");
  }

  uint8_t final_block[EVP_MAX_BLOCK_LENGTH];
  int final_len = 0;
  if (!EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE), tag.data()) ||
      EVP_DecryptFinal_ex(ctx, final_block, &final_len) <= 0) {
    // Never leave unauthenticated plaintext behind
    if (!buffer.empty()) {
      OPENSSL_cleanse(buffer.data(), buffer.size());
    }
    buffer.clear();
    BOOST_LOG_TRIVIAL(warning) << "AEAD cipher: Tag verification failed at nonce counter " << counter_;
    throw AuthenticationError("AEAD cipher: Tag verification failed");
  }

  BOOST_LOG_TRIVIAL(trace) << "AEAD cipher: Opened " << buffer.size() << " bytes with nonce counter " << counter_;
}

} // namespace pneumatic::crypto
