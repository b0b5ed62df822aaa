#include "crypto/key_derivation.hpp"
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace pneumatic::crypto {

Salt generate_salt() {
  Salt salt{};
  if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
    throw KeyDerivationError("Failed to generate random salt");
  }
  return salt;
}

std::vector<uint8_t> hkdf_sha256(const std::vector<uint8_t>& salt,
                                 const std::vector<uint8_t>& input_key_material,
                                 const std::string& info,
                                 std::size_t length) {
  EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
  if (!ctx) {
    throw KeyDerivationError("Failed to create HKDF context");
  }

  std::vector<uint8_t> output(length);
  size_t output_length = output.size();

  const bool ok =
    EVP_PKEY_derive_init(ctx) > 0 &&
    EVP_PKEY_CTX_set_hkdf_md(ctx, EVP_sha256()) > 0 &&
    EVP_PKEY_CTX_set1_hkdf_salt(ctx, salt.data(), static_cast<int>(salt.size())) > 0 &&
    EVP_PKEY_CTX_set1_hkdf_key(ctx, input_key_material.data(), static_cast<int>(input_key_material.size())) > 0 &&
    EVP_PKEY_CTX_add1_hkdf_info(ctx, reinterpret_cast<const unsigned char*>(info.data()),
                                static_cast<int>(info.size())) > 0 &&
    EVP_PKEY_derive(ctx, output.data(), &output_length) > 0;

  EVP_PKEY_CTX_free(ctx);

  if (!ok || output_length != length) {
    OPENSSL_cleanse(output.data(), output.size());
    throw KeyDerivationError("HKDF-SHA256 derivation failed");
  }
  return output;
}

AeadCipher::Key derive_channel_key(const Salt& salt, const std::vector<uint8_t>& shared_secret) {
  std::vector<uint8_t> okm = hkdf_sha256(std::vector<uint8_t>(salt.begin(), salt.end()),
                                         shared_secret, KEY_INFO, AeadCipher::KEY_SIZE);

  AeadCipher::Key key{};
  std::copy(okm.begin(), okm.end(), key.begin());
  OPENSSL_cleanse(okm.data(), okm.size());

  BOOST_LOG_TRIVIAL(debug) << "Key derivation: Derived channel key";
  return key;
}

} // namespace pneumatic::crypto
