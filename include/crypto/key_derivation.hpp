#ifndef PNEUMATIC_CRYPTO_KEY_DERIVATION_HPP
#define PNEUMATIC_CRYPTO_KEY_DERIVATION_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include "crypto_error.hpp"
#include "aead_cipher.hpp"

namespace pneumatic::crypto {

constexpr std::size_t SALT_SIZE = 32;

// Context label bound into every channel key
constexpr const char* KEY_INFO = "pneumatic-key";

using Salt = std::array<uint8_t, SALT_SIZE>;

// Fills a salt from the OpenSSL CSPRNG
Salt generate_salt();

// RFC 5869 extract-then-expand with SHA-256
std::vector<uint8_t> hkdf_sha256(const std::vector<uint8_t>& salt,
                                 const std::vector<uint8_t>& input_key_material,
                                 const std::string& info,
                                 std::size_t length);

// Derives one direction's AES-256-GCM key from a salt and the DH shared secret
AeadCipher::Key derive_channel_key(const Salt& salt, const std::vector<uint8_t>& shared_secret);

} // namespace pneumatic::crypto

#endif // PNEUMATIC_CRYPTO_KEY_DERIVATION_HPP
