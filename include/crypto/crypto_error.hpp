#ifndef PNEUMATIC_CRYPTO_ERROR_HPP
#define PNEUMATIC_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pneumatic::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message) 
        : std::runtime_error(message) {}
};

class KeyExchangeError : public CryptoError {
public:
    explicit KeyExchangeError(const std::string& message) 
        : CryptoError("Key exchange error: " + message) {}
};

class KeyDerivationError : public CryptoError {
public:
    explicit KeyDerivationError(const std::string& message) 
        : CryptoError("Key derivation error: " + message) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message) 
        : CryptoError("Encryption error: " + message) {}
};

// Raised when a sealed buffer fails tag verification
class AuthenticationError : public CryptoError {
public:
    explicit AuthenticationError(const std::string& message) 
        : CryptoError("Authentication error: " + message) {}
};

} // namespace pneumatic::crypto

#endif // PNEUMATIC_CRYPTO_ERROR_HPP
