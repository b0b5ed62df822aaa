#ifndef PNEUMATIC_NETWORK_ERROR_HPP
#define PNEUMATIC_NETWORK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pneumatic {
namespace network {

class NetworkException : public std::runtime_error {
public:
    explicit NetworkException(const std::string& message)
        : std::runtime_error(message) {}
};

// I/O or key agreement failure while establishing a secure channel
class HandshakeError : public NetworkException {
public:
    explicit HandshakeError(const std::string& message)
        : NetworkException("Handshake failed: " + message) {}
};

// Authentication failure, truncated frame or invalid frame length
class FrameError : public NetworkException {
public:
    explicit FrameError(const std::string& message)
        : NetworkException("Frame corrupted: " + message) {}
};

// Peer closed the stream on a frame boundary
class ConnectionClosedError : public NetworkException {
public:
    explicit ConnectionClosedError(const std::string& message)
        : NetworkException("Connection closed: " + message) {}
};

// Decrypted payload is not a valid message encoding
class SerializationError : public NetworkException {
public:
    explicit SerializationError(const std::string& message)
        : NetworkException("Serialization error: " + message) {}
};

// Message received in a state that does not accept it
class ProtocolViolation : public NetworkException {
public:
    explicit ProtocolViolation(const std::string& message)
        : NetworkException("Protocol violation: " + message) {}
};

} // namespace network
} // namespace pneumatic

#endif // PNEUMATIC_NETWORK_ERROR_HPP
