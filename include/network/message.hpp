#ifndef PNEUMATIC_NETWORK_MESSAGE_HPP
#define PNEUMATIC_NETWORK_MESSAGE_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <variant>

namespace pneumatic {
namespace network {

constexpr uint32_t PROTOCOL_VERSION = 1;

// Wire index of each message alternative
enum class MessageType : uint32_t {
    GREETING = 0,
    GREETING_RESPONSE = 1,
    DISCONNECT = 2
};

enum class GreetingStatus : uint32_t {
    PROTOCOL_OK = 0,
    UNSUPPORTED_PROTOCOL = 1
};

struct Greeting {
    uint32_t protocol_version = PROTOCOL_VERSION;
};

struct GreetingResponse {
    GreetingStatus status = GreetingStatus::PROTOCOL_OK;
};

struct Disconnect {};

using Message = std::variant<Greeting, GreetingResponse, Disconnect>;

MessageType message_type(const Message& message);
std::string message_type_to_string(MessageType type);
std::string greeting_status_to_string(GreetingStatus status);

inline bool operator==(const Greeting& lhs, const Greeting& rhs) {
    return lhs.protocol_version == rhs.protocol_version;
}
inline bool operator==(const GreetingResponse& lhs, const GreetingResponse& rhs) {
    return lhs.status == rhs.status;
}
inline bool operator==(const Disconnect&, const Disconnect&) {
    return true;
}

// Stream operator to support test assertions and logging
std::ostream& operator<<(std::ostream& os, const Message& message);

} // namespace network
} // namespace pneumatic

#endif // PNEUMATIC_NETWORK_MESSAGE_HPP
