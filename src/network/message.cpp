#include "network/message.hpp"

namespace pneumatic {
namespace network {

MessageType message_type(const Message& message) {
  return static_cast<MessageType>(message.index());
}

std::string message_type_to_string(MessageType type) {
  switch (type) {
    case MessageType::GREETING:          return "GREETING";
    case MessageType::GREETING_RESPONSE: return "GREETING_RESPONSE";
    case MessageType::DISCONNECT:        return "DISCONNECT";
    default:                             return "UNKNOWN";
  }
}

std::string greeting_status_to_string(GreetingStatus status) {
  switch (status) {
    case GreetingStatus::PROTOCOL_OK:          return "PROTOCOL_OK";
    case GreetingStatus::UNSUPPORTED_PROTOCOL: return "UNSUPPORTED_PROTOCOL";
    default:                                   return "UNKNOWN";
  }
}

std::ostream& operator<<(std::ostream& os, const Message& message) {
  os << message_type_to_string(message_type(message));
  if (const auto* greeting = std::get_if<Greeting>(&message)) {
    os << "{protocol_version=" << greeting->protocol_version << "}";
  } else if (const auto* response = std::get_if<GreetingResponse>(&message)) {
    os << "{" << greeting_status_to_string(response->status) << "}";
  }
  return os;
}

} // namespace network
} // namespace pneumatic
