#include "network/message_codec.hpp"
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <cstring>

namespace pneumatic {
namespace network {

//==============================================
// SERIALIZATION
//==============================================

std::vector<uint8_t> MessageCodec::encode(const Message& message) {
  std::vector<uint8_t> output;
  output.reserve(2 * sizeof(uint32_t));

  write_u32(output, static_cast<uint32_t>(message_type(message)));

  if (const auto* greeting = std::get_if<Greeting>(&message)) {
    write_u32(output, greeting->protocol_version);
  } else if (const auto* response = std::get_if<GreetingResponse>(&message)) {
    write_u32(output, static_cast<uint32_t>(response->status));
  }

  BOOST_LOG_TRIVIAL(trace) << "Codec: Encoded " << message << " into " << output.size() << " bytes";
  return output;
}

//==============================================
// DESERIALIZATION
//==============================================

Message MessageCodec::decode(const std::vector<uint8_t>& payload) {
  std::size_t offset = 0;
  Message message;

  const uint32_t tag = read_u32(payload, offset);
  switch (static_cast<MessageType>(tag)) {
    case MessageType::GREETING: {
      Greeting greeting;
      greeting.protocol_version = read_u32(payload, offset);
      message = greeting;
      break;
    }
    case MessageType::GREETING_RESPONSE: {
      const uint32_t status = read_u32(payload, offset);
      if (status > static_cast<uint32_t>(GreetingStatus::UNSUPPORTED_PROTOCOL)) {
        throw SerializationError("Unknown greeting status " + std::to_string(status));
      }
      message = GreetingResponse{static_cast<GreetingStatus>(status)};
      break;
    }
    case MessageType::DISCONNECT:
      message = Disconnect{};
      break;
    default:
      throw SerializationError("Unknown message tag " + std::to_string(tag));
  }

  if (offset != payload.size()) {
    throw SerializationError(std::to_string(payload.size() - offset) + " trailing bytes after " +
                             message_type_to_string(message_type(message)));
  }

  BOOST_LOG_TRIVIAL(trace) << "Codec: Decoded " << message;
  return message;
}

//==============================================
// BYTE OPERATIONS
//==============================================

void MessageCodec::write_u32(std::vector<uint8_t>& output, uint32_t value) {
  const uint32_t little_endian = boost::endian::native_to_little(value);
  const auto* bytes = reinterpret_cast<const uint8_t*>(&little_endian);
  output.insert(output.end(), bytes, bytes + sizeof(little_endian));
}

uint32_t MessageCodec::read_u32(const std::vector<uint8_t>& input, std::size_t& offset) {
  if (offset > input.size() || input.size() - offset < sizeof(uint32_t)) {
    throw SerializationError("Payload truncated at offset " + std::to_string(offset));
  }
  uint32_t little_endian;
  std::memcpy(&little_endian, input.data() + offset, sizeof(little_endian));
  offset += sizeof(little_endian);
  return boost::endian::little_to_native(little_endian);
}

} // namespace network
} // namespace pneumatic
