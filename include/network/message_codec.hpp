#ifndef PNEUMATIC_NETWORK_MESSAGE_CODEC_HPP
#define PNEUMATIC_NETWORK_MESSAGE_CODEC_HPP

#include <cstdint>
#include <vector>
#include "network/message.hpp"
#include "network/network_error.hpp"

namespace pneumatic {
namespace network {

// Compact little-endian encoding: u32 variant index followed by the fields.
class MessageCodec {
public:
  // ---- SERIALIZATION AND DESERIALIZATION ----
  static std::vector<uint8_t> encode(const Message& message);
  // Throws SerializationError on unknown tags, short input or trailing bytes
  static Message decode(const std::vector<uint8_t>& payload);

private:
  // ---- BYTE OPERATIONS ----
  static void write_u32(std::vector<uint8_t>& output, uint32_t value);
  static uint32_t read_u32(const std::vector<uint8_t>& input, std::size_t& offset);
};

} // namespace network
} // namespace pneumatic

#endif // PNEUMATIC_NETWORK_MESSAGE_CODEC_HPP
