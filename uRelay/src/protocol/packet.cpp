#include "protocol/packet.hpp"

#include <array>

namespace uRelay::Protocol {

namespace {
constexpr std::array<std::string_view, 5> packet_type_names{
    "ANNOUNCE", "CONNECTION_REQ", "CONNECTION_ACK", "AUDIO", "TRANSLATION"};
}  // namespace

std::string_view packet_type_name(PacketType type) {
  auto index = static_cast<size_t>(type);
  if (index < packet_type_names.size()) {
    return packet_type_names[index];
  }
  return "UNKNOWN";
}

std::optional<PacketType> packet_type_from_name(std::string_view name) {
  for (size_t i = 0; i < packet_type_names.size(); i++) {
    if (packet_type_names[i] == name) {
      return static_cast<PacketType>(i);
    }
  }
  return std::nullopt;
}

}  // namespace uRelay::Protocol
