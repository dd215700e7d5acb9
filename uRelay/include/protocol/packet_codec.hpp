#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "protocol/packet.hpp"

namespace uRelay::Protocol {

struct PacketCodec {
  // msgpack map {type, sender_id, payload?} behind a 4 byte length prefix
  // (network byte order).
  static std::shared_ptr<std::vector<char>> encode(const Packet& packet);

  // Decodes a single msgpack map, without the length prefix.
  static std::optional<Packet> decode(const char* data, size_t size);
};

}  // namespace uRelay::Protocol
