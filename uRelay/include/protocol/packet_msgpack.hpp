#pragma once

// msgpack representation of packets. Only included by translation units that
// encode or decode frames, the public headers stay free of msgpack.

#include <memory>
#include <msgpack.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "protocol/packet.hpp"

namespace uRelay::Protocol {

// The first 4 bytes are reserved for the frame length, which finish() fills
// in (network byte order).
class FrameBuffer {
 public:
  void write(const char* buf, size_t len) {
    buffer->insert(buffer->end(), buf, buf + len);
  }

  std::shared_ptr<std::vector<char>> finish();

 private:
  std::shared_ptr<std::vector<char>> buffer =
      std::make_shared<std::vector<char>>(4);
};

using Packer = msgpack::packer<FrameBuffer>;

void pack_string(Packer* packer, std::string_view value);

void pack_packet(Packer* packer, const Packet& packet);

const msgpack::object* find_field(const msgpack::object& map,
                                  std::string_view key);

std::optional<std::string_view> string_field(const msgpack::object& map,
                                             std::string_view key);

// Missing or malformed mandatory fields yield std::nullopt.
std::optional<Packet> unpack_packet(const msgpack::object& root);

}  // namespace uRelay::Protocol
