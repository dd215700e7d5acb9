#include "protocol/packet_codec.hpp"

#include <new>

#include "protocol/packet_msgpack.hpp"
#include "support/logger.hpp"

namespace uRelay::Protocol {

using Support::Logger;

std::shared_ptr<std::vector<char>> PacketCodec::encode(const Packet& packet) {
  try {
    FrameBuffer buffer;
    Packer packer(buffer);
    pack_packet(&packer, packet);
    return buffer.finish();
  } catch (const std::bad_alloc& exception) {
    Logger::error("PACKET-CODEC",
                  "Dropped outgoing packet as the system is out of memory");
    return nullptr;
  }
}

std::optional<Packet> PacketCodec::decode(const char* data, size_t size) {
  if (size == 0) {
    return std::nullopt;
  }
  try {
    msgpack::object_handle handle = msgpack::unpack(data, size);
    if (handle.get().type != msgpack::type::MAP) {
      Logger::warning("PACKET-CODEC", "Root type is not a map");
      return std::nullopt;
    }
    return unpack_packet(handle.get());
  } catch (const msgpack::unpack_error& error) {
    Logger::warning("PACKET-CODEC", "Undecodable packet: %s", error.what());
  }
  return std::nullopt;
}

}  // namespace uRelay::Protocol
