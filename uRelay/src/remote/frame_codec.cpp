#include "remote/frame_codec.hpp"

#include <cstring>
#include <msgpack.hpp>
#include <utility>

#include "protocol/packet_codec.hpp"
#include "protocol/packet_msgpack.hpp"
#include "support/logger.hpp"

namespace uRelay::Remote {

using Protocol::FrameBuffer;
using Protocol::Packer;
using Protocol::pack_string;
using Support::Logger;

std::shared_ptr<std::vector<char>> FrameCodec::encode(const Hello& hello) {
  FrameBuffer buffer;
  Packer packer(buffer);
  packer.pack_map(5);
  pack_string(&packer, "type");
  pack_string(&packer, "HELLO");
  pack_string(&packer, "node_id");
  pack_string(&packer, hello.node_id);
  pack_string(&packer, "room_id");
  pack_string(&packer, hello.room_id);
  pack_string(&packer, "address");
  pack_string(&packer, hello.address);
  pack_string(&packer, "port");
  packer.pack_uint16(hello.port);
  return buffer.finish();
}

std::shared_ptr<std::vector<char>> FrameCodec::encode(
    const PeerList& peer_list) {
  FrameBuffer buffer;
  Packer packer(buffer);
  packer.pack_map(2);
  pack_string(&packer, "type");
  pack_string(&packer, "PEERS");
  pack_string(&packer, "peers");
  packer.pack_array(static_cast<uint32_t>(peer_list.peers.size()));
  for (const auto& peer : peer_list.peers) {
    packer.pack_array(3);
    pack_string(&packer, peer.node_id);
    pack_string(&packer, peer.address);
    packer.pack_uint16(peer.port);
  }
  return buffer.finish();
}

std::shared_ptr<std::vector<char>> FrameCodec::encode(
    const Protocol::Packet& packet) {
  return Protocol::PacketCodec::encode(packet);
}

struct FrameFactory::Storage {
  msgpack::unpacker unpacker;
};

FrameFactory::FrameFactory() : storage(std::make_unique<Storage>()) {}

FrameFactory::~FrameFactory() = default;

FrameFactory::FrameFactory(FrameFactory&&) = default;

FrameFactory& FrameFactory::operator=(FrameFactory&&) = default;

void FrameFactory::write(const char* data, size_t size) {
  storage->unpacker.reserve_buffer(size);
  std::memcpy(storage->unpacker.buffer(), data, size);
  storage->unpacker.buffer_consumed(size);
}

namespace {

std::optional<uint16_t> port_of(const msgpack::object& value) {
  if (value.type != msgpack::type::POSITIVE_INTEGER ||
      value.via.u64 > 65535) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(value.via.u64);
}

std::optional<Hello> hello_from(const msgpack::object& root) {
  auto node_id = Protocol::string_field(root, "node_id");
  auto room_id = Protocol::string_field(root, "room_id");
  auto address = Protocol::string_field(root, "address");
  const msgpack::object* port = Protocol::find_field(root, "port");
  if (!node_id || node_id->empty() || !room_id || port == nullptr) {
    return std::nullopt;
  }
  auto parsed_port = port_of(*port);
  if (!parsed_port) {
    return std::nullopt;
  }
  return Hello{std::string(*node_id), std::string(*room_id),
               std::string(address ? *address : ""), *parsed_port};
}

std::optional<PeerList> peer_list_from(const msgpack::object& root) {
  const msgpack::object* peers = Protocol::find_field(root, "peers");
  if (peers == nullptr || peers->type != msgpack::type::ARRAY) {
    return std::nullopt;
  }
  PeerList peer_list;
  for (uint32_t i = 0; i < peers->via.array.size; i++) {
    const msgpack::object& entry = peers->via.array.ptr[i];
    if (entry.type != msgpack::type::ARRAY || entry.via.array.size != 3) {
      return std::nullopt;
    }
    const msgpack::object& node_id = entry.via.array.ptr[0];
    const msgpack::object& address = entry.via.array.ptr[1];
    auto port = port_of(entry.via.array.ptr[2]);
    if (node_id.type != msgpack::type::STR ||
        address.type != msgpack::type::STR || !port) {
      return std::nullopt;
    }
    peer_list.peers.push_back(PeerAddress{
        std::string(node_id.via.str.ptr, node_id.via.str.size),
        std::string(address.via.str.ptr, address.via.str.size), *port});
  }
  return peer_list;
}

}  // namespace

std::optional<Frame> FrameFactory::build() {
  try {
    msgpack::object_handle result;
    if (!storage->unpacker.next(result)) {
      Logger::warning("FRAME-FACTORY", "Empty msgpack data");
      return std::nullopt;
    }
    const msgpack::object& root = result.get();
    if (root.type != msgpack::type::MAP) {
      Logger::warning("FRAME-FACTORY", "Root type is not a map");
      return std::nullopt;
    }

    auto type = Protocol::string_field(root, "type");
    if (type == "HELLO") {
      if (auto hello = hello_from(root)) {
        return Frame(std::move(*hello));
      }
      Logger::warning("FRAME-FACTORY", "Malformed HELLO");
      return std::nullopt;
    } else if (type == "PEERS") {
      if (auto peer_list = peer_list_from(root)) {
        return Frame(std::move(*peer_list));
      }
      Logger::warning("FRAME-FACTORY", "Malformed PEERS");
      return std::nullopt;
    }

    if (auto packet = Protocol::unpack_packet(root)) {
      return Frame(std::move(*packet));
    }
  } catch (const msgpack::unpack_error& error) {
    Logger::warning("FRAME-FACTORY", "Undecodable frame: %s", error.what());
  }
  return std::nullopt;
}

}  // namespace uRelay::Remote
