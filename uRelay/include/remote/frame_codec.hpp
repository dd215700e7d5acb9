#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "protocol/packet.hpp"

namespace uRelay::Remote {

// First frame on every connection.
struct Hello {
  std::string node_id;
  std::string room_id;
  // Where the sender accepts connections. An empty address means "the
  // address this connection comes from".
  std::string address;
  uint16_t port = 0;
};

struct PeerAddress {
  std::string node_id;
  std::string address;
  uint16_t port = 0;
};

struct PeerList {
  std::vector<PeerAddress> peers;
};

using Frame = std::variant<Hello, PeerList, Protocol::Packet>;

// Frames are msgpack maps discriminated by their "type" entry and carry the
// same 4 byte length prefix as packets.
struct FrameCodec {
  static std::shared_ptr<std::vector<char>> encode(const Hello& hello);
  static std::shared_ptr<std::vector<char>> encode(const PeerList& peer_list);
  static std::shared_ptr<std::vector<char>> encode(
      const Protocol::Packet& packet);
};

// Accumulates the body of one frame and decodes it.
class FrameFactory {
  struct Storage;

 public:
  FrameFactory();
  FrameFactory(FrameFactory&&);

  FrameFactory& operator=(FrameFactory&&);

  ~FrameFactory();

  void write(const char* data, size_t size);

  std::optional<Frame> build();

 private:
  std::unique_ptr<Storage> storage;
};

}  // namespace uRelay::Remote
