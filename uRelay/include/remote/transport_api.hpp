#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "protocol/packet.hpp"

namespace uRelay::Remote {

struct TransportListener {
  virtual void on_peer_join(std::string_view peer_id) = 0;
  virtual void on_peer_leave(std::string_view peer_id) = 0;
  // sender is the immediate hop, which differs from packet.sender_id for
  // relayed data packets.
  virtual void on_packet(Protocol::Packet&& packet, std::string_view sender) = 0;

  virtual ~TransportListener() {}
};

// Best-effort peer messaging inside a room. Delivery is unordered and at most
// once per send, there are no acknowledgements.
struct TransportAPI {
  // Returns the id assigned to the local peer.
  virtual std::string join(std::string_view room_id,
                           TransportListener* listener) = 0;
  virtual void leave() = 0;
  // Without a target the packet goes to every current room member.
  virtual bool send(const Protocol::Packet& packet,
                    std::optional<std::string_view> target) = 0;

  virtual ~TransportAPI() {}
};

}  // namespace uRelay::Remote
