#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>

#include "protocol/packet.hpp"
#include "remote/transport_api.hpp"
#include "support/listener_list.hpp"
#include "topology/topology_controller.hpp"

namespace uRelay::Routing {

// Moves AUDIO and TRANSLATION packets along the tree edges currently known to
// the topology controller.
//
// Outbound: a LEAF sends to its parent, a BRANCH to its parent and children,
// the ROOT to its children. Inbound packets are delivered locally once, then
// a BRANCH forwards child traffic up and parent traffic down, the ROOT fans
// out to every child but the one the packet came from.
class PacketRouter {
 public:
  // Arguments are the originating peer and the payload.
  using AudioCallback =
      std::function<void(std::string_view, const Protocol::AudioPayload&)>;
  using TranslationCallback = std::function<void(
      std::string_view, const Protocol::TranslationPayload&)>;

  PacketRouter(Remote::TransportAPI* transport,
               const Topology::TopologyController* topology);

  // Returns the number of peers the packet was handed to.
  size_t broadcast_audio(Protocol::AudioPayload payload);
  size_t broadcast_translation(Protocol::TranslationPayload payload);

  // from is the immediate hop, packet.sender_id the originator.
  void handle_packet(const Protocol::Packet& packet, std::string_view from);

  uint32_t add_audio_listener(AudioCallback callback) {
    return audio_listeners.add(std::move(callback));
  }
  bool remove_audio_listener(uint32_t id) {
    return audio_listeners.remove(id);
  }
  uint32_t add_translation_listener(TranslationCallback callback) {
    return translation_listeners.add(std::move(callback));
  }
  bool remove_translation_listener(uint32_t id) {
    return translation_listeners.remove(id);
  }

 private:
  Remote::TransportAPI* transport;
  const Topology::TopologyController* topology;

  Support::ListenerList<std::string_view, const Protocol::AudioPayload&>
      audio_listeners;
  Support::ListenerList<std::string_view, const Protocol::TranslationPayload&>
      translation_listeners;

  size_t originate(const Protocol::Packet& packet);
  void deliver_locally(const Protocol::Packet& packet);
  size_t forward(const Protocol::Packet& packet, std::string_view from);
  size_t send_to_children(const Protocol::Packet& packet,
                          std::optional<std::string_view> except);
  bool send_to(const Protocol::Packet& packet, std::string_view target);
};

}  // namespace uRelay::Routing
