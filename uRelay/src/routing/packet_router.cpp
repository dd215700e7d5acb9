#include "routing/packet_router.hpp"

#include <string>

#include "support/logger.hpp"

namespace uRelay::Routing {

using Protocol::Packet;
using Protocol::Role;
using Support::Logger;

PacketRouter::PacketRouter(Remote::TransportAPI* transport,
                           const Topology::TopologyController* topology)
    : transport(transport), topology(topology) {}

size_t PacketRouter::broadcast_audio(Protocol::AudioPayload payload) {
  return originate(Packet(topology->self().id, std::move(payload)));
}

size_t PacketRouter::broadcast_translation(
    Protocol::TranslationPayload payload) {
  return originate(Packet(topology->self().id, std::move(payload)));
}

void PacketRouter::handle_packet(const Packet& packet, std::string_view from) {
  if (!packet.is_data() || !topology->joined()) {
    return;
  }
  const auto& self = topology->self();
  if (packet.sender_id == self.id) {
    Logger::trace("ROUTER", "Dropped looped back %s via %.*s",
                  Protocol::packet_type_name(packet.type()).data(),
                  static_cast<int>(from.size()), from.data());
    return;
  }

  deliver_locally(packet);
  forward(packet, from);
}

size_t PacketRouter::originate(const Packet& packet) {
  const auto& self = topology->self();
  size_t sent = 0;
  switch (self.role) {
    case Role::LEAF:
      if (!self.parent_id) {
        Logger::debug("ROUTER", "Dropped %s, no parent",
                      Protocol::packet_type_name(packet.type()).data());
        return 0;
      }
      sent += send_to(packet, *self.parent_id) ? 1 : 0;
      break;
    case Role::BRANCH:
      if (self.parent_id) {
        sent += send_to(packet, *self.parent_id) ? 1 : 0;
      }
      sent += send_to_children(packet, std::nullopt);
      break;
    case Role::ROOT:
      sent += send_to_children(packet, std::nullopt);
      break;
  }
  return sent;
}

void PacketRouter::deliver_locally(const Packet& packet) {
  if (const auto* audio = std::get_if<Protocol::AudioPayload>(&packet.body)) {
    audio_listeners.notify(packet.sender_id, *audio);
  } else if (const auto* translation =
                 std::get_if<Protocol::TranslationPayload>(&packet.body)) {
    translation_listeners.notify(packet.sender_id, *translation);
  }
}

size_t PacketRouter::forward(const Packet& packet, std::string_view from) {
  const auto& self = topology->self();
  const std::string hop(from);
  switch (self.role) {
    case Role::LEAF:
      return 0;
    case Role::BRANCH:
      if (self.has_child(hop)) {
        if (!self.parent_id) {
          return 0;
        }
        return send_to(packet, *self.parent_id) ? 1 : 0;
      }
      if (self.is_parent(hop)) {
        return send_to_children(packet, from);
      }
      Logger::debug("ROUTER", "Not forwarding %s from unrelated peer %s",
                    Protocol::packet_type_name(packet.type()).data(),
                    hop.c_str());
      return 0;
    case Role::ROOT:
      return send_to_children(packet, from);
  }
  return 0;
}

size_t PacketRouter::send_to_children(const Packet& packet,
                                      std::optional<std::string_view> except) {
  size_t sent = 0;
  for (const auto& child : topology->self().children_ids) {
    if (except && *except == child) {
      continue;
    }
    sent += send_to(packet, child) ? 1 : 0;
  }
  return sent;
}

bool PacketRouter::send_to(const Packet& packet, std::string_view target) {
  if (transport->send(packet, target)) {
    return true;
  }
  Logger::warning("ROUTER", "Failed to send %s to %.*s",
                  Protocol::packet_type_name(packet.type()).data(),
                  static_cast<int>(target.size()), target.data());
  return false;
}

}  // namespace uRelay::Routing
