#include "topology/topology_controller.hpp"

#include <algorithm>
#include <utility>

#include "support/logger.hpp"

namespace uRelay::Topology {

using Protocol::Packet;
using Protocol::Role;
using Support::Logger;

TopologyController::TopologyController(Remote::TransportAPI* transport,
                                       Runtime::TimerAPI* timers,
                                       TopologyConfig config)
    : transport(transport), timers(timers), config(config) {}

void TopologyController::join(std::string self_id, std::string display_name,
                              std::string language, bool is_root) {
  link = Idle{};
  heartbeat_timer.reset();
  candidate_table.clear();
  root_peer.reset();

  self_record = PeerRecord{};
  self_record.id = std::move(self_id);
  self_record.display_name = std::move(display_name);
  self_record.language = std::move(language);

  if (is_root) {
    self_record.role = Role::ROOT;
    link = Rooted{};
    start_heartbeat();
    announce();
  } else {
    self_record.role = Role::LEAF;
    start_discovery();
  }

  Logger::info("TOPOLOGY", "Joined as %s (%s, %s)",
               Protocol::role_name(self_record.role).data(),
               self_record.id.c_str(), self_record.language.c_str());
  publish_self_state();
}

void TopologyController::leave() {
  if (!joined()) {
    return;
  }
  link = Idle{};
  heartbeat_timer.reset();
  candidate_table.clear();
  root_peer.reset();
  Logger::info("TOPOLOGY", "Left (%s)", self_record.id.c_str());
  self_record = PeerRecord{};
}

void TopologyController::handle_packet(const Packet& packet,
                                       std::string_view from) {
  if (!joined()) {
    return;
  }
  if (from == self_record.id || packet.sender_id == self_record.id) {
    Logger::trace("TOPOLOGY", "Dropped own %s",
                  Protocol::packet_type_name(packet.type()).data());
    return;
  }

  if (const auto* announcement =
          std::get_if<Protocol::Announcement>(&packet.body)) {
    handle_announcement(*announcement, from);
  } else if (const auto* request =
                 std::get_if<Protocol::ConnectionRequest>(&packet.body)) {
    handle_connection_request(*request, from);
  } else if (std::holds_alternative<Protocol::ConnectionAck>(packet.body)) {
    handle_connection_ack(from);
  }
}

void TopologyController::handle_peer_join(std::string_view peer_id) {
  if (!joined()) {
    return;
  }
  Logger::debug("TOPOLOGY", "Peer joined: %.*s",
                static_cast<int>(peer_id.size()), peer_id.data());
  announce();
}

void TopologyController::handle_peer_leave(std::string_view peer_id) {
  if (!joined()) {
    return;
  }
  const std::string departed(peer_id);
  bool changed = false;

  candidate_table.erase(departed);

  auto target = connection_target();
  if (target && *target == departed) {
    Logger::info("TOPOLOGY", "Connection target %s departed, rediscovering",
                 departed.c_str());
    start_discovery();
  }

  if (root_peer && *root_peer == departed) {
    root_peer.reset();
    Logger::warning("TOPOLOGY", "Root %s departed, no root is known",
                    departed.c_str());
  }

  if (self_record.children_ids.erase(departed) > 0) {
    Logger::info("TOPOLOGY", "Child %s departed", departed.c_str());
    changed = true;
  }

  if (self_record.is_parent(departed)) {
    Logger::info("TOPOLOGY", "Parent %s departed, rediscovering",
                 departed.c_str());
    self_record.parent_id.reset();
    start_discovery();
    changed = true;
  }

  if (changed) {
    publish_self_state();
  }
}

void TopologyController::set_mic_locked(bool locked) {
  if (self_record.mic_locked == locked) {
    return;
  }
  self_record.mic_locked = locked;
  publish_self_state();
}

std::optional<std::string_view> TopologyController::connection_target() const {
  if (const auto* connecting = std::get_if<Connecting>(&link)) {
    return connecting->target;
  }
  return std::nullopt;
}

uint32_t TopologyController::connection_attempts() const {
  if (const auto* connecting = std::get_if<Connecting>(&link)) {
    return connecting->attempts;
  }
  return 0;
}

void TopologyController::handle_announcement(
    const Protocol::Announcement& announcement, std::string_view from) {
  if (candidate_table.upsert(from, announcement)) {
    Logger::debug("TOPOLOGY", "Candidate %.*s: %s %s",
                  static_cast<int>(from.size()), from.data(),
                  Protocol::role_name(announcement.role).data(),
                  announcement.language.c_str());
  }
  if (announcement.role == Role::ROOT &&
      (!root_peer || *root_peer != from)) {
    root_peer = std::string(from);
    Logger::info("TOPOLOGY", "Root is %s", root_peer->c_str());
  }
}

void TopologyController::handle_connection_request(
    const Protocol::ConnectionRequest& request, std::string_view from) {
  if (!Protocol::is_relay(self_record.role)) {
    Logger::debug("TOPOLOGY", "Ignored connection request from %.*s as LEAF",
                  static_cast<int>(from.size()), from.data());
    return;
  }

  std::string requester(from);
  if (self_record.is_parent(requester)) {
    Logger::warning("TOPOLOGY",
                    "Rejected connection request from parent %s",
                    requester.c_str());
    return;
  }

  bool added = self_record.children_ids.insert(requester).second;
  // Acknowledged every time, the first ACK might have been lost.
  send(Packet::connection_ack(self_record.id), requester);

  if (added) {
    Logger::info("TOPOLOGY", "Accepted child %s (%s, %s)", requester.c_str(),
                 Protocol::role_name(request.role).data(),
                 request.language.c_str());
    publish_self_state();
  }
}

void TopologyController::handle_connection_ack(std::string_view from) {
  if (self_record.parent_id && *self_record.parent_id == from) {
    Logger::trace("TOPOLOGY", "Duplicate ACK from parent");
    return;
  }

  const auto* connecting = std::get_if<Connecting>(&link);
  if (connecting == nullptr || connecting->target != from) {
    Logger::debug("TOPOLOGY", "Stale ACK from %.*s",
                  static_cast<int>(from.size()), from.data());
    return;
  }

  self_record.parent_id = std::string(from);
  link = Attached{};

  if (root_peer && *root_peer == *self_record.parent_id &&
      self_record.role != Role::ROOT) {
    self_record.role = Role::BRANCH;
    start_heartbeat();
    announce();
  }

  Logger::info("TOPOLOGY", "Attached to %s as %s",
               self_record.parent_id->c_str(),
               Protocol::role_name(self_record.role).data());
  publish_self_state();
}

void TopologyController::start_discovery(std::string backoff_target,
                                         uint32_t backoff_ticks) {
  link = Discovering{Runtime::schedule(timers, config.discovery_interval_ms,
                                       [this]() { on_discovery_tick(); }),
                     std::move(backoff_target), backoff_ticks};
}

void TopologyController::on_discovery_tick() {
  auto* discovering = std::get_if<Discovering>(&link);
  if (discovering == nullptr) {
    return;
  }
  if (discovering->backoff_ticks > 0) {
    discovering->backoff_ticks--;
  }
  auto target = select_target();
  if (!target) {
    return;
  }
  if (discovering->backoff_ticks > 0 &&
      *target == discovering->backoff_target) {
    Logger::trace("TOPOLOGY", "Waiting before retrying %s", target->c_str());
    return;
  }
  attempt_connection(std::move(*target));
}

std::optional<std::string> TopologyController::select_target() const {
  // A BRANCH forwards its language to the root and nowhere else.
  if (self_record.role == Role::LEAF) {
    if (auto branch = candidate_table.best_branch_for(self_record.language)) {
      return branch;
    }
  }
  if (root_peer && *root_peer != self_record.id) {
    return root_peer;
  }
  return std::nullopt;
}

void TopologyController::attempt_connection(std::string target) {
  Logger::info("TOPOLOGY", "Connecting to %s", target.c_str());
  link = Connecting{std::move(target), 0, Runtime::TimerHandle()};
  std::get<Connecting>(link).retry_timer =
      Runtime::schedule(timers, config.connection_retry_interval_ms,
                        [this]() { on_retry_tick(); });
  send_connection_request();
}

void TopologyController::on_retry_tick() {
  auto* connecting = std::get_if<Connecting>(&link);
  if (connecting == nullptr) {
    return;
  }
  if (config.max_connection_attempts > 0 &&
      connecting->attempts >= config.max_connection_attempts) {
    Logger::warning("TOPOLOGY", "No answer from %s after %u requests",
                    connecting->target.c_str(), connecting->attempts);
    uint32_t interval = std::max<uint32_t>(config.discovery_interval_ms, 1);
    uint32_t backoff_ticks =
        (config.connection_backoff_ms + interval - 1) / interval;
    start_discovery(std::move(connecting->target), backoff_ticks);
    return;
  }
  send_connection_request();
}

void TopologyController::send_connection_request() {
  auto& connecting = std::get<Connecting>(link);
  connecting.attempts++;
  send(Packet::connection_request(self_record.id, self_record.role,
                                  self_record.language),
       connecting.target);
}

void TopologyController::start_heartbeat() {
  if (heartbeat_timer.active()) {
    return;
  }
  heartbeat_timer = Runtime::schedule(timers, config.heartbeat_interval_ms,
                                      [this]() { announce(); });
}

void TopologyController::announce() {
  if (!Protocol::is_relay(self_record.role)) {
    return;
  }
  send(Packet::announce(self_record.id, self_record.role,
                        self_record.language),
       std::nullopt);
}

bool TopologyController::send(const Packet& packet,
                              std::optional<std::string_view> target) {
  if (transport->send(packet, target)) {
    return true;
  }
  Logger::warning("TOPOLOGY", "Failed to send %s to %.*s",
                  Protocol::packet_type_name(packet.type()).data(),
                  static_cast<int>(target ? target->size() : 3),
                  target ? target->data() : "all");
  return false;
}

void TopologyController::publish_self_state() {
  self_state_listeners.notify(self_record);
}

}  // namespace uRelay::Topology
