#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "protocol/packet.hpp"
#include "remote/transport_api.hpp"
#include "runtime/timer_api.hpp"
#include "support/listener_list.hpp"
#include "topology/candidate_table.hpp"
#include "topology/peer_record.hpp"
#include "topology/topology_config.hpp"

namespace uRelay::Topology {

// Builds and maintains the local node's place in the ROOT/BRANCH/LEAF tree
// from announcements and the connection handshake. Every handler checks the
// current state first and turns stale or duplicate input into a no-op.
class TopologyController {
 public:
  enum class LinkPhase { IDLE, DISCOVERING, CONNECTING, ATTACHED, ROOTED };

  using SelfStateCallback = std::function<void(const PeerRecord&)>;

  TopologyController(Remote::TransportAPI* transport, Runtime::TimerAPI* timers,
                     TopologyConfig config = TopologyConfig());

  // Resets all local state. A root starts announcing right away, everybody
  // else starts looking for a parent.
  void join(std::string self_id, std::string display_name,
            std::string language, bool is_root);
  void leave();

  // Control packets only, data packets are ignored.
  void handle_packet(const Protocol::Packet& packet, std::string_view from);
  void handle_peer_join(std::string_view peer_id);
  void handle_peer_leave(std::string_view peer_id);

  void set_mic_locked(bool locked);

  uint32_t add_self_state_listener(SelfStateCallback callback) {
    return self_state_listeners.add(std::move(callback));
  }
  bool remove_self_state_listener(uint32_t id) {
    return self_state_listeners.remove(id);
  }

  [[nodiscard]] const PeerRecord& self() const { return self_record; }
  [[nodiscard]] const CandidateTable& candidates() const {
    return candidate_table;
  }
  [[nodiscard]] const std::optional<std::string>& root_peer_id() const {
    return root_peer;
  }
  [[nodiscard]] LinkPhase phase() const {
    return static_cast<LinkPhase>(link.index());
  }
  [[nodiscard]] bool joined() const { return phase() != LinkPhase::IDLE; }
  [[nodiscard]] std::optional<std::string_view> connection_target() const;
  [[nodiscard]] uint32_t connection_attempts() const;
  [[nodiscard]] bool heartbeat_active() const {
    return heartbeat_timer.active();
  }

 private:
  struct Idle {};
  struct Discovering {
    Runtime::TimerHandle timer;
    // Target whose attempts ran out and the discovery ticks left before it
    // is tried again.
    std::string backoff_target;
    uint32_t backoff_ticks = 0;
  };
  struct Connecting {
    std::string target;
    uint32_t attempts = 0;
    Runtime::TimerHandle retry_timer;
  };
  struct Attached {};
  struct Rooted {};

  // Alternatives in LinkPhase order. The discovery and retry timers are owned
  // by their state, so at most one of them runs at any time.
  using LinkState =
      std::variant<Idle, Discovering, Connecting, Attached, Rooted>;

  Remote::TransportAPI* transport;
  Runtime::TimerAPI* timers;
  TopologyConfig config;

  PeerRecord self_record;
  CandidateTable candidate_table;
  std::optional<std::string> root_peer;
  LinkState link;
  // Runs while the local role is ROOT or BRANCH.
  Runtime::TimerHandle heartbeat_timer;

  Support::ListenerList<const PeerRecord&> self_state_listeners;

  void handle_announcement(const Protocol::Announcement& announcement,
                           std::string_view from);
  void handle_connection_request(const Protocol::ConnectionRequest& request,
                                 std::string_view from);
  void handle_connection_ack(std::string_view from);

  void start_discovery(std::string backoff_target = std::string(),
                       uint32_t backoff_ticks = 0);
  void on_discovery_tick();
  std::optional<std::string> select_target() const;

  void attempt_connection(std::string target);
  void on_retry_tick();
  void send_connection_request();

  void start_heartbeat();
  void announce();

  bool send(const Protocol::Packet& packet,
            std::optional<std::string_view> target);
  void publish_self_state();
};

}  // namespace uRelay::Topology
