#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "protocol/packet.hpp"
#include "runtime/event_loop.hpp"
#include "test_support.hpp"
#include "topology/topology_controller.hpp"

namespace uRelay::Test {

using Protocol::Packet;
using Protocol::PacketType;
using Protocol::Role;
using Topology::TopologyController;
using LinkPhase = Topology::TopologyController::LinkPhase;

struct TopologyFixture {
  explicit TopologyFixture(
      Topology::TopologyConfig config = Topology::TopologyConfig())
      : loop(clock.source()), controller(&transport, &loop, config) {
    controller.add_self_state_listener(
        [this](const Topology::PeerRecord& self) {
          notifications.push_back(self);
        });
  }

  void join(bool is_root, std::string language = "en") {
    controller.join("self", "Self", std::move(language), is_root);
  }

  void receive(Packet packet) {
    std::string from = packet.sender_id;
    controller.handle_packet(packet, from);
  }

  void announce(const std::string& peer, Role role,
                const std::string& language = "en") {
    receive(Packet::announce(peer, role, language));
  }

  void advance_ms(uint32_t duration) { advance(&clock, &loop, duration); }

  // LEAF attached to a BRANCH that is not the root
  void attach_as_leaf(const std::string& branch) {
    join(false);
    announce(branch, Role::BRANCH);
    advance_ms(1000);
    receive(Packet::connection_ack(branch));
  }

  // BRANCH attached to the root
  void attach_as_branch(const std::string& root) {
    join(false);
    announce(root, Role::ROOT);
    advance_ms(1000);
    receive(Packet::connection_ack(root));
  }

  FakeClock clock;
  Runtime::EventLoop loop;
  RecordingTransport transport;
  TopologyController controller;
  std::vector<Topology::PeerRecord> notifications;
};

TEST(TOPOLOGY, root_join_announces_and_heartbeats) {
  TopologyFixture f;
  f.join(true);

  ASSERT_EQ(f.controller.phase(), LinkPhase::ROOTED);
  ASSERT_EQ(f.controller.self().role, Role::ROOT);
  ASSERT_FALSE(f.controller.self().parent_id);
  ASSERT_TRUE(f.controller.heartbeat_active());
  ASSERT_EQ(f.transport.count(PacketType::ANNOUNCE), 1u);
  ASSERT_FALSE(f.transport.sent.front().target);

  f.advance_ms(4000);
  ASSERT_EQ(f.transport.count(PacketType::ANNOUNCE), 3u);

  const auto& announcement =
      std::get<Protocol::Announcement>(f.transport.sent.back().packet.body);
  ASSERT_EQ(announcement.role, Role::ROOT);
  ASSERT_EQ(announcement.language, "en");
  ASSERT_EQ(f.notifications.size(), 1u);
}

TEST(TOPOLOGY, leaf_without_candidates_keeps_discovering) {
  TopologyFixture f;
  f.join(false);
  ASSERT_EQ(f.controller.phase(), LinkPhase::DISCOVERING);
  ASSERT_EQ(f.controller.self().role, Role::LEAF);
  ASSERT_FALSE(f.controller.heartbeat_active());

  f.advance_ms(10000);
  ASSERT_EQ(f.controller.phase(), LinkPhase::DISCOVERING);
  ASSERT_TRUE(f.transport.sent.empty());
}

TEST(TOPOLOGY, announcements_fill_candidate_table) {
  TopologyFixture f;
  f.join(false);
  f.announce("peer_1", Role::BRANCH, "en");
  f.announce("peer_1", Role::LEAF, "de");
  f.announce("root", Role::ROOT, "en");

  const auto* entry = f.controller.candidates().find("peer_1");
  ASSERT_NE(entry, nullptr);
  ASSERT_EQ(entry->role, Role::LEAF);
  ASSERT_EQ(entry->language, "de");
  ASSERT_EQ(f.controller.candidates().size(), 2u);
  ASSERT_EQ(f.controller.root_peer_id(), "root");
}

TEST(TOPOLOGY, own_packets_are_ignored) {
  TopologyFixture f;
  f.join(false);
  f.announce("self", Role::ROOT);
  ASSERT_EQ(f.controller.candidates().size(), 0u);
  ASSERT_FALSE(f.controller.root_peer_id());
}

TEST(TOPOLOGY, leaf_prefers_matching_branch_with_lowest_id) {
  TopologyFixture f;
  f.join(false);
  f.announce("root", Role::ROOT);
  f.announce("branch_2", Role::BRANCH, "en");
  f.announce("branch_1", Role::BRANCH, "en");
  f.announce("branch_0", Role::BRANCH, "fr");

  f.advance_ms(999);
  ASSERT_EQ(f.controller.phase(), LinkPhase::DISCOVERING);
  f.advance_ms(1);
  ASSERT_EQ(f.controller.phase(), LinkPhase::CONNECTING);
  ASSERT_EQ(f.controller.connection_target(), "branch_1");
  ASSERT_EQ(f.transport.count(PacketType::CONNECTION_REQ, "branch_1"), 1u);

  const auto& request = std::get<Protocol::ConnectionRequest>(
      f.transport.sent.back().packet.body);
  ASSERT_EQ(request.role, Role::LEAF);
  ASSERT_EQ(request.language, "en");
}

TEST(TOPOLOGY, leaf_attaches_to_branch_and_stays_leaf) {
  TopologyFixture f;
  f.attach_as_leaf("branch");

  ASSERT_EQ(f.controller.phase(), LinkPhase::ATTACHED);
  ASSERT_EQ(f.controller.self().parent_id, "branch");
  ASSERT_EQ(f.controller.self().role, Role::LEAF);
  ASSERT_FALSE(f.controller.heartbeat_active());
  ASSERT_EQ(f.transport.count(PacketType::ANNOUNCE), 0u);
}

TEST(TOPOLOGY, ack_from_root_promotes_to_branch) {
  TopologyFixture f;
  f.join(false);
  f.announce("root", Role::ROOT);
  f.advance_ms(1000);
  ASSERT_EQ(f.controller.connection_target(), "root");

  f.receive(Packet::connection_ack("root"));
  ASSERT_EQ(f.controller.phase(), LinkPhase::ATTACHED);
  ASSERT_EQ(f.controller.self().parent_id, "root");
  ASSERT_EQ(f.controller.self().role, Role::BRANCH);
  ASSERT_TRUE(f.controller.heartbeat_active());
  ASSERT_EQ(f.transport.count(PacketType::ANNOUNCE), 1u);

  f.advance_ms(2000);
  ASSERT_EQ(f.transport.count(PacketType::ANNOUNCE), 2u);
  ASSERT_EQ(f.notifications.back().role, Role::BRANCH);
}

TEST(TOPOLOGY, retries_until_acknowledged) {
  TopologyFixture f;
  f.join(false);
  f.announce("root", Role::ROOT);
  f.advance_ms(1000);
  f.advance_ms(3000);
  ASSERT_EQ(f.transport.count(PacketType::CONNECTION_REQ, "root"), 4u);
  ASSERT_EQ(f.controller.connection_attempts(), 4u);

  f.receive(Packet::connection_ack("root"));
  f.advance_ms(5000);
  ASSERT_EQ(f.transport.count(PacketType::CONNECTION_REQ, "root"), 4u);
}

TEST(TOPOLOGY, duplicate_ack_is_noop) {
  TopologyFixture f;
  f.attach_as_branch("root");
  size_t notifications = f.notifications.size();
  size_t sent = f.transport.sent.size();

  f.receive(Packet::connection_ack("root"));
  ASSERT_EQ(f.controller.self().parent_id, "root");
  ASSERT_EQ(f.controller.phase(), LinkPhase::ATTACHED);
  ASSERT_EQ(f.notifications.size(), notifications);
  ASSERT_EQ(f.transport.sent.size(), sent);
}

TEST(TOPOLOGY, stale_ack_is_ignored) {
  TopologyFixture f;
  f.join(false);
  f.receive(Packet::connection_ack("somebody"));
  ASSERT_FALSE(f.controller.self().parent_id);
  ASSERT_EQ(f.controller.phase(), LinkPhase::DISCOVERING);

  f.announce("root", Role::ROOT);
  f.advance_ms(1000);
  f.receive(Packet::connection_ack("somebody"));
  ASSERT_FALSE(f.controller.self().parent_id);
  ASSERT_EQ(f.controller.connection_target(), "root");
}

TEST(TOPOLOGY, retry_exhaustion_falls_back_to_discovery) {
  Topology::TopologyConfig config;
  config.max_connection_attempts = 3;
  TopologyFixture f(config);
  f.join(false);
  f.announce("branch", Role::BRANCH);

  f.advance_ms(1000);
  f.advance_ms(3000);
  ASSERT_EQ(f.transport.count(PacketType::CONNECTION_REQ, "branch"), 3u);
  ASSERT_EQ(f.controller.phase(), LinkPhase::DISCOVERING);
  ASSERT_NE(f.controller.candidates().find("branch"), nullptr);

  // Not retried before the backoff is over
  f.advance_ms(4000);
  ASSERT_EQ(f.transport.count(PacketType::CONNECTION_REQ), 3u);
  ASSERT_EQ(f.controller.phase(), LinkPhase::DISCOVERING);

  f.advance_ms(1000);
  ASSERT_EQ(f.transport.count(PacketType::CONNECTION_REQ, "branch"), 4u);
  ASSERT_EQ(f.controller.connection_target(), "branch");
  ASSERT_EQ(f.controller.connection_attempts(), 1u);
}

TEST(TOPOLOGY, unanswered_branch_is_not_replaced_by_root) {
  TopologyFixture f;
  f.join(false);
  f.announce("root", Role::ROOT);
  f.announce("branch", Role::BRANCH);

  f.advance_ms(30000);
  ASSERT_GT(f.transport.count(PacketType::CONNECTION_REQ, "branch"), 10u);
  ASSERT_EQ(f.transport.count(PacketType::CONNECTION_REQ, "root"), 0u);
  ASSERT_NE(f.controller.candidates().find("branch"), nullptr);
  ASSERT_EQ(f.controller.self().role, Role::LEAF);
  ASSERT_FALSE(f.controller.self().parent_id);
}

TEST(TOPOLOGY, departure_of_connection_target_restarts_discovery) {
  Topology::TopologyConfig config;
  config.max_connection_attempts = 0;
  TopologyFixture f(config);
  f.join(false);
  f.announce("branch", Role::BRANCH);
  f.advance_ms(1000);
  ASSERT_EQ(f.controller.connection_target(), "branch");

  f.controller.handle_peer_leave("branch");
  ASSERT_EQ(f.controller.phase(), LinkPhase::DISCOVERING);
  ASSERT_FALSE(f.controller.connection_target());

  f.announce("other_branch", Role::BRANCH);
  f.advance_ms(30000);
  ASSERT_EQ(f.transport.count(PacketType::CONNECTION_REQ, "branch"), 1u);
  ASSERT_EQ(f.controller.connection_target(), "other_branch");
  ASSERT_GT(f.transport.count(PacketType::CONNECTION_REQ, "other_branch"),
            0u);
}

TEST(TOPOLOGY, retry_exhaustion_against_root_is_bounded) {
  Topology::TopologyConfig config;
  config.max_connection_attempts = 2;
  TopologyFixture f(config);
  f.join(false);
  f.announce("root", Role::ROOT);

  uint32_t max_attempts = 0;
  advance(&f.clock, &f.loop, 20000, [&]() {
    max_attempts = std::max(max_attempts, f.controller.connection_attempts());
  });
  ASSERT_EQ(max_attempts, 2u);
  ASSERT_FALSE(f.controller.self().parent_id);
}

TEST(TOPOLOGY, relay_accepts_duplicate_requests_once) {
  TopologyFixture f;
  f.join(true);
  f.notifications.clear();

  f.receive(Packet::connection_request("child", Role::LEAF, "en"));
  f.receive(Packet::connection_request("child", Role::LEAF, "en"));

  ASSERT_EQ(f.controller.self().children_ids.size(), 1u);
  ASSERT_TRUE(f.controller.self().has_child("child"));
  ASSERT_EQ(f.transport.count(PacketType::CONNECTION_ACK, "child"), 2u);
  ASSERT_EQ(f.notifications.size(), 1u);
}

TEST(TOPOLOGY, leaf_ignores_connection_requests) {
  TopologyFixture f;
  f.attach_as_leaf("branch");
  f.receive(Packet::connection_request("other", Role::LEAF, "en"));

  ASSERT_TRUE(f.controller.self().children_ids.empty());
  ASSERT_EQ(f.transport.count(PacketType::CONNECTION_ACK), 0u);
}

TEST(TOPOLOGY, promoted_branch_accepts_requests) {
  TopologyFixture f;
  f.attach_as_branch("root");
  f.receive(Packet::connection_request("child", Role::LEAF, "en"));

  ASSERT_TRUE(f.controller.self().has_child("child"));
  ASSERT_EQ(f.transport.count(PacketType::CONNECTION_ACK, "child"), 1u);
}

TEST(TOPOLOGY, request_from_parent_is_rejected) {
  TopologyFixture f;
  f.attach_as_branch("root");
  f.receive(Packet::connection_request("root", Role::ROOT, "en"));

  ASSERT_TRUE(f.controller.self().children_ids.empty());
  ASSERT_EQ(f.transport.count(PacketType::CONNECTION_ACK), 0u);
}

TEST(TOPOLOGY, departure_of_child_keeps_parent) {
  TopologyFixture f;
  f.attach_as_branch("root");
  f.receive(Packet::connection_request("child", Role::LEAF, "en"));
  size_t notifications = f.notifications.size();

  f.controller.handle_peer_leave("child");
  ASSERT_TRUE(f.controller.self().children_ids.empty());
  ASSERT_EQ(f.controller.self().parent_id, "root");
  ASSERT_EQ(f.controller.phase(), LinkPhase::ATTACHED);
  ASSERT_EQ(f.notifications.size(), notifications + 1);
}

TEST(TOPOLOGY, departure_of_parent_restarts_discovery) {
  TopologyFixture f;
  f.attach_as_leaf("branch");
  f.announce("root", Role::ROOT);

  f.controller.handle_peer_leave("branch");
  ASSERT_FALSE(f.controller.self().parent_id);
  ASSERT_EQ(f.controller.phase(), LinkPhase::DISCOVERING);
  ASSERT_EQ(f.controller.candidates().find("branch"), nullptr);
  ASSERT_EQ(f.controller.root_peer_id(), "root");

  f.advance_ms(1000);
  ASSERT_EQ(f.controller.connection_target(), "root");
}

TEST(TOPOLOGY, departure_of_root_clears_root_pointer) {
  TopologyFixture f;
  f.attach_as_branch("root");
  f.announce("other_branch", Role::BRANCH, "en");
  f.transport.sent.clear();

  f.controller.handle_peer_leave("root");
  ASSERT_FALSE(f.controller.root_peer_id());
  ASSERT_FALSE(f.controller.self().parent_id);
  ASSERT_EQ(f.controller.self().role, Role::BRANCH);

  // A BRANCH only reattaches to a root
  f.advance_ms(5000);
  ASSERT_EQ(f.controller.phase(), LinkPhase::DISCOVERING);
  ASSERT_EQ(f.transport.count(PacketType::CONNECTION_REQ), 0u);

  f.announce("new_root", Role::ROOT);
  f.advance_ms(1000);
  ASSERT_EQ(f.controller.connection_target(), "new_root");
}

TEST(TOPOLOGY, departure_of_unknown_peer_changes_nothing) {
  TopologyFixture f;
  f.attach_as_branch("root");
  size_t notifications = f.notifications.size();
  f.controller.handle_peer_leave("stranger");
  ASSERT_EQ(f.notifications.size(), notifications);
  ASSERT_EQ(f.controller.self().parent_id, "root");
}

TEST(TOPOLOGY, peer_join_triggers_announcement_of_relays) {
  TopologyFixture leaf;
  leaf.join(false);
  leaf.controller.handle_peer_join("newcomer");
  ASSERT_EQ(leaf.transport.count(PacketType::ANNOUNCE), 0u);

  TopologyFixture root;
  root.join(true);
  root.controller.handle_peer_join("newcomer");
  ASSERT_EQ(root.transport.count(PacketType::ANNOUNCE), 2u);
}

TEST(TOPOLOGY, send_failures_are_not_fatal) {
  TopologyFixture f;
  f.transport.fail_sends = true;
  f.join(false);
  f.announce("root", Role::ROOT);
  f.advance_ms(3000);
  ASSERT_EQ(f.controller.phase(), LinkPhase::CONNECTING);
  ASSERT_EQ(f.transport.count(PacketType::CONNECTION_REQ), 3u);

  f.transport.fail_sends = false;
  f.receive(Packet::connection_ack("root"));
  ASSERT_EQ(f.controller.self().parent_id, "root");
}

TEST(TOPOLOGY, mic_lock_notifies_on_change) {
  TopologyFixture f;
  f.join(false);
  f.notifications.clear();
  f.controller.set_mic_locked(true);
  f.controller.set_mic_locked(true);
  ASSERT_EQ(f.notifications.size(), 1u);
  ASSERT_TRUE(f.notifications.back().mic_locked);
}

TEST(TOPOLOGY, leave_stops_all_timers) {
  TopologyFixture f;
  f.join(true);
  f.controller.leave();
  ASSERT_EQ(f.controller.phase(), LinkPhase::IDLE);
  ASSERT_FALSE(f.controller.heartbeat_active());
  ASSERT_EQ(f.loop.active_timers(), 0u);

  size_t sent = f.transport.sent.size();
  f.advance_ms(5000);
  ASSERT_EQ(f.transport.sent.size(), sent);

  // Packets after leaving are ignored
  f.receive(Packet::connection_request("child", Role::LEAF, "en"));
  ASSERT_EQ(f.transport.sent.size(), sent);
}

TEST(TOPOLOGY, rejoin_resets_state) {
  TopologyFixture f;
  f.attach_as_branch("root");
  f.receive(Packet::connection_request("child", Role::LEAF, "en"));

  f.join(false, "de");
  ASSERT_EQ(f.controller.self().role, Role::LEAF);
  ASSERT_EQ(f.controller.self().language, "de");
  ASSERT_FALSE(f.controller.self().parent_id);
  ASSERT_TRUE(f.controller.self().children_ids.empty());
  ASSERT_EQ(f.controller.candidates().size(), 0u);
  ASSERT_FALSE(f.controller.heartbeat_active());
  ASSERT_EQ(f.loop.active_timers(), 1u);
}

}  // namespace uRelay::Test
