#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "protocol/packet.hpp"
#include "remote/tcp_transport.hpp"

namespace uRelay::Test {

using Remote::TCPAddressArguments;
using Remote::TCPTransport;

struct RecordingListener : public Remote::TransportListener {
  void on_peer_join(std::string_view peer_id) override {
    joined.emplace_back(peer_id);
  }
  void on_peer_leave(std::string_view peer_id) override {
    left.emplace_back(peer_id);
  }
  void on_packet(Protocol::Packet&& packet, std::string_view sender) override {
    senders.emplace_back(sender);
    packets.push_back(std::move(packet));
  }

  std::vector<std::string> joined;
  std::vector<std::string> left;
  std::vector<std::string> senders;
  std::vector<Protocol::Packet> packets;
};

TCPAddressArguments local_arguments(std::string node_id) {
  TCPAddressArguments arguments("127.0.0.1", 0, "", 0);
  arguments.node_id = std::move(node_id);
  return arguments;
}

template <typename Condition>
bool poll_until(TCPTransport* a, TCPTransport* b, Condition&& condition) {
  for (int i = 0; i < 500 && !condition(); i++) {
    a->poll(5);
    b->poll(5);
  }
  return condition();
}

TEST(TCPTRANSPORT, static_peer_connection) {
  RecordingListener listener_a;
  RecordingListener listener_b;
  TCPTransport a(local_arguments("node-a"));
  ASSERT_EQ(a.join("room", &listener_a), "node-a");
  ASSERT_NE(a.listen_port(), 0);

  auto arguments_b = local_arguments("node-b");
  arguments_b.static_peers.emplace_back("127.0.0.1", a.listen_port());
  TCPTransport b(std::move(arguments_b));
  ASSERT_EQ(b.join("room", &listener_b), "node-b");

  ASSERT_TRUE(poll_until(&a, &b, [&]() {
    return !listener_a.joined.empty() && !listener_b.joined.empty();
  }));
  ASSERT_EQ(listener_a.joined, std::vector<std::string>{"node-b"});
  ASSERT_EQ(listener_b.joined, std::vector<std::string>{"node-a"});
  ASSERT_EQ(a.connected_peers(), std::vector<std::string>{"node-b"});

  ASSERT_TRUE(b.send(Protocol::Packet::announce("node-b", Protocol::Role::ROOT,
                                                "en"),
                     std::string_view("node-a")));
  ASSERT_TRUE(a.send(Protocol::Packet::connection_ack("node-a"), std::nullopt));
  ASSERT_FALSE(a.send(Protocol::Packet::connection_ack("node-a"),
                      std::string_view("node-c")));

  ASSERT_TRUE(poll_until(&a, &b, [&]() {
    return !listener_a.packets.empty() && !listener_b.packets.empty();
  }));
  ASSERT_EQ(listener_a.senders, std::vector<std::string>{"node-b"});
  ASSERT_EQ(listener_a.packets[0].type(), Protocol::PacketType::ANNOUNCE);
  ASSERT_EQ(listener_b.packets[0].type(),
            Protocol::PacketType::CONNECTION_ACK);

  b.leave();
  ASSERT_TRUE(poll_until(&a, &b, [&]() { return !listener_a.left.empty(); }));
  ASSERT_EQ(listener_a.left, std::vector<std::string>{"node-b"});
  ASSERT_TRUE(a.connected_peers().empty());
  ASSERT_TRUE(listener_b.left.empty());
}

TEST(TCPTRANSPORT, other_room_is_rejected) {
  RecordingListener listener_a;
  RecordingListener listener_b;
  TCPTransport a(local_arguments("node-a"));
  a.join("room", &listener_a);

  auto arguments_b = local_arguments("node-b");
  arguments_b.static_peers.emplace_back("127.0.0.1", a.listen_port());
  TCPTransport b(std::move(arguments_b));
  b.join("other", &listener_b);

  poll_until(&a, &b, []() { return false; });
  ASSERT_TRUE(listener_a.joined.empty());
  ASSERT_TRUE(listener_b.joined.empty());
}

TEST(TCPTRANSPORT, send_before_join_fails) {
  TCPTransport a(local_arguments("node-a"));
  ASSERT_FALSE(a.send(Protocol::Packet::connection_ack("node-a"), std::nullopt));
}

TEST(TCPTRANSPORT, generated_node_id) {
  TCPTransport a(TCPAddressArguments("127.0.0.1", 0, "", 0));
  ASSERT_EQ(a.node_id().rfind("node-", 0), 0u);
  ASSERT_EQ(a.node_id().size(), 13u);
}

}  // namespace uRelay::Test
