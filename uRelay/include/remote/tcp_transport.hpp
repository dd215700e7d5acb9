#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "remote/frame_codec.hpp"
#include "remote/tcp_connection.hpp"
#include "remote/transport_api.hpp"
#include "runtime/event_loop.hpp"

namespace uRelay::Remote {

struct TCPAddressArguments {
  TCPAddressArguments(std::string listen_ip, uint16_t port,
                      std::string external_address, uint16_t external_port)
      : listen_ip(std::move(listen_ip)),
        port(port),
        external_address_hint(std::move(external_address)),
        external_port_hint(external_port) {}

  std::string listen_ip;
  uint16_t port;

  std::string external_address_hint;
  uint16_t external_port_hint;

  // Generated if empty.
  std::string node_id;
  std::vector<std::pair<std::string, uint16_t>> static_peers;

  uint32_t keepalive_interval_s = 10;
  uint32_t read_timeout_s = 120;
  uint32_t static_peer_retry_s = 30;
};

// Full mesh of TCP connections between the members of one room. Every
// connection starts with a HELLO, a completed HELLO is a peer join and the
// loss of that connection a peer leave. Single threaded, the event loop
// drives poll().
class TCPTransport : public TransportAPI, public Runtime::PollAPI {
 public:
  explicit TCPTransport(TCPAddressArguments address_arguments);
  ~TCPTransport() override;

  TCPTransport(const TCPTransport&) = delete;
  TCPTransport& operator=(const TCPTransport&) = delete;

  std::string join(std::string_view room_id,
                   TransportListener* listener) override;
  void leave() override;
  bool send(const Protocol::Packet& packet,
            std::optional<std::string_view> target) override;

  void poll(uint32_t max_wait_ms) override;

  [[nodiscard]] std::vector<std::string> connected_peers() const;
  [[nodiscard]] const std::string& node_id() const { return self_id; }
  // The bound port, resolved after join() when listening on port 0.
  [[nodiscard]] uint16_t listen_port() const {
    return _address_arguments.port;
  }

 private:
  TCPAddressArguments _address_arguments;
  std::string self_id;
  std::string room;
  TransportListener* listener = nullptr;

  int listen_sock = -1;
  bool polling = false;

  uint32_t next_local_id = 0;
  std::map<uint32_t, TCPConnection> remotes;
  std::map<std::string, uint32_t, std::less<>> peers_by_id;
  std::set<std::string> pending_dials;
  std::vector<std::pair<std::string, uint16_t>> dial_queue;
  uint32_t last_static_dial = 0;

  bool open_listen_socket();
  void dial_static_peers();

  void create_tcp_client(const std::string& peer_ip, uint16_t port);
  void listen_handler();
  bool data_handler(TCPConnection* remote);
  bool write_handler(TCPConnection* remote);
  bool finish_connect(TCPConnection* remote);

  TCPConnection* add_remote_connection(int socket_id, std::string remote_addr,
                                       uint16_t remote_port,
                                       ConnectionRole role, bool connecting);

  void handle_frame(TCPConnection* remote, Frame&& frame);
  void handle_hello(TCPConnection* remote, Hello&& hello);
  void handle_peer_list(TCPConnection* remote, const PeerList& peer_list);
  void handle_packet(TCPConnection* remote, Protocol::Packet&& packet);

  bool write(TCPConnection* remote, std::shared_ptr<std::vector<char>> dataset);
  void keepalive();
  void close_connection(TCPConnection* remote);
  void reap();

  Hello local_hello() const;
  PeerList peer_list_for(std::string_view recipient) const;

  static void set_socket_options(int socket_id);
  static std::string generate_node_id();
};

}  // namespace uRelay::Remote
