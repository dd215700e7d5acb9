#pragma once

#include <cstdint>
#include <memory>
#include <queue>
#include <string>
#include <utility>
#include <vector>

#include "remote/stream_frame_framer.hpp"

namespace uRelay::Remote {

class TCPTransport;

enum struct ConnectionRole : uint8_t { SERVER = 0, CLIENT = 1 };

class TCPConnection {
 public:
  TCPConnection(uint32_t local_id, int32_t socket_id, std::string remote_addr,
                uint16_t remote_port, ConnectionRole connection_role)
      : local_id(local_id),
        sock(socket_id),
        partner_ip(std::move(remote_addr)),
        partner_port(remote_port),
        connection_role(connection_role) {}

 private:
  uint32_t local_id;
  int sock = 0;

  StreamFrameFramer framer;

  std::string partner_ip;
  uint16_t partner_port;
  ConnectionRole connection_role;

  // Set by the HELLO frame.
  std::string partner_node_id;
  std::string advertised_ip;
  uint16_t advertised_port = 0;

  // "ip:port" of outgoing connections, used to suppress duplicate dials.
  std::string dial_key;

  // Non-blocking connect still in progress.
  bool connecting = false;
  // This connection represents partner_node_id towards the listener.
  bool joined = false;
  bool closing = false;

  uint32_t last_read_contact = 0;
  uint32_t last_write_contact = 0;

  std::vector<char> rx_buffer = std::vector<char>(4096);

  std::queue<std::shared_ptr<std::vector<char>>> write_buffer;
  size_t write_offset = 0;

  friend uRelay::Remote::TCPTransport;
};

}  //  namespace uRelay::Remote
