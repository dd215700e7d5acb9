#include "remote/tcp_transport.hpp"

extern "C" {
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
}

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "board_functions.hpp"
#include "support/logger.hpp"

namespace uRelay::Remote {

using uRelay::Support::Logger;

TCPTransport::TCPTransport(TCPAddressArguments address_arguments)
    : _address_arguments(std::move(address_arguments)),
      self_id(_address_arguments.node_id.empty()
                  ? generate_node_id()
                  : _address_arguments.node_id) {}

TCPTransport::~TCPTransport() {
  listener = nullptr;
  for (auto& remote_pair : remotes) {
    shutdown(remote_pair.second.sock, SHUT_RDWR);
    close(remote_pair.second.sock);
  }
  if (listen_sock >= 0) {
    close(listen_sock);
  }
}

std::string TCPTransport::join(std::string_view room_id,
                               TransportListener* listener) {
  if (!room.empty()) {
    leave();
  }
  room = std::string(room_id);
  this->listener = listener;

  if (!open_listen_socket()) {
    Logger::warning("TCP-TRANSPORT",
                    "Not accepting connections, outgoing connections only");
  }
  dial_static_peers();
  Logger::info("TCP-TRANSPORT", "Joined room %s as %s", room.c_str(),
               self_id.c_str());
  return self_id;
}

void TCPTransport::leave() {
  if (room.empty()) {
    return;
  }
  Logger::info("TCP-TRANSPORT", "Leaving room %s", room.c_str());
  listener = nullptr;
  for (auto& remote_pair : remotes) {
    close_connection(&remote_pair.second);
  }
  if (listen_sock >= 0) {
    close(listen_sock);
    listen_sock = -1;
  }
  room.clear();
  dial_queue.clear();
  if (!polling) {
    reap();
  }
}

bool TCPTransport::send(const Protocol::Packet& packet,
                        std::optional<std::string_view> target) {
  if (room.empty()) {
    return false;
  }
  auto dataset = FrameCodec::encode(packet);
  if (!dataset) {
    return false;
  }

  if (target) {
    auto peer_it = peers_by_id.find(*target);
    if (peer_it == peers_by_id.end()) {
      Logger::debug("TCP-TRANSPORT", "Unknown peer %.*s",
                    static_cast<int>(target->size()), target->data());
      return false;
    }
    auto remote_it = remotes.find(peer_it->second);
    if (remote_it == remotes.end()) {
      return false;
    }
    return write(&remote_it->second, std::move(dataset));
  }

  bool success = true;
  for (const auto& peer : peers_by_id) {
    auto remote_it = remotes.find(peer.second);
    if (remote_it != remotes.end() && !write(&remote_it->second, dataset)) {
      success = false;
    }
  }
  return success;
}

void TCPTransport::poll(uint32_t max_wait_ms) {
  fd_set read_sockets;
  fd_set write_sockets;
  fd_set error_sockets;
  FD_ZERO(&read_sockets);
  FD_ZERO(&write_sockets);
  FD_ZERO(&error_sockets);

  int max_val = -1;
  if (listen_sock >= 0) {
    FD_SET(listen_sock, &read_sockets);
    FD_SET(listen_sock, &error_sockets);
    max_val = listen_sock;
  }
  for (const auto& remote_pair : remotes) {
    const TCPConnection& remote = remote_pair.second;
    if (remote.closing) {
      continue;
    }
    if (!remote.connecting) {
      FD_SET(remote.sock, &read_sockets);
    }
    if (remote.connecting || !remote.write_buffer.empty()) {
      FD_SET(remote.sock, &write_sockets);
    }
    FD_SET(remote.sock, &error_sockets);
    max_val = std::max(max_val, remote.sock);
  }

  int num_ready = 0;
  if (max_val < 0) {
    if (max_wait_ms > 0) {
      BoardFunctions::sleep(max_wait_ms);
    }
  } else {
    timeval timeout{};
    timeout.tv_sec = max_wait_ms / 1000;
    timeout.tv_usec = (max_wait_ms % 1000) * 1000;
    num_ready = select(max_val + 1, &read_sockets, &write_sockets,
                       &error_sockets, &timeout);
    if (num_ready < 0 && errno != EINTR) {
      Logger::error("TCP-TRANSPORT", "Event Loop: select error - %d", errno);
    }
  }

  polling = true;
  if (num_ready > 0) {
    for (auto& remote_pair : remotes) {
      TCPConnection& remote = remote_pair.second;
      if (remote.closing) {
        continue;
      }
      if (FD_ISSET(remote.sock, &error_sockets)) {
        Logger::debug("TCP-TRANSPORT", "Event Loop: Error");
        close_connection(&remote);
        continue;
      }
      if (remote.connecting) {
        if (FD_ISSET(remote.sock, &write_sockets) &&
            !finish_connect(&remote)) {
          close_connection(&remote);
        }
        continue;
      }
      if (FD_ISSET(remote.sock, &read_sockets)) {
        Logger::trace("TCP-TRANSPORT", "Event Loop: Read");
        if (data_handler(&remote)) {
          Logger::info(
              "TCP-TRANSPORT",
              "Read error/zero length message. Closing connection - %s:%d",
              remote.partner_ip.c_str(), remote.partner_port);
          close_connection(&remote);
          continue;
        }
      }
      if (!remote.closing && FD_ISSET(remote.sock, &write_sockets)) {
        Logger::trace("TCP-TRANSPORT", "Event Loop: Write");
        if (write_handler(&remote)) {
          Logger::info("TCP-TRANSPORT",
                       "Event Loop: Closing connection - %s:%d",
                       remote.partner_ip.c_str(), remote.partner_port);
          close_connection(&remote);
        }
      }
    }
    if (listen_sock >= 0 && FD_ISSET(listen_sock, &read_sockets)) {
      listen_handler();
    }
  }
  polling = false;

  auto dials = std::move(dial_queue);
  dial_queue.clear();
  for (const auto& [ip, port] : dials) {
    create_tcp_client(ip, port);
  }

  if (!room.empty()) {
    keepalive();
    if (peers_by_id.empty() && !_address_arguments.static_peers.empty() &&
        BoardFunctions::seconds_timestamp() - last_static_dial >=
            _address_arguments.static_peer_retry_s) {
      dial_static_peers();
    }
  }
  reap();
}

std::vector<std::string> TCPTransport::connected_peers() const {
  std::vector<std::string> peers;
  peers.reserve(peers_by_id.size());
  for (const auto& peer : peers_by_id) {
    peers.push_back(peer.first);
  }
  return peers;
}

bool TCPTransport::open_listen_socket() {
  // NOLINTNEXTLINE (cppcoreguidelines-pro-type-member-init, hicpp-member-init)
  sockaddr_in dest_addr;
  std::memset(&dest_addr, 0, sizeof(dest_addr));
  if (inet_pton(AF_INET, _address_arguments.listen_ip.c_str(),
                &dest_addr.sin_addr) != 1) {
    Logger::error("TCP-TRANSPORT", "Invalid listen address %s",
                  _address_arguments.listen_ip.c_str());
    return false;
  }
  dest_addr.sin_family = AF_INET;
  dest_addr.sin_port = htons(_address_arguments.port);

  listen_sock = socket(AF_INET, SOCK_STREAM, IPPROTO_IP);
  if (listen_sock < 0) {
    Logger::warning("TCP-TRANSPORT",
                    "Unable to create server socket - error %d", errno);
    listen_sock = -1;
    return false;
  }

  int reuse = 1;
  setsockopt(listen_sock, SOL_SOCKET, SO_REUSEADDR, static_cast<void*>(&reuse),
             sizeof(reuse));

  if (bind(listen_sock, reinterpret_cast<sockaddr*>(&dest_addr),
           sizeof(dest_addr)) != 0) {
    Logger::error("TCP-TRANSPORT", "Server socket unable to bind - error %d",
                  errno);
    close(listen_sock);
    listen_sock = -1;
    return false;
  }

  socklen_t addr_len = sizeof(dest_addr);
  if (getsockname(listen_sock, reinterpret_cast<sockaddr*>(&dest_addr),
                  &addr_len) == 0) {
    _address_arguments.port = ntohs(dest_addr.sin_port);
  }

  if (listen(listen_sock, 8) != 0) {
    Logger::error("TCP-TRANSPORT", "Server socket listen error - %d", errno);
    close(listen_sock);
    listen_sock = -1;
    return false;
  }

  Logger::info("TCP-TRANSPORT", "Server socket bound: %s:%d",
               _address_arguments.listen_ip.c_str(), _address_arguments.port);

  if (_address_arguments.external_port_hint > 0 ||
      !_address_arguments.external_address_hint.empty()) {
    Hello hello = local_hello();
    Logger::info("TCP-TRANSPORT",
                 "TCP Server socket externally reachable at: %s:%d",
                 hello.address.c_str(), hello.port);
  }
  return true;
}

void TCPTransport::dial_static_peers() {
  last_static_dial = BoardFunctions::seconds_timestamp();
  for (const auto& [ip, port] : _address_arguments.static_peers) {
    create_tcp_client(ip, port);
  }
}

void TCPTransport::create_tcp_client(const std::string& peer_ip,
                                     uint16_t port) {
  std::string dial_key = peer_ip + ":" + std::to_string(port);
  if (pending_dials.find(dial_key) != pending_dials.end()) {
    return;
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init, hicpp-member-init)
  sockaddr_in dest_addr;
  std::memset(&dest_addr, 0, sizeof(dest_addr));
  if (inet_pton(AF_INET, peer_ip.c_str(), &dest_addr.sin_addr) != 1) {
    Logger::warning("TCP-TRANSPORT", "Invalid peer address %s",
                    peer_ip.c_str());
    return;
  }
  dest_addr.sin_family = AF_INET;
  dest_addr.sin_port = htons(port);

  int sock_id = socket(AF_INET, SOCK_STREAM, IPPROTO_IP);
  if (sock_id < 0) {
    Logger::error("TCP-TRANSPORT", "Client socket create error - %d", errno);
    return;
  }
  fcntl(sock_id, F_SETFL, fcntl(sock_id, F_GETFL, 0) | O_NONBLOCK);

  bool in_progress = false;
  if (connect(sock_id, reinterpret_cast<sockaddr*>(&dest_addr),
              sizeof(dest_addr)) != 0) {
    if (errno != EINPROGRESS) {
      Logger::error("TCP-TRANSPORT",
                    "Client socket connect error - %s:%d - %d",
                    peer_ip.c_str(), port, errno);
      close(sock_id);
      return;
    }
    in_progress = true;
  } else {
    Logger::info("TCP-TRANSPORT", "Client socket connected - %s:%d",
                 peer_ip.c_str(), port);
  }

  set_socket_options(sock_id);
  if (TCPConnection* remote = add_remote_connection(
          sock_id, peer_ip, port, ConnectionRole::CLIENT, in_progress)) {
    remote->dial_key = dial_key;
    pending_dials.insert(std::move(dial_key));
  }
}

bool TCPTransport::finish_connect(TCPConnection* remote) {
  int error = 0;
  socklen_t error_len = sizeof(error);
  if (getsockopt(remote->sock, SOL_SOCKET, SO_ERROR, &error, &error_len) !=
          0 ||
      error != 0) {
    Logger::info("TCP-TRANSPORT", "Client socket connect error - %s:%d - %d",
                 remote->partner_ip.c_str(), remote->partner_port, error);
    return false;
  }
  remote->connecting = false;
  Logger::info("TCP-TRANSPORT", "Client socket connected - %s:%d",
               remote->partner_ip.c_str(), remote->partner_port);
  return !write_handler(remote);
}

void TCPTransport::listen_handler() {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init, hicpp-member-init)
  struct sockaddr_in6 source_addr;
  socklen_t addr_len = sizeof(source_addr);
  int sock_id =
      accept(listen_sock, reinterpret_cast<sockaddr*>(&source_addr), &addr_len);

  if (sock_id < 0) {
    Logger::error("TCP-TRANSPORT",
                  "Server unable to accept connection - error %d", errno);
    return;
  }

  char addr_string[INET6_ADDRSTRLEN] = {0};
  uint16_t remote_port = 0;
  if (source_addr.sin6_family == PF_INET) {
    auto* addr = reinterpret_cast<sockaddr_in*>(&source_addr);
    inet_ntop(addr->sin_family, &addr->sin_addr, addr_string, INET_ADDRSTRLEN);
    remote_port = ntohs(addr->sin_port);
  } else if (source_addr.sin6_family == PF_INET6) {
    inet_ntop(source_addr.sin6_family, &source_addr.sin6_addr, addr_string,
              INET6_ADDRSTRLEN);
    remote_port = ntohs(source_addr.sin6_port);
  }
  Logger::info("TCP-TRANSPORT", "Connection accepted - %s:%d", addr_string,
               remote_port);

  set_socket_options(sock_id);
  add_remote_connection(sock_id, std::string(addr_string), remote_port,
                        ConnectionRole::SERVER, false);
}

bool TCPTransport::data_handler(TCPConnection* remote) {
  remote->last_read_contact = BoardFunctions::seconds_timestamp();
  ssize_t len =
      recv(remote->sock, remote->rx_buffer.data(), remote->rx_buffer.size(), 0);
  if (len < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return false;
    }
    Logger::error("TCP-TRANSPORT", "Error occurred during receive - %d", errno);
    return true;
  } else if (len == 0) {
    Logger::info("TCP-TRANSPORT", "Connection closed - %s:%d",
                 remote->partner_ip.c_str(), remote->partner_port);
    return true;
  }
  bool in_sync = remote->framer.process_data(
      static_cast<uint32_t>(len), remote->rx_buffer.data(),
      [this, remote](Frame&& frame, size_t /*encoded_length*/) {
        handle_frame(remote, std::move(frame));
      });
  return !in_sync;
}

bool TCPTransport::write_handler(TCPConnection* remote) {
#if defined(MSG_NOSIGNAL)  // POSIX
  int flag = MSG_NOSIGNAL | MSG_DONTWAIT;
#elif defined(SO_NOSIGPIPE)  // MacOS
  int flag = SO_NOSIGPIPE | MSG_DONTWAIT;
#endif
  while (!remote->write_buffer.empty()) {
    size_t remaining_size =
        remote->write_buffer.front()->size() - remote->write_offset;
    ssize_t written =
        ::send(remote->sock,
               remote->write_buffer.front()->data() + remote->write_offset,
               remaining_size, flag);
    if (written < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
      Logger::debug("TCP-TRANSPORT", "Write error");
      return true;
    } else if (written >= 0 && static_cast<size_t>(written) == remaining_size) {
      Logger::trace("TCP-TRANSPORT", "Write completed");
      remote->write_buffer.pop();
      remote->write_offset = 0;
    } else {
      Logger::trace("TCP-TRANSPORT", "Write progress");
      if (written > 0) {
        remote->write_offset += written;
      }
      break;
    }
    remote->last_write_contact = BoardFunctions::seconds_timestamp();
  }
  return false;
}

TCPConnection* TCPTransport::add_remote_connection(int socket_id,
                                                   std::string remote_addr,
                                                   uint16_t remote_port,
                                                   ConnectionRole role,
                                                   bool connecting) {
  uint32_t remote_id = next_local_id++;
  auto [remote_it, inserted] = remotes.try_emplace(
      remote_id, remote_id, socket_id, remote_addr, remote_port, role);
  if (!inserted) {
    Logger::warning("TCP-TRANSPORT",
                    "Remote connection not inserted, closing connection - "
                    "%s:%d!",
                    remote_addr.c_str(), remote_port);
    shutdown(socket_id, SHUT_RDWR);
    close(socket_id);
    return nullptr;
  }

  TCPConnection& remote = remote_it->second;
  remote.connecting = connecting;
  remote.last_read_contact = BoardFunctions::seconds_timestamp();
  remote.last_write_contact = remote.last_read_contact;
  write(&remote, FrameCodec::encode(local_hello()));
  Logger::trace("TCP-TRANSPORT", "Remote connection added");
  return &remote;
}

void TCPTransport::handle_frame(TCPConnection* remote, Frame&& frame) {
  if (remote->closing) {
    return;
  }
  if (auto* hello = std::get_if<Hello>(&frame)) {
    handle_hello(remote, std::move(*hello));
  } else if (auto* peer_list = std::get_if<PeerList>(&frame)) {
    handle_peer_list(remote, *peer_list);
  } else if (auto* packet = std::get_if<Protocol::Packet>(&frame)) {
    handle_packet(remote, std::move(*packet));
  }
}

void TCPTransport::handle_hello(TCPConnection* remote, Hello&& hello) {
  if (!remote->partner_node_id.empty()) {
    Logger::debug("TCP-TRANSPORT", "Repeated HELLO from %s",
                  remote->partner_node_id.c_str());
    return;
  }
  if (hello.room_id != room) {
    Logger::warning("TCP-TRANSPORT", "%s is in room %s, closing - %s:%d",
                    hello.node_id.c_str(), hello.room_id.c_str(),
                    remote->partner_ip.c_str(), remote->partner_port);
    close_connection(remote);
    return;
  }
  if (hello.node_id == self_id) {
    Logger::info("TCP-TRANSPORT", "Connected to self, closing - %s:%d",
                 remote->partner_ip.c_str(), remote->partner_port);
    close_connection(remote);
    return;
  }

  remote->partner_node_id = std::move(hello.node_id);
  remote->advertised_ip = hello.address.empty() || hello.address == "0.0.0.0"
                              ? remote->partner_ip
                              : std::move(hello.address);
  remote->advertised_port = hello.port;

  auto existing = peers_by_id.find(remote->partner_node_id);
  if (existing != peers_by_id.end()) {
    // Both ends keep the connection dialled by the lower node id.
    bool dialled_by_self = remote->connection_role == ConnectionRole::CLIENT;
    bool keep_new = dialled_by_self == (self_id < remote->partner_node_id);
    auto current_it = remotes.find(existing->second);
    if (keep_new && current_it != remotes.end()) {
      current_it->second.joined = false;
      close_connection(&current_it->second);
      remote->joined = true;
      existing->second = remote->local_id;
    } else if (!keep_new) {
      close_connection(remote);
    }
    Logger::debug("TCP-TRANSPORT", "Resolved duplicate connection to %s",
                  remote->partner_node_id.c_str());
    return;
  }

  peers_by_id.emplace(remote->partner_node_id, remote->local_id);
  remote->joined = true;
  Logger::info("TCP-TRANSPORT", "Peer joined: %s (%s:%d)",
               remote->partner_node_id.c_str(), remote->advertised_ip.c_str(),
               remote->advertised_port);

  write(remote, FrameCodec::encode(peer_list_for(remote->partner_node_id)));
  if (listener != nullptr) {
    listener->on_peer_join(remote->partner_node_id);
  }
}

void TCPTransport::handle_peer_list(TCPConnection* remote,
                                    const PeerList& peer_list) {
  if (!remote->joined) {
    return;
  }
  for (const auto& peer : peer_list.peers) {
    if (peer.node_id == self_id || peer.port == 0 ||
        peers_by_id.find(peer.node_id) != peers_by_id.end()) {
      continue;
    }
    Logger::debug("TCP-TRANSPORT", "Learned about %s (%s:%d) from %s",
                  peer.node_id.c_str(), peer.address.c_str(), peer.port,
                  remote->partner_node_id.c_str());
    dial_queue.emplace_back(peer.address, peer.port);
  }
}

void TCPTransport::handle_packet(TCPConnection* remote,
                                 Protocol::Packet&& packet) {
  if (!remote->joined) {
    Logger::debug("TCP-TRANSPORT", "Dropped packet before HELLO - %s:%d",
                  remote->partner_ip.c_str(), remote->partner_port);
    return;
  }
  if (listener != nullptr) {
    listener->on_packet(std::move(packet), remote->partner_node_id);
  }
}

bool TCPTransport::write(TCPConnection* remote,
                         std::shared_ptr<std::vector<char>> dataset) {
  if (remote->closing || !dataset) {
    return false;
  }
  remote->write_buffer.push(std::move(dataset));
  if (remote->connecting) {
    return true;
  }
  if (write_handler(remote)) {
    Logger::info("TCP-TRANSPORT",
                 "Publication write failed - shutdown connection - %s:%d",
                 remote->partner_ip.c_str(), remote->partner_port);
    close_connection(remote);
    return false;
  }
  return true;
}

void TCPTransport::keepalive() {
  auto buffer = std::make_shared<std::vector<char>>(4, 0);
  uint32_t now = BoardFunctions::seconds_timestamp();

  for (auto& remote_pair : remotes) {
    TCPConnection& remote = remote_pair.second;
    if (remote.closing || remote.connecting) {
      continue;
    }
    if (now - remote.last_read_contact > _address_arguments.read_timeout_s) {
      Logger::info("TCP-TRANSPORT", "Read check failed: %s - last contact: %u",
                   remote.partner_node_id.c_str(),
                   now - remote.last_read_contact);
      close_connection(&remote);
      continue;
    }
    if (now - remote.last_write_contact >
        _address_arguments.keepalive_interval_s) {
      if (write(&remote, buffer)) {
        Logger::trace("TCP-TRANSPORT", "Write check %s",
                      remote.partner_node_id.c_str());
        remote.last_write_contact = now;
      } else {
        Logger::info("TCP-TRANSPORT", "Write check failed");
      }
    }
  }
}

void TCPTransport::close_connection(TCPConnection* remote) {
  if (remote->closing) {
    return;
  }
  remote->closing = true;
  shutdown(remote->sock, SHUT_RDWR);
}

void TCPTransport::reap() {
  std::vector<uint32_t> to_delete;
  for (const auto& remote_pair : remotes) {
    if (remote_pair.second.closing) {
      to_delete.push_back(remote_pair.first);
    }
  }

  for (uint32_t remote_id : to_delete) {
    auto remote_it = remotes.find(remote_id);
    if (remote_it == remotes.end()) {
      continue;
    }
    TCPConnection& remote = remote_it->second;
    close(remote.sock);
    if (!remote.dial_key.empty()) {
      pending_dials.erase(remote.dial_key);
    }
    std::string departed;
    if (remote.joined) {
      peers_by_id.erase(remote.partner_node_id);
      departed = std::move(remote.partner_node_id);
    }
    remotes.erase(remote_it);

    if (!departed.empty()) {
      Logger::info("TCP-TRANSPORT", "Peer left: %s", departed.c_str());
      if (listener != nullptr) {
        listener->on_peer_leave(departed);
      }
    }
  }
}

Hello TCPTransport::local_hello() const {
  std::string address = _address_arguments.external_address_hint;
  if (address.empty() && _address_arguments.listen_ip != "0.0.0.0") {
    address = _address_arguments.listen_ip;
  }
  uint16_t port = _address_arguments.external_port_hint > 0
                      ? _address_arguments.external_port_hint
                      : _address_arguments.port;
  return Hello{self_id, room, std::move(address), port};
}

PeerList TCPTransport::peer_list_for(std::string_view recipient) const {
  PeerList peer_list;
  for (const auto& [peer_id, remote_id] : peers_by_id) {
    if (peer_id == recipient) {
      continue;
    }
    auto remote_it = remotes.find(remote_id);
    if (remote_it == remotes.end() || remote_it->second.advertised_port == 0) {
      continue;
    }
    peer_list.peers.push_back(PeerAddress{peer_id,
                                          remote_it->second.advertised_ip,
                                          remote_it->second.advertised_port});
  }
  return peer_list;
}

void TCPTransport::set_socket_options(int socket_id) {
  int nodelay = 1;
  setsockopt(socket_id, IPPROTO_TCP, TCP_NODELAY, static_cast<void*>(&nodelay),
             sizeof(nodelay));
}

std::string TCPTransport::generate_node_id() {
  std::random_device device;
  std::mt19937 generator(device());
  std::uniform_int_distribution<uint32_t> distribution;
  char buffer[16];
  snprintf(buffer, sizeof(buffer), "node-%08x", distribution(generator));
  return std::string(buffer);
}

}  // namespace uRelay::Remote
