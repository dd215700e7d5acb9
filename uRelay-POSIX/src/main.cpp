#include <boost/program_options.hpp>
#include <cinttypes>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

#include "board_functions.hpp"
#include "protocol/packet.hpp"
#include "remote/tcp_transport.hpp"
#include "runtime/event_loop.hpp"
#include "session/meeting_session.hpp"
#include "support/logger.hpp"
#include "support/string_helper.hpp"

namespace {
volatile std::sig_atomic_t stop_requested = 0;
}  // namespace

boost::program_options::variables_map parse_arguments(int arg_count,
                                                      char** args) {
  boost::program_options::options_description desc("Options");
  // clang-format off
  desc.add_options()
  ("help", "produce this help message.")
  ("node-id", boost::program_options::value<std::string>(),
    "Set the node id (generated if omitted).")
  (
    "display-name", boost::program_options::value<std::string>(),
    "Name shown to the other participants."
  )
  (
    "language", boost::program_options::value<std::string>(),
    "Language code of this participant."
  )
  (
    "room", boost::program_options::value<std::string>(),
    "Meeting room to join."
  )
  (
    "root", boost::program_options::bool_switch(),
    "Join as the meeting root."
  )
  (
    "tcp-port",
    boost::program_options::value<uint16_t>(),
    "Set the port the TCP server will listen on."
  )
  (
    "tcp-listen-ip", boost::program_options::value<std::string>(),
    "Set the IP the TCP server will listen on."
  )
  (
    "tcp-external-address", boost::program_options::value<std::string>(),
    "Provide a hint on the external address this node can be reached at."
  )
  (
    "tcp-external-port", boost::program_options::value<uint16_t>(),
    "Provide a hint on the external port this node can be reached at."
  )
  (
    "tcp-static-peer", boost::program_options::value<std::string>(),
    "Comma-separated list of ip:port peers to connect to."
  )
  (
    "discovery-interval", boost::program_options::value<uint32_t>(),
    "Parent discovery interval (ms)."
  )
  (
    "heartbeat-interval", boost::program_options::value<uint32_t>(),
    "Announcement interval of ROOT and BRANCH nodes (ms)."
  )
  (
    "retry-interval", boost::program_options::value<uint32_t>(),
    "Connection request retry interval (ms)."
  )
  (
    "max-connection-attempts", boost::program_options::value<uint32_t>(),
    "Connection requests per target before rediscovering (0: unbounded)."
  )
  (
    "connection-backoff", boost::program_options::value<uint32_t>(),
    "Wait before retrying a target that did not answer (ms)."
  )
  (
    "transcript-limit", boost::program_options::value<size_t>(),
    "Number of transcript entries kept."
  )
  (
    "speak", boost::program_options::value<std::string>(),
    "Periodically send this text as a translation."
  )
  (
    "speak-interval", boost::program_options::value<uint32_t>(),
    "Interval for --speak (ms)."
  ); // NOLINT
  // clang-format on

  boost::program_options::variables_map arguments;
  boost::program_options::store(
      boost::program_options::parse_command_line(arg_count, args, desc),
      arguments);
  boost::program_options::notify(arguments);

  if (arguments.count("help") != 0u) {
    std::cout << desc << "\n";
    exit(1);
  } else {
    return arguments;
  }
}

int main(int arg_count, char** args) {
  boost::program_options::variables_map arguments;
  try {
    arguments = parse_arguments(arg_count, args);
  } catch (const boost::program_options::error& error) {
    std::cerr << error.what() << "\n";
    return 1;
  }

  uint16_t tcp_port = 1337;
  if (arguments.count("tcp-port") != 0u) {
    tcp_port = arguments["tcp-port"].as<uint16_t>();
  }

  std::string listen_ip = "0.0.0.0";
  if (arguments.count("tcp-listen-ip") != 0u) {
    listen_ip = arguments["tcp-listen-ip"].as<std::string>();
  }

  std::string external_address{};
  if (arguments.count("tcp-external-address") != 0u) {
    external_address = arguments["tcp-external-address"].as<std::string>();
  }

  uint16_t external_port = 0;
  if (arguments.count("tcp-external-port") != 0u) {
    external_port = arguments["tcp-external-port"].as<uint16_t>();
  }

  auto tcp_args = uRelay::Remote::TCPAddressArguments(
      listen_ip, tcp_port, external_address, external_port);

  if (arguments.count("node-id") != 0u) {
    tcp_args.node_id = arguments["node-id"].as<std::string>();
  }

  if (arguments.count("tcp-static-peer") != 0u) {
    auto raw_static_peers = arguments["tcp-static-peer"].as<std::string>();
    for (std::string_view raw_static_peer :
         uRelay::Support::StringHelper::string_split(raw_static_peers)) {
      auto peer =
          uRelay::Support::StringHelper::split_host_port(raw_static_peer);
      if (!peer) {
        uRelay::Support::Logger::error(
            "MAIN", "Invalid static peer \"%.*s\", expected ip:port",
            static_cast<int>(raw_static_peer.size()), raw_static_peer.data());
        return 1;
      }
      tcp_args.static_peers.push_back(std::move(*peer));
    }
  }

  uRelay::Session::SessionConfig config;
  if (arguments.count("discovery-interval") != 0u) {
    config.topology.discovery_interval_ms =
        arguments["discovery-interval"].as<uint32_t>();
  }
  if (arguments.count("heartbeat-interval") != 0u) {
    config.topology.heartbeat_interval_ms =
        arguments["heartbeat-interval"].as<uint32_t>();
  }
  if (arguments.count("retry-interval") != 0u) {
    config.topology.connection_retry_interval_ms =
        arguments["retry-interval"].as<uint32_t>();
  }
  if (arguments.count("max-connection-attempts") != 0u) {
    config.topology.max_connection_attempts =
        arguments["max-connection-attempts"].as<uint32_t>();
  }
  if (arguments.count("connection-backoff") != 0u) {
    config.topology.connection_backoff_ms =
        arguments["connection-backoff"].as<uint32_t>();
  }
  if (arguments.count("transcript-limit") != 0u) {
    config.transcript_limit = arguments["transcript-limit"].as<size_t>();
  }

  std::string room = "default";
  if (arguments.count("room") != 0u) {
    room = arguments["room"].as<std::string>();
  }
  std::string language = "en";
  if (arguments.count("language") != 0u) {
    language = arguments["language"].as<std::string>();
  }
  std::string display_name = "Participant";
  if (arguments.count("display-name") != 0u) {
    display_name = arguments["display-name"].as<std::string>();
  }
  bool is_root = arguments["root"].as<bool>();

  uRelay::Runtime::EventLoop loop;
  uRelay::Remote::TCPTransport transport(std::move(tcp_args));
  uRelay::Session::MeetingSession session(&transport, &loop, config);

  session.on_self_state_changed([](const uRelay::Topology::PeerRecord& self) {
    uRelay::Support::Logger::info("MAIN", "Tree: %s",
                                  self.to_string().c_str());
  });
  session.on_status_changed([](uRelay::Session::ConnectionStatus status) {
    uRelay::Support::Logger::info(
        "MAIN", "Status: %s",
        uRelay::Session::connection_status_name(status).data());
  });
  session.on_raw_peer_join([](std::string_view peer_id) {
    uRelay::Support::Logger::info("MAIN", "Peer connected: %.*s",
                                  static_cast<int>(peer_id.size()),
                                  peer_id.data());
  });
  session.on_raw_peer_leave([](std::string_view peer_id) {
    uRelay::Support::Logger::info("MAIN", "Peer disconnected: %.*s",
                                  static_cast<int>(peer_id.size()),
                                  peer_id.data());
  });
  session.on_transcript([](const uRelay::Session::TranscriptItem& item) {
    uRelay::Support::Logger::info(
        "MAIN", "#%" PRIu64 " %s (%s, %s): %s", item.sequence,
        item.speaker_label.c_str(), item.sender_id.c_str(),
        item.emotion.c_str(), item.text.c_str());
  });

  std::string self_id = session.join(room, display_name, language, is_root);
  uRelay::Support::Logger::info("MAIN", "Starting uRelay. Node ID: %s",
                                self_id.c_str());

  uRelay::Runtime::TimerHandle speak_timer;
  if (arguments.count("speak") != 0u) {
    uint32_t speak_interval = 5000;
    if (arguments.count("speak-interval") != 0u) {
      speak_interval = arguments["speak-interval"].as<uint32_t>();
    }
    std::string text = arguments["speak"].as<std::string>();
    speak_timer = uRelay::Runtime::schedule(
        &loop, speak_interval, [&session, text, display_name, language]() {
          uRelay::Protocol::TranslationPayload payload;
          payload.text = text;
          payload.speaker_label = display_name;
          payload.target_language = language;
          session.broadcast_translation(std::move(payload));
        });
  }

  std::signal(SIGINT, [](int) { stop_requested = 1; });
  std::signal(SIGTERM, [](int) { stop_requested = 1; });
  auto stop_timer = uRelay::Runtime::schedule(&loop, 200, [&loop]() {
    if (stop_requested != 0) {
      loop.stop();
    }
  });

  loop.run(&transport);

  uRelay::Support::Logger::info("MAIN", "Shutting down");
  speak_timer.reset();
  stop_timer.reset();
  session.leave();
  return 0;
}
