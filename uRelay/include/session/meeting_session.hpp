#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "protocol/packet.hpp"
#include "remote/transport_api.hpp"
#include "routing/packet_router.hpp"
#include "runtime/timer_api.hpp"
#include "session/session_config.hpp"
#include "support/listener_list.hpp"
#include "topology/topology_controller.hpp"

namespace uRelay::Session {

enum class ConnectionStatus { IDLE, CONNECTING, CONNECTED };

std::string_view connection_status_name(ConnectionStatus status);

struct TranscriptItem {
  uint64_t sequence;
  std::string sender_id;
  std::string text;
  // Empty when the payload names no speaker.
  std::string speaker_label;
  std::string emotion;
  bool is_translation;
  // BoardFunctions::timestamp() at the time of arrival.
  uint32_t timestamp;
};

// Entry point for the audio and translation collaborators. Joins the room
// through the transport, feeds transport events into the topology controller
// and the packet router and keeps the state shown to the user.
class MeetingSession : public Remote::TransportListener {
 public:
  using PeerCallback = std::function<void(std::string_view)>;
  using StatusCallback = std::function<void(ConnectionStatus)>;
  using TranscriptCallback = std::function<void(const TranscriptItem&)>;

  MeetingSession(Remote::TransportAPI* transport, Runtime::TimerAPI* timers,
                 SessionConfig config = SessionConfig());
  ~MeetingSession() override;

  MeetingSession(const MeetingSession&) = delete;
  MeetingSession& operator=(const MeetingSession&) = delete;

  // Returns the id the transport assigned to the local peer.
  std::string join(std::string_view room_id, std::string display_name,
                   std::string language, bool is_root);
  void leave();

  size_t broadcast_audio(Protocol::AudioPayload payload);
  size_t broadcast_translation(Protocol::TranslationPayload payload);

  void set_mic_locked(bool locked);

  void on_peer_join(std::string_view peer_id) override;
  void on_peer_leave(std::string_view peer_id) override;
  void on_packet(Protocol::Packet&& packet, std::string_view sender) override;

  uint32_t on_audio_received(Routing::PacketRouter::AudioCallback callback) {
    return router.add_audio_listener(std::move(callback));
  }
  uint32_t on_translation_received(
      Routing::PacketRouter::TranslationCallback callback) {
    return router.add_translation_listener(std::move(callback));
  }
  uint32_t on_self_state_changed(
      Topology::TopologyController::SelfStateCallback callback) {
    return topology.add_self_state_listener(std::move(callback));
  }
  uint32_t on_raw_peer_join(PeerCallback callback) {
    return raw_peer_join_listeners.add(std::move(callback));
  }
  uint32_t on_raw_peer_leave(PeerCallback callback) {
    return raw_peer_leave_listeners.add(std::move(callback));
  }
  uint32_t on_status_changed(StatusCallback callback) {
    return status_listeners.add(std::move(callback));
  }
  uint32_t on_transcript(TranscriptCallback callback) {
    return transcript_listeners.add(std::move(callback));
  }

  [[nodiscard]] const Topology::PeerRecord& self() const {
    return topology.self();
  }
  [[nodiscard]] ConnectionStatus status() const { return connection_status; }
  [[nodiscard]] const std::vector<std::string>& raw_peers() const {
    return peers;
  }
  [[nodiscard]] const std::deque<TranscriptItem>& transcript() const {
    return transcript_items;
  }
  [[nodiscard]] const Topology::TopologyController& topology_controller()
      const {
    return topology;
  }

 private:
  Remote::TransportAPI* transport;
  SessionConfig config;

  Topology::TopologyController topology;
  Routing::PacketRouter router;

  ConnectionStatus connection_status = ConnectionStatus::IDLE;
  std::vector<std::string> peers;
  std::deque<TranscriptItem> transcript_items;
  uint64_t next_sequence = 1;

  Support::ListenerList<std::string_view> raw_peer_join_listeners;
  Support::ListenerList<std::string_view> raw_peer_leave_listeners;
  Support::ListenerList<ConnectionStatus> status_listeners;
  Support::ListenerList<const TranscriptItem&> transcript_listeners;

  void update_status(ConnectionStatus status);
  void refresh_status(const Topology::PeerRecord& self);
  void append_transcript(std::string_view sender_id, std::string text,
                         std::string speaker_label, std::string emotion,
                         bool is_translation);
};

}  // namespace uRelay::Session
