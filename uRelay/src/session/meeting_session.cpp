#include "session/meeting_session.hpp"

#include <algorithm>
#include <utility>

#include "board_functions.hpp"
#include "support/logger.hpp"

namespace uRelay::Session {

using Support::Logger;

std::string_view connection_status_name(ConnectionStatus status) {
  switch (status) {
    case ConnectionStatus::IDLE:
      return "IDLE";
    case ConnectionStatus::CONNECTING:
      return "CONNECTING";
    case ConnectionStatus::CONNECTED:
      return "CONNECTED";
  }
  return "UNKNOWN";
}

MeetingSession::MeetingSession(Remote::TransportAPI* transport,
                               Runtime::TimerAPI* timers, SessionConfig config)
    : transport(transport),
      config(config),
      topology(transport, timers, config.topology),
      router(transport, &topology) {
  // Registered first, user listeners observe the updated status and
  // transcript.
  topology.add_self_state_listener(
      [this](const Topology::PeerRecord& self) { refresh_status(self); });
  router.add_translation_listener(
      [this](std::string_view sender_id,
             const Protocol::TranslationPayload& translation) {
        append_transcript(sender_id, translation.text,
                          translation.speaker_label,
                          translation.prosody.emotion, true);
      });
  router.add_audio_listener(
      [this](std::string_view sender_id, const Protocol::AudioPayload& audio) {
        if (audio.transcript) {
          // Audio does not carry the speaker's display name.
          append_transcript(sender_id, *audio.transcript, std::string(),
                            "Neutral", audio.is_translation);
        }
      });
}

MeetingSession::~MeetingSession() {
  if (topology.joined()) {
    leave();
  }
}

std::string MeetingSession::join(std::string_view room_id,
                                 std::string display_name,
                                 std::string language, bool is_root) {
  if (topology.joined()) {
    leave();
  }
  peers.clear();
  transcript_items.clear();
  update_status(ConnectionStatus::CONNECTING);

  std::string self_id = transport->join(room_id, this);
  Logger::info("SESSION", "Joining %.*s as %s",
               static_cast<int>(room_id.size()), room_id.data(),
               self_id.c_str());
  topology.join(self_id, std::move(display_name), std::move(language),
                is_root);
  return self_id;
}

void MeetingSession::leave() {
  topology.leave();
  transport->leave();
  peers.clear();
  update_status(ConnectionStatus::IDLE);
}

size_t MeetingSession::broadcast_audio(Protocol::AudioPayload payload) {
  return router.broadcast_audio(std::move(payload));
}

size_t MeetingSession::broadcast_translation(
    Protocol::TranslationPayload payload) {
  if (!topology.joined()) {
    return 0;
  }
  append_transcript(topology.self().id, payload.text, payload.speaker_label,
                    payload.prosody.emotion, false);
  return router.broadcast_translation(std::move(payload));
}

void MeetingSession::set_mic_locked(bool locked) {
  topology.set_mic_locked(locked);
}

void MeetingSession::on_peer_join(std::string_view peer_id) {
  if (std::find(peers.begin(), peers.end(), peer_id) == peers.end()) {
    peers.emplace_back(peer_id);
  }
  raw_peer_join_listeners.notify(peer_id);
  topology.handle_peer_join(peer_id);
}

void MeetingSession::on_peer_leave(std::string_view peer_id) {
  peers.erase(std::remove(peers.begin(), peers.end(), peer_id), peers.end());
  raw_peer_leave_listeners.notify(peer_id);
  topology.handle_peer_leave(peer_id);
}

void MeetingSession::on_packet(Protocol::Packet&& packet,
                               std::string_view sender) {
  if (packet.is_data()) {
    router.handle_packet(packet, sender);
  } else {
    topology.handle_packet(packet, sender);
  }
}

void MeetingSession::update_status(ConnectionStatus status) {
  if (connection_status == status) {
    return;
  }
  connection_status = status;
  Logger::debug("SESSION", "Status %s", connection_status_name(status).data());
  status_listeners.notify(status);
}

void MeetingSession::refresh_status(const Topology::PeerRecord& self) {
  if (!topology.joined()) {
    update_status(ConnectionStatus::IDLE);
  } else if (self.role == Protocol::Role::ROOT || self.parent_id) {
    update_status(ConnectionStatus::CONNECTED);
  } else {
    update_status(ConnectionStatus::CONNECTING);
  }
}

void MeetingSession::append_transcript(std::string_view sender_id,
                                       std::string text,
                                       std::string speaker_label,
                                       std::string emotion,
                                       bool is_translation) {
  TranscriptItem item{next_sequence++,
                      std::string(sender_id),
                      std::move(text),
                      std::move(speaker_label),
                      std::move(emotion),
                      is_translation,
                      BoardFunctions::timestamp()};
  transcript_items.push_back(item);
  while (transcript_items.size() > config.transcript_limit) {
    transcript_items.pop_front();
  }
  transcript_listeners.notify(item);
}

}  // namespace uRelay::Session
