#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "protocol/role.hpp"

namespace uRelay::Protocol {

struct Announcement {
  Role role = Role::LEAF;
  std::string language;

  bool operator==(const Announcement& other) const {
    return role == other.role && language == other.language;
  }
};

struct ConnectionRequest {
  Role role = Role::LEAF;
  std::string language;
};

struct ConnectionAck {};

struct ProsodyMetadata {
  std::string emotion = "Neutral";
  // 0.5 to 2.0
  float speed = 1.0F;
};

// Raw speech, optionally already translated by the originating peer.
struct AudioPayload {
  std::string origin_language;
  std::string target_language;
  std::vector<char> audio_data;
  bool is_translation = false;
  std::optional<std::string> transcript;
  bool is_final = false;
};

// Translated text with speaker metadata, rendered to speech by receivers.
struct TranslationPayload {
  std::string text;
  std::string speaker_label;
  ProsodyMetadata prosody;
  std::string target_language;
  bool is_final = true;
};

// The order of the alternatives matches the Body variant.
enum struct PacketType : uint8_t {
  ANNOUNCE = 0,
  CONNECTION_REQ = 1,
  CONNECTION_ACK = 2,
  AUDIO = 3,
  TRANSLATION = 4
};

std::string_view packet_type_name(PacketType type);
std::optional<PacketType> packet_type_from_name(std::string_view name);

struct Packet {
  using Body = std::variant<Announcement, ConnectionRequest, ConnectionAck,
                            AudioPayload, TranslationPayload>;

  Packet(std::string sender_id, Body body)
      : sender_id(std::move(sender_id)), body(std::move(body)) {}

  // Control packets: the sending peer. Data packets: the originating peer,
  // kept unchanged while the packet is relayed through the tree.
  std::string sender_id;
  Body body;

  [[nodiscard]] PacketType type() const {
    return static_cast<PacketType>(body.index());
  }

  [[nodiscard]] bool is_data() const {
    return type() == PacketType::AUDIO || type() == PacketType::TRANSLATION;
  }

  static Packet announce(std::string sender_id, Role role,
                         std::string language) {
    return Packet(std::move(sender_id),
                  Announcement{role, std::move(language)});
  }

  static Packet connection_request(std::string sender_id, Role role,
                                   std::string language) {
    return Packet(std::move(sender_id),
                  ConnectionRequest{role, std::move(language)});
  }

  static Packet connection_ack(std::string sender_id) {
    return Packet(std::move(sender_id), ConnectionAck{});
  }
};

}  // namespace uRelay::Protocol
