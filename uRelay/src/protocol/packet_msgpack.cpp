#include "protocol/packet_msgpack.hpp"

extern "C" {
#include <arpa/inet.h>
}

#include <cstring>
#include <utility>

#include "support/logger.hpp"

namespace uRelay::Protocol {

using Support::Logger;

std::shared_ptr<std::vector<char>> FrameBuffer::finish() {
  uint32_t size = htonl(static_cast<uint32_t>(buffer->size() - 4));
  std::memcpy(buffer->data(), &size, sizeof(size));
  return std::move(buffer);
}

void pack_string(Packer* packer, std::string_view value) {
  packer->pack_str(static_cast<uint32_t>(value.size()));
  packer->pack_str_body(value.data(), static_cast<uint32_t>(value.size()));
}

namespace {

void pack_bool(Packer* packer, bool value) {
  if (value) {
    packer->pack_true();
  } else {
    packer->pack_false();
  }
}

void pack_body(Packer* packer, const Announcement& body) {
  packer->pack_map(2);
  pack_string(packer, "role");
  pack_string(packer, role_name(body.role));
  pack_string(packer, "language");
  pack_string(packer, body.language);
}

void pack_body(Packer* packer, const ConnectionRequest& body) {
  packer->pack_map(2);
  pack_string(packer, "role");
  pack_string(packer, role_name(body.role));
  pack_string(packer, "language");
  pack_string(packer, body.language);
}

void pack_body(Packer* packer, const ConnectionAck& /*body*/) {
  packer->pack_nil();
}

void pack_body(Packer* packer, const AudioPayload& body) {
  packer->pack_map(body.transcript ? 6 : 5);
  pack_string(packer, "origin_language");
  pack_string(packer, body.origin_language);
  pack_string(packer, "target_language");
  pack_string(packer, body.target_language);
  pack_string(packer, "audio_data");
  packer->pack_bin(static_cast<uint32_t>(body.audio_data.size()));
  packer->pack_bin_body(body.audio_data.data(),
                        static_cast<uint32_t>(body.audio_data.size()));
  pack_string(packer, "is_translation");
  pack_bool(packer, body.is_translation);
  if (body.transcript) {
    pack_string(packer, "transcript");
    pack_string(packer, *body.transcript);
  }
  pack_string(packer, "is_final");
  pack_bool(packer, body.is_final);
}

void pack_body(Packer* packer, const TranslationPayload& body) {
  packer->pack_map(5);
  pack_string(packer, "text");
  pack_string(packer, body.text);
  pack_string(packer, "speaker_label");
  pack_string(packer, body.speaker_label);
  pack_string(packer, "prosody");
  packer->pack_map(2);
  pack_string(packer, "emotion");
  pack_string(packer, body.prosody.emotion);
  pack_string(packer, "speed");
  packer->pack_float(body.prosody.speed);
  pack_string(packer, "target_language");
  pack_string(packer, body.target_language);
  pack_string(packer, "is_final");
  pack_bool(packer, body.is_final);
}

std::string string_or(const msgpack::object& map, std::string_view key,
                      std::string_view fallback = "") {
  auto value = string_field(map, key);
  return std::string(value ? *value : fallback);
}

bool bool_or(const msgpack::object& map, std::string_view key, bool fallback) {
  const msgpack::object* value = find_field(map, key);
  if (value == nullptr || value->type != msgpack::type::BOOLEAN) {
    return fallback;
  }
  return value->via.boolean;
}

float float_or(const msgpack::object& map, std::string_view key,
               float fallback) {
  const msgpack::object* value = find_field(map, key);
  if (value == nullptr) {
    return fallback;
  }
  switch (value->type) {
    case msgpack::type::FLOAT32:
    case msgpack::type::FLOAT64:
      return static_cast<float>(value->via.f64);
    case msgpack::type::POSITIVE_INTEGER:
      return static_cast<float>(value->via.u64);
    case msgpack::type::NEGATIVE_INTEGER:
      return static_cast<float>(value->via.i64);
    default:
      return fallback;
  }
}

std::optional<Announcement> unpack_announcement(
    const msgpack::object* payload) {
  if (payload == nullptr) {
    return std::nullopt;
  }
  auto raw_role = string_field(*payload, "role");
  auto language = string_field(*payload, "language");
  if (!raw_role || !language) {
    return std::nullopt;
  }
  auto role = role_from_name(*raw_role);
  if (!role) {
    Logger::warning("PACKET-CODEC", "Unknown role \"%.*s\"",
                    static_cast<int>(raw_role->size()), raw_role->data());
    return std::nullopt;
  }
  return Announcement{*role, std::string(*language)};
}

AudioPayload unpack_audio(const msgpack::object& payload) {
  AudioPayload audio;
  audio.origin_language = string_or(payload, "origin_language");
  audio.target_language = string_or(payload, "target_language");
  if (const msgpack::object* data = find_field(payload, "audio_data"); data) {
    if (data->type == msgpack::type::BIN) {
      audio.audio_data.assign(data->via.bin.ptr,
                              data->via.bin.ptr + data->via.bin.size);
    } else if (data->type == msgpack::type::STR) {
      audio.audio_data.assign(data->via.str.ptr,
                              data->via.str.ptr + data->via.str.size);
    }
  }
  audio.is_translation = bool_or(payload, "is_translation", false);
  if (auto transcript = string_field(payload, "transcript"); transcript) {
    audio.transcript = std::string(*transcript);
  }
  audio.is_final = bool_or(payload, "is_final", false);
  return audio;
}

TranslationPayload unpack_translation(const msgpack::object& payload) {
  TranslationPayload translation;
  translation.text = string_or(payload, "text");
  translation.speaker_label = string_or(payload, "speaker_label", "Speaker");
  if (const msgpack::object* prosody = find_field(payload, "prosody");
      prosody != nullptr && prosody->type == msgpack::type::MAP) {
    translation.prosody.emotion = string_or(*prosody, "emotion", "Neutral");
    translation.prosody.speed = float_or(*prosody, "speed", 1.0F);
  }
  translation.target_language = string_or(payload, "target_language");
  translation.is_final = bool_or(payload, "is_final", true);
  return translation;
}

}  // namespace

void pack_packet(Packer* packer, const Packet& packet) {
  const bool has_payload = packet.type() != PacketType::CONNECTION_ACK;
  packer->pack_map(has_payload ? 3 : 2);
  pack_string(packer, "type");
  pack_string(packer, packet_type_name(packet.type()));
  pack_string(packer, "sender_id");
  pack_string(packer, packet.sender_id);
  if (has_payload) {
    pack_string(packer, "payload");
    std::visit([packer](const auto& body) { pack_body(packer, body); },
               packet.body);
  }
}

const msgpack::object* find_field(const msgpack::object& map,
                                  std::string_view key) {
  if (map.type != msgpack::type::MAP) {
    return nullptr;
  }
  for (uint32_t i = 0; i < map.via.map.size; i++) {
    const msgpack::object_kv& entry = map.via.map.ptr[i];
    if (entry.key.type == msgpack::type::STR &&
        std::string_view(entry.key.via.str.ptr, entry.key.via.str.size) ==
            key) {
      return &entry.val;
    }
  }
  return nullptr;
}

std::optional<std::string_view> string_field(const msgpack::object& map,
                                             std::string_view key) {
  const msgpack::object* value = find_field(map, key);
  if (value == nullptr || value->type != msgpack::type::STR) {
    return std::nullopt;
  }
  return std::string_view(value->via.str.ptr, value->via.str.size);
}

std::optional<Packet> unpack_packet(const msgpack::object& root) {
  auto raw_type = string_field(root, "type");
  auto sender_id = string_field(root, "sender_id");
  if (!raw_type || !sender_id) {
    Logger::warning("PACKET-CODEC", "Packet without type or sender");
    return std::nullopt;
  }

  auto type = packet_type_from_name(*raw_type);
  if (!type) {
    Logger::warning("PACKET-CODEC", "Unknown packet type \"%.*s\"",
                    static_cast<int>(raw_type->size()), raw_type->data());
    return std::nullopt;
  }

  const msgpack::object* payload = find_field(root, "payload");
  switch (*type) {
    case PacketType::ANNOUNCE: {
      auto announcement = unpack_announcement(payload);
      if (!announcement) {
        break;
      }
      return Packet(std::string(*sender_id), std::move(*announcement));
    }
    case PacketType::CONNECTION_REQ: {
      auto request = unpack_announcement(payload);
      if (!request) {
        break;
      }
      return Packet(std::string(*sender_id),
                    ConnectionRequest{request->role,
                                      std::move(request->language)});
    }
    case PacketType::CONNECTION_ACK:
      return Packet(std::string(*sender_id), ConnectionAck{});
    case PacketType::AUDIO:
      if (payload == nullptr || payload->type != msgpack::type::MAP) {
        break;
      }
      return Packet(std::string(*sender_id), unpack_audio(*payload));
    case PacketType::TRANSLATION:
      if (payload == nullptr || payload->type != msgpack::type::MAP) {
        break;
      }
      return Packet(std::string(*sender_id), unpack_translation(*payload));
  }

  Logger::warning("PACKET-CODEC", "Malformed %s payload from %.*s",
                  packet_type_name(*type).data(),
                  static_cast<int>(sender_id->size()), sender_id->data());
  return std::nullopt;
}

}  // namespace uRelay::Protocol
