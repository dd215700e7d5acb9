#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace uRelay::Protocol {

enum struct Role : uint8_t { ROOT = 0, BRANCH = 1, LEAF = 2 };

constexpr std::string_view role_name(Role role) {
  switch (role) {
    case Role::ROOT:
      return "ROOT";
    case Role::BRANCH:
      return "BRANCH";
    case Role::LEAF:
      return "LEAF";
  }
  return "UNKNOWN";
}

inline std::optional<Role> role_from_name(std::string_view name) {
  if (name == "ROOT") {
    return Role::ROOT;
  } else if (name == "BRANCH") {
    return Role::BRANCH;
  } else if (name == "LEAF") {
    return Role::LEAF;
  }
  return std::nullopt;
}

// Only relays accept children and send heartbeats.
constexpr bool is_relay(Role role) {
  return role == Role::ROOT || role == Role::BRANCH;
}

}  // namespace uRelay::Protocol
