#pragma once

#include <optional>
#include <set>
#include <string>

#include "protocol/role.hpp"

namespace uRelay::Topology {

// The local node's view of itself. ROOT never has a parent, a LEAF never has
// children.
struct PeerRecord {
  std::string id;
  std::string display_name;
  Protocol::Role role = Protocol::Role::LEAF;
  std::string language;
  std::optional<std::string> parent_id;
  std::set<std::string> children_ids;
  bool mic_locked = false;

  [[nodiscard]] bool has_child(const std::string& peer_id) const {
    return children_ids.find(peer_id) != children_ids.end();
  }

  [[nodiscard]] bool is_parent(const std::string& peer_id) const {
    return parent_id && *parent_id == peer_id;
  }

  // "B[BRANCH,en] parent=R children={C,D}"
  [[nodiscard]] std::string to_string() const {
    std::string out = id + "[" + std::string(Protocol::role_name(role)) +
                      "," + language + "] parent=" +
                      (parent_id ? *parent_id : std::string("-")) +
                      " children={";
    bool first = true;
    for (const auto& child : children_ids) {
      if (!first) {
        out += ",";
      }
      out += child;
      first = false;
    }
    out += "}";
    return out;
  }
};

}  // namespace uRelay::Topology
