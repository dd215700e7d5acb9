#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "protocol/packet.hpp"

namespace uRelay::Topology {

// Last announcement seen per remote peer. Advisory only, entries are
// overwritten by newer announcements and dropped when the peer departs.
class CandidateTable {
 public:
  using Entries = std::map<std::string, Protocol::Announcement, std::less<>>;

  // Returns true if the entry was added or changed.
  bool upsert(std::string_view peer_id,
              const Protocol::Announcement& announcement);
  bool erase(std::string_view peer_id);
  void clear() { entries.clear(); }

  [[nodiscard]] const Protocol::Announcement* find(
      std::string_view peer_id) const;

  // Lowest peer id announcing BRANCH for the given language.
  [[nodiscard]] std::optional<std::string> best_branch_for(
      std::string_view language) const;

  [[nodiscard]] size_t size() const { return entries.size(); }
  [[nodiscard]] const Entries& all() const { return entries; }

 private:
  Entries entries;
};

}  // namespace uRelay::Topology
