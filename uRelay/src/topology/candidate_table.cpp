#include "topology/candidate_table.hpp"

namespace uRelay::Topology {

bool CandidateTable::upsert(std::string_view peer_id,
                            const Protocol::Announcement& announcement) {
  auto it = entries.find(peer_id);
  if (it == entries.end()) {
    entries.emplace(std::string(peer_id), announcement);
    return true;
  }
  if (it->second == announcement) {
    return false;
  }
  it->second = announcement;
  return true;
}

bool CandidateTable::erase(std::string_view peer_id) {
  auto it = entries.find(peer_id);
  if (it == entries.end()) {
    return false;
  }
  entries.erase(it);
  return true;
}

const Protocol::Announcement* CandidateTable::find(
    std::string_view peer_id) const {
  auto it = entries.find(peer_id);
  if (it == entries.end()) {
    return nullptr;
  }
  return &it->second;
}

std::optional<std::string> CandidateTable::best_branch_for(
    std::string_view language) const {
  // Ordered map, the first match has the lowest id.
  for (const auto& [peer_id, announcement] : entries) {
    if (announcement.role == Protocol::Role::BRANCH &&
        announcement.language == language) {
      return peer_id;
    }
  }
  return std::nullopt;
}

}  // namespace uRelay::Topology
