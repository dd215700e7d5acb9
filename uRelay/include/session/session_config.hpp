#pragma once

#include <cstddef>

#include "topology/topology_config.hpp"

namespace uRelay::Session {

struct SessionConfig {
  Topology::TopologyConfig topology;
  // Oldest transcript entries are dropped beyond this size.
  size_t transcript_limit = 200;
};

}  // namespace uRelay::Session
