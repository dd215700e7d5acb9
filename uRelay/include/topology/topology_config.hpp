#pragma once

#include <cstdint>

namespace uRelay::Topology {

struct TopologyConfig {
  uint32_t discovery_interval_ms = 1000;
  uint32_t heartbeat_interval_ms = 2000;
  uint32_t connection_retry_interval_ms = 1000;
  // Requests sent to one target before falling back to discovery, 0 retries
  // forever.
  uint32_t max_connection_attempts = 10;
  // After the attempts ran out the same target is not picked again for this
  // long. Discovery waits instead of falling back to another target.
  uint32_t connection_backoff_ms = 5000;
};

}  // namespace uRelay::Topology
