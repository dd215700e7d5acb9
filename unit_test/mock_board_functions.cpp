#include <chrono>
#include <cstdint>
#include <thread>

#include "board_functions.hpp"

namespace uRelay {

uint32_t BoardFunctions::timestamp() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

uint32_t BoardFunctions::seconds_timestamp() { return timestamp() / 1000; }

void BoardFunctions::sleep(uint32_t sleep_ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms));
}

}  // namespace uRelay
