#ifndef URELAY_INCLUDE_BOARD_FUNCTIONS_HPP_
#define URELAY_INCLUDE_BOARD_FUNCTIONS_HPP_

#include <cstdint>

namespace uRelay {

struct BoardFunctions {
  static uint32_t timestamp();
  static uint32_t seconds_timestamp();

  static void sleep(uint32_t sleep_ms);
};

}  // namespace uRelay

#endif  // URELAY_INCLUDE_BOARD_FUNCTIONS_HPP_
