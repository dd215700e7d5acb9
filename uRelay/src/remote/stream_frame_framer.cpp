#include "remote/stream_frame_framer.hpp"

extern "C" {
#include <arpa/inet.h>
}

#include <algorithm>
#include <cstring>
#include <utility>

#include "support/logger.hpp"

namespace uRelay::Remote {

using Support::Logger;

bool StreamFrameFramer::process_data(
    uint32_t len, const char* data,
    const std::function<void(Frame&& frame, size_t encoded_length)>&
        complete_callback) {
  uint32_t bytes_remaining = len;
  while (bytes_remaining > 0) {
    const char* position = data + (len - bytes_remaining);
    if (state == empty) {
      if (bytes_remaining >= 4) {
        uint32_t size = 0;
        std::memcpy(&size, position, sizeof(size));
        bytes_remaining -= 4;
        if (!start_frame(ntohl(size))) {
          return false;
        }
      } else {
        std::memcpy(size_buffer, position, bytes_remaining);
        size_field_remaining_bytes = 4 - bytes_remaining;
        bytes_remaining = 0;
        state = waiting_for_size;
      }
    } else if (state == waiting_for_size) {
      uint32_t to_move = std::min(size_field_remaining_bytes, bytes_remaining);
      std::memcpy(size_buffer + (4 - size_field_remaining_bytes), position,
                  to_move);
      size_field_remaining_bytes -= to_move;
      bytes_remaining -= to_move;
      if (size_field_remaining_bytes == 0) {
        uint32_t size = 0;
        std::memcpy(&size, size_buffer, sizeof(size));
        if (!start_frame(ntohl(size))) {
          return false;
        }
      }
    } else if (state == waiting_for_data) {
      uint32_t to_move = std::min(frame_remaining_bytes, bytes_remaining);
      frame_buffer.write(position, to_move);
      bytes_remaining -= to_move;
      frame_remaining_bytes -= to_move;
      if (frame_remaining_bytes == 0) {
        std::optional<Frame> frame = frame_buffer.build();
        frame_buffer = FrameFactory();
        state = empty;
        if (frame) {
          complete_callback(std::move(*frame), frame_full_size);
        }
      }
    }
  }
  return true;
}

bool StreamFrameFramer::start_frame(uint32_t size) {
  if (size > MAX_FRAME_SIZE) {
    Logger::warning("FRAMER", "Frame of %u bytes exceeds the limit", size);
    return false;
  }
  frame_full_size = size;
  frame_remaining_bytes = size;
  // Keepalive
  state = size == 0 ? empty : waiting_for_data;
  return true;
}

}  // namespace uRelay::Remote
