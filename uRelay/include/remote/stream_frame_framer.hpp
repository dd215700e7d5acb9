#pragma once

#include <cstdint>
#include <functional>

#include "remote/frame_codec.hpp"

namespace uRelay::Remote {

// Extract frames from a stream (e.g. TCP) containing pairs of (length
// (uint32_t,network byte order), content (Msgpack)). Zero length frames are
// keepalives.
// https://blog.stephencleary.com/2009/04/message-framing.html
struct StreamFrameFramer {
  constexpr static uint32_t MAX_FRAME_SIZE = 16 * 1024 * 1024;

  enum ProcessingState {
    empty,
    waiting_for_size,
    waiting_for_data,
  };

  ProcessingState state{empty};

  // The size field may be split into multiple recvs
  char size_buffer[4]{0, 0, 0, 0};
  uint32_t size_field_remaining_bytes{0};

  uint32_t frame_remaining_bytes{0};
  uint32_t frame_full_size{0};
  FrameFactory frame_buffer = FrameFactory();

  // Returns false if the stream announced an oversized frame, the connection
  // can not be resynchronized after that.
  bool process_data(
      uint32_t len, const char* data,
      const std::function<void(Frame&& frame, size_t encoded_length)>&
          complete_callback);

 private:
  bool start_frame(uint32_t size);
};

}  // namespace uRelay::Remote
