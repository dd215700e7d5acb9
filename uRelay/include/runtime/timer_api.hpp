#pragma once

#include <cstdint>
#include <functional>
#include <utility>

namespace uRelay::Runtime {

struct TimerAPI {
  // The first invocation happens interval_ms after scheduling.
  virtual uint32_t schedule_periodic(uint32_t interval_ms,
                                     std::function<void()> callback) = 0;
  // Cancelling an unknown or already cancelled timer is a no-op.
  virtual void cancel(uint32_t timer_id) = 0;

  virtual ~TimerAPI() {}
};

// Owns a periodic timer and cancels it on destruction.
class TimerHandle {
 public:
  TimerHandle() = default;
  TimerHandle(TimerAPI* timers, uint32_t id) : timers(timers), id(id) {}

  TimerHandle(const TimerHandle&) = delete;
  TimerHandle& operator=(const TimerHandle&) = delete;

  TimerHandle(TimerHandle&& other) noexcept
      : timers(std::exchange(other.timers, nullptr)),
        id(std::exchange(other.id, 0)) {}

  TimerHandle& operator=(TimerHandle&& other) noexcept {
    if (this != &other) {
      reset();
      timers = std::exchange(other.timers, nullptr);
      id = std::exchange(other.id, 0);
    }
    return *this;
  }

  ~TimerHandle() { reset(); }

  void reset() {
    if (timers != nullptr) {
      timers->cancel(id);
      timers = nullptr;
      id = 0;
    }
  }

  [[nodiscard]] bool active() const { return timers != nullptr; }

 private:
  TimerAPI* timers = nullptr;
  uint32_t id = 0;
};

inline TimerHandle schedule(TimerAPI* timers, uint32_t interval_ms,
                            std::function<void()> callback) {
  return TimerHandle(timers,
                     timers->schedule_periodic(interval_ms, std::move(callback)));
}

}  // namespace uRelay::Runtime
