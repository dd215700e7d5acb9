#pragma once

#include <cstdint>
#include <functional>
#include <map>

#include "runtime/timer_api.hpp"

namespace uRelay::Runtime {

// I/O source driven by the event loop. poll() must return after at most
// max_wait_ms.
struct PollAPI {
  virtual void poll(uint32_t max_wait_ms) = 0;

  virtual ~PollAPI() {}
};

// Single threaded scheduler for periodic timers. All topology and routing
// state is only touched from callbacks dispatched by this loop.
class EventLoop : public TimerAPI {
 public:
  using Clock = std::function<uint32_t()>;

  EventLoop();
  explicit EventLoop(Clock clock);

  uint32_t schedule_periodic(uint32_t interval_ms,
                             std::function<void()> callback) override;
  void cancel(uint32_t timer_id) override;

  // Runs every timer whose deadline has passed, in deadline order.
  void fire_due_timers();

  // Time until the next deadline, capped at max_wait_ms.
  uint32_t next_wait(uint32_t max_wait_ms) const;

  void run_once(PollAPI* source, uint32_t max_wait_ms = 1000);
  void run(PollAPI* source);
  void stop() { running = false; }

  [[nodiscard]] size_t active_timers() const { return timers.size(); }

 protected:
  // Ids wrap around, ids of live timers are skipped.
  uint32_t next_id = 1;

 private:
  struct Timer {
    uint32_t interval;
    uint32_t next_deadline;
    std::function<void()> callback;
  };

  Clock clock;
  std::map<uint32_t, Timer> timers;
  bool running = false;

  // Wrap-around safe comparison of millisecond timestamps.
  static bool reached(uint32_t now, uint32_t deadline) {
    return static_cast<int32_t>(now - deadline) >= 0;
  }
};

}  // namespace uRelay::Runtime
