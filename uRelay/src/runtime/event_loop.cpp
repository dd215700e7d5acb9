#include "runtime/event_loop.hpp"

#include <utility>

#include "board_functions.hpp"

namespace uRelay::Runtime {

EventLoop::EventLoop() : EventLoop(&BoardFunctions::timestamp) {}

EventLoop::EventLoop(Clock clock) : clock(std::move(clock)) {}

uint32_t EventLoop::schedule_periodic(uint32_t interval_ms,
                                      std::function<void()> callback) {
  uint32_t id = next_id;
  while (id == 0 || timers.find(id) != timers.end()) {
    id++;
  }
  next_id = id + 1;
  if (interval_ms == 0) {
    interval_ms = 1;
  }
  timers.emplace(
      id, Timer{interval_ms, clock() + interval_ms, std::move(callback)});
  return id;
}

void EventLoop::cancel(uint32_t timer_id) { timers.erase(timer_id); }

void EventLoop::fire_due_timers() {
  const uint32_t now = clock();
  while (true) {
    auto due = timers.end();
    for (auto it = timers.begin(); it != timers.end(); ++it) {
      if (!reached(now, it->second.next_deadline)) {
        continue;
      }
      if (due == timers.end() ||
          static_cast<int32_t>(it->second.next_deadline -
                               due->second.next_deadline) < 0) {
        due = it;
      }
    }
    if (due == timers.end()) {
      return;
    }

    // Missed periods are skipped instead of replayed.
    Timer& timer = due->second;
    timer.next_deadline += timer.interval;
    if (reached(now, timer.next_deadline)) {
      timer.next_deadline = now + timer.interval;
    }

    // The callback may cancel its own timer.
    auto callback = timer.callback;
    callback();
  }
}

uint32_t EventLoop::next_wait(uint32_t max_wait_ms) const {
  const uint32_t now = clock();
  uint32_t wait = max_wait_ms;
  for (const auto& [id, timer] : timers) {
    if (reached(now, timer.next_deadline)) {
      return 0;
    }
    uint32_t remaining = timer.next_deadline - now;
    if (remaining < wait) {
      wait = remaining;
    }
  }
  return wait;
}

void EventLoop::run_once(PollAPI* source, uint32_t max_wait_ms) {
  if (source != nullptr) {
    source->poll(next_wait(max_wait_ms));
  } else {
    uint32_t wait = next_wait(max_wait_ms);
    if (wait > 0) {
      BoardFunctions::sleep(wait);
    }
  }
  fire_due_timers();
}

void EventLoop::run(PollAPI* source) {
  running = true;
  while (running) {
    run_once(source);
  }
}

}  // namespace uRelay::Runtime
