#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include "app/Dashboard.hpp"
#include "util/Timestamp.hpp"

namespace windwatch::app {

// Running -> Cancelling -> Stopped, never backwards.
enum class LoopState { Running, Cancelling, Stopped };

// Time left until the next whole wall-clock second; in (0, 1s].
[[nodiscard]] std::chrono::nanoseconds delay_to_next_second(util::SysTime now);

// Drives the dashboard once per wall-clock second until `cancel` fires,
// `max_ticks` ticks have run (0 = unlimited) or a tick throws.
class Scheduler {
public:
  Scheduler(Dashboard& dashboard, std::stop_token cancel, int max_ticks = 0);
  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // Blocks the calling thread. Tick errors are rethrown after the state reaches Stopped,
  // except CancelledError raised once `cancel` has fired.
  void run();

  [[nodiscard]] LoopState state() const { return state_.load(); }
  [[nodiscard]] int ticks() const { return ticks_.load(); }

private:
  Dashboard& dashboard_;
  std::stop_token cancel_;
  int max_ticks_;
  std::atomic<LoopState> state_{LoopState::Running};
  std::atomic<int> ticks_{0};
  std::mutex mu_;
  std::condition_variable_any cv_;
};

} // namespace windwatch::app
