#include "app/Scheduler.hpp"
#include "net/Errors.hpp"

using namespace std::chrono;

namespace windwatch::app {

nanoseconds delay_to_next_second(util::SysTime now) {
  auto next = floor<seconds>(now) + seconds(1);
  return duration_cast<nanoseconds>(next - now);
}

Scheduler::Scheduler(Dashboard& dashboard, std::stop_token cancel, int max_ticks)
    : dashboard_(dashboard), cancel_(std::move(cancel)), max_ticks_(max_ticks) {}

void Scheduler::run() {
  std::stop_callback on_cancel(cancel_, [this]{
    auto expected = LoopState::Running;
    state_.compare_exchange_strong(expected, LoopState::Cancelling);
  });

  try {
    while (!cancel_.stop_requested()) {
      auto now = system_clock::now();
      auto deadline = now + delay_to_next_second(now);
      dashboard_.tick(now);
      ++ticks_;
      if (max_ticks_ > 0 && ticks_.load() >= max_ticks_) break;

      std::unique_lock<std::mutex> lk(mu_);
      // Returns early only when cancellation is requested.
      cv_.wait_until(lk, cancel_, deadline, []{ return false; });
    }
  } catch (const net::CancelledError&) {
    // A tick abandoned because of this session's cancellation ends the loop normally.
    state_.store(LoopState::Stopped);
    if (!cancel_.stop_requested()) throw;
    return;
  } catch (...) {
    state_.store(LoopState::Stopped);
    throw;
  }
  state_.store(LoopState::Stopped);
}

} // namespace windwatch::app
