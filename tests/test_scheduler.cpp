#include "minitest.hpp"
#include "app/Dashboard.hpp"
#include "app/Scheduler.hpp"
#include "net/Errors.hpp"
#include "util/Timestamp.hpp"
#include <chrono>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using namespace windwatch;
using namespace std::chrono;

// Reading source whose endTime is always the current second, so one fetch serves many partial ticks.
class FreshSource : public data::IReadingSource {
public:
  model::Reading latest() override {
    ++calls;
    model::Reading r;
    r.value = 7.0f;
    r.observed_at = floor<seconds>(system_clock::now());
    r.end_time = util::format_rfc3339_utc(r.observed_at);
    return r;
  }
  int calls{0};
};

class FailingSource : public data::IReadingSource {
public:
  model::Reading latest() override { throw std::runtime_error("upstream down"); }
};

// Cancels the session from inside the first fetch, recording the loop state it sees.
class CancellingSource : public FreshSource {
public:
  explicit CancellingSource(std::stop_source& cancel) : cancel_(cancel) {}
  model::Reading latest() override {
    cancel_.request_stop();
    if (sched) seen = sched->state();
    if (abandon) throw net::CancelledError("abandoned");
    return FreshSource::latest();
  }
  const app::Scheduler* sched{nullptr};
  app::LoopState seen{app::LoopState::Running};
  bool abandon{false};
private:
  std::stop_source& cancel_;
};

static app::Dashboard::FrameSink discard() {
  return [](std::string_view){};
}

TEST(delay_to_next_second_aligns_to_wall_clock) {
  auto base = util::parse_rfc3339("2024-01-01T00:00:00Z").value();
  ASSERT_TRUE(app::delay_to_next_second(base) == seconds(1));
  ASSERT_TRUE(app::delay_to_next_second(base + milliseconds(250)) == milliseconds(750));
  ASSERT_TRUE(app::delay_to_next_second(base + milliseconds(999)) == milliseconds(1));
}

TEST(dashboard_full_then_partial) {
  FreshSource src;
  std::vector<std::string> frames;
  app::Dashboard dash(src, 10.0f, [&](std::string_view f){ frames.emplace_back(f); });

  auto now = system_clock::now();
  ASSERT_TRUE(dash.tick(now) == app::RedrawKind::Full);
  ASSERT_TRUE(dash.tick(now + seconds(1)) == app::RedrawKind::Partial);
  ASSERT_TRUE(dash.tick(now + seconds(2)) == app::RedrawKind::Partial);
  ASSERT_EQ(src.calls, 1);
  ASSERT_EQ(frames.size(), 3u);
  ASSERT_EQ(frames[0].rfind("\x1B[2J", 0), 0u);
  ASSERT_TRUE(frames[1].find("\x1B[2J") == std::string::npos);
  ASSERT_EQ(dash.state().max_power, 10.0f);
}

TEST(dashboard_refetches_when_countdown_expires) {
  FreshSource src;
  app::Dashboard dash(src, 0.0f, discard());
  auto now = system_clock::now();
  (void)dash.tick(now);
  ASSERT_TRUE(dash.tick(now + minutes(3) + seconds(1)) == app::RedrawKind::Partial);
  // that partial pushed the countdown below zero
  ASSERT_TRUE(dash.tick(now + minutes(3) + seconds(2)) == app::RedrawKind::Full);
  ASSERT_EQ(src.calls, 2);
}

TEST(scheduler_stops_after_tick_budget) {
  FreshSource src;
  app::Dashboard dash(src, 0.0f, discard());
  std::stop_source cancel;
  app::Scheduler sched(dash, cancel.get_token(), 2);
  ASSERT_TRUE(sched.state() == app::LoopState::Running);
  sched.run();
  ASSERT_EQ(sched.ticks(), 2);
  ASSERT_TRUE(sched.state() == app::LoopState::Stopped);
  ASSERT_EQ(src.calls, 1);
}

TEST(scheduler_cancel_interrupts_wait) {
  FreshSource src;
  app::Dashboard dash(src, 0.0f, discard());
  std::stop_source cancel;
  app::Scheduler sched(dash, cancel.get_token());

  auto start = steady_clock::now();
  std::jthread canceller([&]{
    std::this_thread::sleep_for(milliseconds(100));
    cancel.request_stop();
  });
  sched.run();
  auto elapsed = steady_clock::now() - start;

  ASSERT_TRUE(elapsed < milliseconds(800));
  ASSERT_TRUE(sched.ticks() >= 1);
  ASSERT_TRUE(sched.state() == app::LoopState::Stopped);
}

TEST(scheduler_cancelled_before_start_never_ticks) {
  FreshSource src;
  app::Dashboard dash(src, 0.0f, discard());
  std::stop_source cancel;
  cancel.request_stop();
  app::Scheduler sched(dash, cancel.get_token());
  sched.run();
  ASSERT_EQ(sched.ticks(), 0);
  ASSERT_EQ(src.calls, 0);
  ASSERT_TRUE(sched.state() == app::LoopState::Stopped);
}

TEST(scheduler_propagates_tick_failure) {
  FailingSource src;
  app::Dashboard dash(src, 0.0f, discard());
  std::stop_source cancel;
  app::Scheduler sched(dash, cancel.get_token());
  ASSERT_THROWS(sched.run(), std::runtime_error);
  ASSERT_TRUE(sched.state() == app::LoopState::Stopped);
}

TEST(scheduler_enters_cancelling_during_tick) {
  std::stop_source cancel;
  CancellingSource src(cancel);
  app::Dashboard dash(src, 0.0f, discard());
  app::Scheduler sched(dash, cancel.get_token());
  src.sched = &sched;
  sched.run();
  ASSERT_TRUE(src.seen == app::LoopState::Cancelling);
  ASSERT_TRUE(sched.state() == app::LoopState::Stopped);
  ASSERT_EQ(sched.ticks(), 1);
}

TEST(scheduler_abandoned_tick_after_cancel_is_clean) {
  std::stop_source cancel;
  CancellingSource src(cancel);
  src.abandon = true;
  app::Dashboard dash(src, 0.0f, discard());
  app::Scheduler sched(dash, cancel.get_token());
  src.sched = &sched;
  sched.run();
  ASSERT_TRUE(src.seen == app::LoopState::Cancelling);
  ASSERT_TRUE(sched.state() == app::LoopState::Stopped);
  ASSERT_EQ(sched.ticks(), 0);
}

TEST(scheduler_rethrows_cancelled_error_without_cancel) {
  class StrayCancel : public data::IReadingSource {
  public:
    model::Reading latest() override { throw net::CancelledError("stray"); }
  } src;
  app::Dashboard dash(src, 0.0f, discard());
  std::stop_source cancel;
  app::Scheduler sched(dash, cancel.get_token());
  ASSERT_THROWS(sched.run(), net::CancelledError);
  ASSERT_TRUE(sched.state() == app::LoopState::Stopped);
}
