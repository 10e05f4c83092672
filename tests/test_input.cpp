#include "minitest.hpp"
#include "ui/Input.hpp"
#include "ui/Terminal.hpp"
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <stop_token>
#include <thread>
#include <fcntl.h>
#include <unistd.h>

using namespace windwatch;
using namespace std::chrono;

static bool exit_key(const char* s) {
  return ui::contains_exit_key(reinterpret_cast<const unsigned char*>(s), std::strlen(s));
}

static bool wait_for_stop(const std::stop_source& src, milliseconds limit) {
  auto deadline = steady_clock::now() + limit;
  while (!src.stop_requested() && steady_clock::now() < deadline)
    std::this_thread::sleep_for(milliseconds(5));
  return src.stop_requested();
}

TEST(exit_keys_detected) {
  ASSERT_TRUE(exit_key("q"));
  ASSERT_TRUE(exit_key("Q"));
  ASSERT_TRUE(exit_key("\x1B"));
  ASSERT_TRUE(exit_key("abcq"));
  ASSERT_TRUE(exit_key("\x1B" "x"));
}

TEST(other_keys_ignored) {
  ASSERT_TRUE(!exit_key("a"));
  ASSERT_TRUE(!exit_key(" \n"));
  ASSERT_TRUE(!exit_key(""));
  // arrow keys and F1 are escape sequences, not Esc
  ASSERT_TRUE(!exit_key("\x1B[A"));
  ASSERT_TRUE(!exit_key("\x1BOP"));
  ASSERT_TRUE(!exit_key("\x1B[1;5C"));
}

TEST(key_listener_cancels_on_q) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  std::stop_source cancel;
  {
    ui::KeyListener keys(cancel, fds[0]);
    keys.start();
    ASSERT_TRUE(::write(fds[1], "xq", 2) == 2);
    ASSERT_TRUE(wait_for_stop(cancel, milliseconds(2000)));
    keys.stop();
  }
  ::close(fds[0]);
  ::close(fds[1]);
}

TEST(key_listener_stop_does_not_cancel) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  std::stop_source cancel;
  {
    ui::KeyListener keys(cancel, fds[0]);
    keys.start();
    ASSERT_TRUE(::write(fds[1], "abc", 3) == 3);
    std::this_thread::sleep_for(milliseconds(50));
    keys.stop();
  }
  ASSERT_TRUE(!cancel.stop_requested());
  ASSERT_EQ(ui::g_interrupt_fd.load(), -1);
  ::close(fds[0]);
  ::close(fds[1]);
}

TEST(interrupt_fd_cancels_session) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  std::stop_source cancel;
  {
    ui::KeyListener keys(cancel, fds[0]);
    keys.start();
    ASSERT_EQ(ui::g_interrupt_fd.load(), keys.wake_fd());
    ui::on_sigint(SIGINT);
    ASSERT_TRUE(wait_for_stop(cancel, milliseconds(2000)));
  }
  ::close(fds[0]);
  ::close(fds[1]);
}

TEST(poll_backend_cancels_on_q) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  std::stop_source cancel;
  {
    ui::KeyListener keys(cancel, fds[0], ui::WaitBackend::Poll);
    ASSERT_TRUE(keys.backend() == ui::WaitBackend::Poll);
    keys.start();
    ASSERT_TRUE(::write(fds[1], "ab", 2) == 2);
    std::this_thread::sleep_for(milliseconds(20));
    ASSERT_TRUE(!cancel.stop_requested());
    ASSERT_TRUE(::write(fds[1], "q", 1) == 1);
    ASSERT_TRUE(wait_for_stop(cancel, milliseconds(2000)));
  }
  ASSERT_EQ(ui::g_interrupt_fd.load(), -1);
  ::close(fds[0]);
  ::close(fds[1]);
}

TEST(poll_backend_interrupt_and_stop) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  std::stop_source quiet;
  {
    ui::KeyListener keys(quiet, fds[0], ui::WaitBackend::Poll);
    keys.start();
    keys.stop();
  }
  ASSERT_TRUE(!quiet.stop_requested());

  std::stop_source cancel;
  {
    ui::KeyListener keys(cancel, fds[0], ui::WaitBackend::Poll);
    keys.start();
    ui::on_sigint(SIGINT);
    ASSERT_TRUE(wait_for_stop(cancel, milliseconds(2000)));
  }
  ::close(fds[0]);
  ::close(fds[1]);
}

TEST(poll_backend_survives_closed_input) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  ::close(fds[1]);
  std::stop_source cancel;
  {
    ui::KeyListener keys(cancel, fds[0], ui::WaitBackend::Poll);
    keys.start();
    std::this_thread::sleep_for(milliseconds(50));
    // EOF on input is not an exit key; SIGINT still works afterwards
    ASSERT_TRUE(!cancel.stop_requested());
    ui::on_sigint(SIGINT);
    ASSERT_TRUE(wait_for_stop(cancel, milliseconds(2000)));
  }
  ::close(fds[0]);
}

// An fd number nobody opened makes the wait itself fail.
static constexpr int kUnopenedFd = 1000;

static void check_listener_failure_ends_session(ui::WaitBackend backend) {
  ASSERT_TRUE(::fcntl(kUnopenedFd, F_GETFD) == -1);
  std::stop_source cancel;
  ui::KeyListener keys(cancel, kUnopenedFd, backend);
  keys.start();
  ASSERT_TRUE(wait_for_stop(cancel, milliseconds(2000)));
  // SIGINT no longer points at the dead listener
  ASSERT_EQ(ui::g_interrupt_fd.load(), -1);
}

TEST(listener_failure_ends_session_poll) {
  check_listener_failure_ends_session(ui::WaitBackend::Poll);
}

TEST(listener_failure_ends_session_uring) {
  check_listener_failure_ends_session(ui::WaitBackend::Uring);
}
