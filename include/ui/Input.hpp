#pragma once

#include <cstddef>
#include <stop_token>
#include <thread>
#include <unistd.h>
#include <liburing.h>

namespace windwatch::ui {

// True if the chunk holds 'q'/'Q' or an Esc that does not start an escape sequence.
[[nodiscard]] bool contains_exit_key(const unsigned char* buf, size_t len);

// How the listener waits for the key fd and the wake eventfd.
enum class WaitBackend { Uring, Poll };

// Watches `fd` for the quit keys on its own thread and requests stop on `cancel`
// when one arrives. SIGINT is routed here too through the wake eventfd.
// Falls back to poll() when io_uring cannot be set up. A listener that fails
// while running also requests stop, so the session never outlives its quit path.
class KeyListener {
public:
  explicit KeyListener(std::stop_source cancel, int fd = STDIN_FILENO,
                       WaitBackend backend = WaitBackend::Uring);
  ~KeyListener();
  KeyListener(const KeyListener&) = delete;
  KeyListener& operator=(const KeyListener&) = delete;

  void start();
  void stop();

  [[nodiscard]] int wake_fd() const { return wake_fd_; }
  [[nodiscard]] WaitBackend backend() const { return backend_; }

private:
  enum class KeyEvent { Pending, ExitKey, Closed, Failed };

  void run(std::stop_token st);
  void run_uring(std::stop_token st);
  void run_poll(std::stop_token st);
  KeyEvent read_keys();
  void on_wake(const std::stop_token& st);
  void fail(const char* what, int err);

  std::stop_source cancel_;
  int fd_;
  int wake_fd_{-1};
  WaitBackend backend_;
  struct io_uring ring_{};
  bool ring_ready_{false};
  std::jthread thread_;
};

} // namespace windwatch::ui
