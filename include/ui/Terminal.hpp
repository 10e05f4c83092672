#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <termios.h>
#include <unistd.h>

namespace windwatch::ui {

// eventfd that SIGINT pokes to end the session; -1 while no key listener runs.
extern std::atomic<int> g_interrupt_fd;

void restore_terminal_minimal();
void on_sigint(int);
void on_atexit_restore();

// Terminal capability detection
[[nodiscard]] bool is_tty(int fd);

// SGR code generation; empty when `fd` is not a terminal
[[nodiscard]] std::string sgr(const char* code, int fd = STDOUT_FILENO);
[[nodiscard]] std::string sgr_reset(int fd = STDOUT_FILENO);
[[nodiscard]] std::string sgr_fg_red(int fd = STDOUT_FILENO);

// Best-effort terminal write (async-signal-safe)
void best_effort_write(int fd, const char* buf, size_t len);

void clear_screen();

// RAII guards for terminal state
class RawTermGuard {
  bool active_{false};
  termios old_{};
  int old_flags_{0};
public:
  RawTermGuard();
  ~RawTermGuard();
  RawTermGuard(const RawTermGuard&) = delete;
  RawTermGuard& operator=(const RawTermGuard&) = delete;
};

class CursorGuard {
  bool active_{false};
public:
  CursorGuard();
  ~CursorGuard();
  CursorGuard(const CursorGuard&) = delete;
  CursorGuard& operator=(const CursorGuard&) = delete;
};

} // namespace windwatch::ui
