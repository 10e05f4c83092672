#include "ui/Terminal.hpp"
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <fcntl.h>
#include <string>

namespace windwatch::ui {

std::atomic<int> g_interrupt_fd{-1};

void best_effort_write(int fd, const char* buf, size_t len) {
  if (len == 0) return;
  if (::write(fd, buf, len) < 0) { /* ignore */ }
}

void restore_terminal_minimal() {
  // Async-signal-safe restoration: show cursor, reset SGR
  const char* show_cur = "\x1B[?25h";
  const char* reset = "\x1B[0m";
  best_effort_write(STDOUT_FILENO, show_cur, std::char_traits<char>::length(show_cur));
  best_effort_write(STDOUT_FILENO, reset, std::char_traits<char>::length(reset));
}

void on_sigint(int) {
  int fd = g_interrupt_fd.load();
  if (fd >= 0) {
    // The key listener turns this into a normal cancellation.
    uint64_t one = 1;
    if (::write(fd, &one, sizeof(one)) < 0) { /* ignore */ }
    return;
  }
  restore_terminal_minimal();
  std::signal(SIGINT, SIG_DFL);
  std::raise(SIGINT);
}

void on_atexit_restore(){
  // Ensure all buffered output is written, then restore terminal state
  std::fflush(stdout);
  restore_terminal_minimal();
  if (::isatty(STDOUT_FILENO) == 1) {
    // best-effort drain (not signal-safe; fine here)
    tcdrain(STDOUT_FILENO);
  }
}

bool is_tty(int fd) {
  return ::isatty(fd) == 1;
}

std::string sgr(const char* code, int fd) {
  if (!is_tty(fd)) return {};
  return std::string("\x1B[") + code + "m";
}

std::string sgr_reset(int fd) {
  return sgr("0", fd);
}

std::string sgr_fg_red(int fd) {
  return sgr("31", fd);
}

void clear_screen() {
  if (!is_tty(STDOUT_FILENO)) return;
  best_effort_write(STDOUT_FILENO, "\x1B[2J\x1B[H", 7);
}

RawTermGuard::RawTermGuard() {
  if (::isatty(STDIN_FILENO) == 1) {
    if (tcgetattr(STDIN_FILENO, &old_) == 0) {
      termios neo = old_;
      neo.c_lflag &= ~(ICANON | ECHO);
      neo.c_cc[VMIN] = 0;
      neo.c_cc[VTIME] = 0;
      tcsetattr(STDIN_FILENO, TCSANOW, &neo);
      old_flags_ = fcntl(STDIN_FILENO, F_GETFL, 0);
      fcntl(STDIN_FILENO, F_SETFL, old_flags_ | O_NONBLOCK);
      active_ = true;
    }
  }
}

RawTermGuard::~RawTermGuard() {
  if (active_) {
    tcsetattr(STDIN_FILENO, TCSANOW, &old_);
    fcntl(STDIN_FILENO, F_SETFL, old_flags_);
  }
}

CursorGuard::CursorGuard() {
  if (is_tty(STDOUT_FILENO)) {
    best_effort_write(STDOUT_FILENO, "\x1B[?25l", 6);
    active_ = true;
  }
}

CursorGuard::~CursorGuard() {
  if (active_) best_effort_write(STDOUT_FILENO, "\x1B[?25h", 6);
}

} // namespace windwatch::ui
