#include "ui/Input.hpp"
#include "ui/Terminal.hpp"
#include <sys/eventfd.h>
#include <poll.h>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <system_error>

namespace windwatch::ui {

// Tags for distinguishing CQE sources
enum class PollTag : uint64_t { Key = 1, Wake = 2 };

bool contains_exit_key(const unsigned char* buf, size_t len) {
  for (size_t i = 0; i < len; ++i) {
    unsigned char c = buf[i];
    if (c == 'q' || c == 'Q') return true;
    if (c != 0x1B) continue;
    if (i + 1 >= len) return true;
    unsigned char next = buf[i + 1];
    if (next == '[') {
      // CSI: parameters up to the final byte
      i += 2;
      while (i < len && (buf[i] < '@' || buf[i] > '~')) ++i;
    } else if (next == 'O') {
      i += 2;  // SS3 carries one more byte
    } else {
      return true;
    }
  }
  return false;
}

KeyListener::KeyListener(std::stop_source cancel, int fd, WaitBackend backend)
    : cancel_(std::move(cancel)), fd_(fd), backend_(backend) {
  wake_fd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (wake_fd_ < 0) {
    throw std::system_error(errno, std::generic_category(), "eventfd");
  }
  if (backend_ == WaitBackend::Uring) {
    int ret = io_uring_queue_init(8, &ring_, 0);
    if (ret < 0) {
      std::fprintf(stderr, "windwatch: KeyListener: io_uring_queue_init() failed: %s, using poll()\n",
                   std::strerror(-ret));
      backend_ = WaitBackend::Poll;
    } else {
      ring_ready_ = true;
    }
  }
}

KeyListener::~KeyListener() {
  stop();
  if (ring_ready_) io_uring_queue_exit(&ring_);
  if (wake_fd_ >= 0) ::close(wake_fd_);
}

void KeyListener::start() {
  g_interrupt_fd.store(wake_fd_);
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void KeyListener::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    uint64_t val = 1;
    if (::write(wake_fd_, &val, sizeof(val)) < 0) { /* ignore */ }
    thread_.join();
  }
  int mine = wake_fd_;
  g_interrupt_fd.compare_exchange_strong(mine, -1);
}

void KeyListener::run(std::stop_token st) {
  if (backend_ == WaitBackend::Uring) run_uring(st);
  else run_poll(st);
}

// Either stop() or SIGINT; only the latter cancels the session.
void KeyListener::on_wake(const std::stop_token& st) {
  if (!st.stop_requested()) cancel_.request_stop();
}

// Nothing can end the session from here on, so hand SIGINT back to the
// default path and end the session now.
void KeyListener::fail(const char* what, int err) {
  std::fprintf(stderr, "windwatch: KeyListener: %s failed: %s, ending session\n", what, std::strerror(err));
  int mine = wake_fd_;
  g_interrupt_fd.compare_exchange_strong(mine, -1);
  cancel_.request_stop();
}

KeyListener::KeyEvent KeyListener::read_keys() {
  unsigned char buf[64];
  ssize_t n = ::read(fd_, buf, sizeof(buf));
  if (n > 0) {
    return contains_exit_key(buf, static_cast<size_t>(n)) ? KeyEvent::ExitKey : KeyEvent::Pending;
  }
  if (n == 0) return KeyEvent::Closed;
  if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return KeyEvent::Pending;
  return KeyEvent::Failed;
}

void KeyListener::run_uring(std::stop_token st) {
  auto submit_poll = [&](int fd, PollTag tag) {
    struct io_uring_sqe* sqe = io_uring_get_sqe(&ring_);
    if (!sqe) return;
    io_uring_prep_poll_add(sqe, fd, POLLIN);
    io_uring_sqe_set_data64(sqe, static_cast<uint64_t>(tag));
  };

  submit_poll(fd_, PollTag::Key);
  submit_poll(wake_fd_, PollTag::Wake);
  io_uring_submit(&ring_);

  while (!st.stop_requested()) {
    struct io_uring_cqe* cqe = nullptr;
    int ret = io_uring_wait_cqe(&ring_, &cqe);
    if (ret < 0) {
      if (ret == -EINTR) continue;
      fail("io_uring_wait_cqe", -ret);
      return;
    }

    auto tag = static_cast<PollTag>(io_uring_cqe_get_data64(cqe));
    int res = cqe->res;
    io_uring_cqe_seen(&ring_, cqe);

    if (tag == PollTag::Wake) {
      on_wake(st);
      return;
    }
    if (tag != PollTag::Key) continue;
    if (res < 0) {
      fail("poll on key fd", -res);
      return;
    }

    switch (read_keys()) {
      case KeyEvent::ExitKey:
        cancel_.request_stop();
        return;
      case KeyEvent::Failed:
        fail("read", errno);
        return;
      case KeyEvent::Closed:
        // EOF: nothing more will arrive, wait for the wake fd only.
        continue;
      case KeyEvent::Pending:
        break;
    }
    submit_poll(fd_, PollTag::Key);
    io_uring_submit(&ring_);
  }
}

void KeyListener::run_poll(std::stop_token st) {
  struct pollfd fds[2] = {
    {.fd = fd_, .events = POLLIN, .revents = 0},
    {.fd = wake_fd_, .events = POLLIN, .revents = 0},
  };

  while (!st.stop_requested()) {
    int rv = ::poll(fds, 2, -1);
    if (rv < 0) {
      if (errno == EINTR) continue;
      fail("poll", errno);
      return;
    }

    if (fds[1].revents & POLLIN) {
      on_wake(st);
      return;
    }
    short key = fds[0].revents;
    if (key & POLLNVAL) {
      fail("poll on key fd", EBADF);
      return;
    }
    if (!(key & (POLLIN | POLLHUP | POLLERR))) continue;

    switch (read_keys()) {
      case KeyEvent::ExitKey:
        cancel_.request_stop();
        return;
      case KeyEvent::Failed:
        fail("read", errno);
        return;
      case KeyEvent::Closed:
        fds[0].fd = -1;  // poll() skips negative fds
        break;
      case KeyEvent::Pending:
        break;
    }
  }
}

} // namespace windwatch::ui
