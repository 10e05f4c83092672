#pragma once

#include <stdexcept>
#include <string>

namespace windwatch::net {

// Network failure (status 0) or a non-success HTTP status once retries are exhausted.
class TransportError : public std::runtime_error {
public:
  explicit TransportError(const std::string& what, long status = 0)
      : std::runtime_error(what), status_(status) {}
  [[nodiscard]] long status() const noexcept { return status_; }
private:
  long status_;
};

// 2xx status with an empty or whitespace-only body.
struct EmptyResponseError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Body is not JSON, or lacks a required field.
struct MalformedResponseError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Historical query succeeded but holds no observations.
struct HistoricalDataNotFoundError : public std::runtime_error { using std::runtime_error::runtime_error; };

// The session was cancelled while a request waited out a rate limit.
struct CancelledError : public std::runtime_error { using std::runtime_error::runtime_error; };

} // namespace windwatch::net
