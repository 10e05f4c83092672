#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include "net/IHttpTransport.hpp"

namespace windwatch::net {

// Per-call retry bookkeeping; discarded when fetch() returns or throws.
struct RetryContext {
  int attempt{0};
  int max_attempts{2};
  [[nodiscard]] bool can_retry() const { return attempt < max_attempts; }
};

// GET with bounded retry on 429 Too Many Requests, honoring Retry-After (seconds).
// Everything else fails fast:
//   transport failure or non-2xx status  -> TransportError
//   2xx with a blank body                -> EmptyResponseError
//   cancelled during a rate-limit wait   -> CancelledError
class Fetcher {
public:
  using Sleeper = std::function<void(std::chrono::seconds)>;

  static constexpr int kMaxRetries = 2;
  static constexpr long kTooManyRequests = 429;

  // An empty api_key sends no x-api-key header. The default sleeper blocks the
  // calling thread until the delay passes or `stop` is requested.
  Fetcher(IHttpTransport& transport, std::string api_key, Sleeper sleeper = {},
          int max_retries = kMaxRetries, std::stop_token stop = {});

  [[nodiscard]] std::string fetch(const std::string& url) const;

private:
  IHttpTransport& transport_;
  std::string api_key_;
  Sleeper sleeper_;
  int max_retries_;
  std::stop_token stop_;
};

// Delay-seconds form of Retry-After. HTTP-date values and negatives are rejected.
[[nodiscard]] std::optional<std::chrono::seconds> parse_retry_after(std::string_view value);

} // namespace windwatch::net
