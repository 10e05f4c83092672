#include "net/Fetcher.hpp"
#include "net/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <condition_variable>
#include <mutex>
#include <cstdio>
#include <vector>

namespace windwatch::net {

Fetcher::Fetcher(IHttpTransport& transport, std::string api_key, Sleeper sleeper, int max_retries,
                 std::stop_token stop)
    : transport_(transport), api_key_(std::move(api_key)), sleeper_(std::move(sleeper)),
      max_retries_(max_retries), stop_(std::move(stop)) {
  if (!sleeper_) {
    sleeper_ = [st = stop_](std::chrono::seconds d){
      std::mutex mu;
      std::condition_variable_any cv;
      std::unique_lock<std::mutex> lk(mu);
      cv.wait_for(lk, st, d, []{ return false; });
    };
  }
}

std::optional<std::chrono::seconds> parse_retry_after(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) value.remove_prefix(1);
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) value.remove_suffix(1);
  if (!value.empty() && value.front() == '+') value.remove_prefix(1);
  if (value.empty()) return std::nullopt;
  int secs = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), secs);
  if (ec != std::errc{} || ptr != value.data() + value.size() || secs < 0) return std::nullopt;
  return std::chrono::seconds(secs);
}

static bool is_blank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isspace(c) != 0; });
}

std::string Fetcher::fetch(const std::string& url) const {
  std::vector<std::string> headers;
  if (!api_key_.empty()) headers.push_back("x-api-key: " + api_key_);

  RetryContext retry{0, max_retries_};
  while (true) {
    HttpResponse resp;
    try {
      resp = transport_.get(url, headers);
    } catch (const TransportError& e) {
      std::fprintf(stderr, "windwatch: fetcher: HTTP request to %s failed: %s\n", url.c_str(), e.what());
      throw;
    }

    if (resp.status == kTooManyRequests && retry.can_retry()) {
      const std::string* hint = resp.header("retry-after");
      if (hint) {
        if (auto delay = parse_retry_after(*hint)) {
          ++retry.attempt;
          std::fprintf(stderr, "windwatch: fetcher: rate limited, retrying in %llds (attempt %d/%d)\n",
                       static_cast<long long>(delay->count()), retry.attempt, retry.max_attempts);
          sleeper_(*delay);
          if (stop_.stop_requested()) {
            throw CancelledError("request to " + url + " cancelled while rate limited");
          }
          continue;
        }
      }
    }

    if (resp.status < 200 || resp.status > 299) {
      std::fprintf(stderr, "windwatch: fetcher: HTTP request to %s failed: status %ld\n",
                   url.c_str(), resp.status);
      throw TransportError("HTTP status " + std::to_string(resp.status) + " from " + url, resp.status);
    }

    if (is_blank(resp.body)) {
      throw EmptyResponseError("response body from " + url + " is empty");
    }
    return std::move(resp.body);
  }
}

} // namespace windwatch::net
