#pragma once
#include <chrono>
#include <memory>
#include <curl/curl.h>
#include "net/IHttpTransport.hpp"

namespace windwatch::net {

// libcurl easy-handle transport. The handle is reused across requests so
// keep-alive connections survive between polls; not safe for concurrent use.
class CurlTransport : public IHttpTransport {
public:
  explicit CurlTransport(std::chrono::seconds timeout = std::chrono::seconds(30));
  CurlTransport(const CurlTransport&) = delete;
  CurlTransport& operator=(const CurlTransport&) = delete;

  [[nodiscard]] HttpResponse get(const std::string& url,
                                 const std::vector<std::string>& headers) override;

private:
  static size_t write_cb(char* data, size_t size, size_t nmemb, void* userp);
  static size_t header_cb(char* data, size_t size, size_t nmemb, void* userp);

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle_;
  std::chrono::seconds timeout_;
};

} // namespace windwatch::net
