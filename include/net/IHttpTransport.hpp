#pragma once
#include <string>
#include <unordered_map>
#include <vector>

namespace windwatch::net {

struct HttpResponse {
  long status{0};
  std::string body;
  // Header names are stored lowercased.
  std::unordered_map<std::string, std::string> headers;

  [[nodiscard]] const std::string* header(const std::string& lower_name) const {
    auto it = headers.find(lower_name);
    return it == headers.end() ? nullptr : &it->second;
  }
};

// Seam between the fetch/retry policy and the HTTP client library, so the
// policy can be exercised with scripted responses.
class IHttpTransport {
public:
  virtual ~IHttpTransport() = default;

  // Perform one GET. `headers` are full "Name: value" lines.
  // Throws TransportError when no HTTP response was received at all.
  [[nodiscard]] virtual HttpResponse get(const std::string& url,
                                         const std::vector<std::string>& headers) = 0;
};

} // namespace windwatch::net
