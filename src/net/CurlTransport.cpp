#include "net/CurlTransport.hpp"
#include "net/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <mutex>
#include <string_view>

namespace windwatch::net {

static std::once_flag g_curl_init;

CurlTransport::CurlTransport(std::chrono::seconds timeout)
    : handle_(nullptr, &curl_easy_cleanup), timeout_(timeout) {
  std::call_once(g_curl_init, []{ curl_global_init(CURL_GLOBAL_DEFAULT); });
  handle_.reset(curl_easy_init());
  if (!handle_) throw TransportError("curl_easy_init() failed");
}

size_t CurlTransport::write_cb(char* data, size_t size, size_t nmemb, void* userp) {
  auto* body = static_cast<std::string*>(userp);
  body->append(data, size * nmemb);
  return size * nmemb;
}

// Called once per header line, status line included.
size_t CurlTransport::header_cb(char* data, size_t size, size_t nmemb, void* userp) {
  auto* headers = static_cast<std::unordered_map<std::string, std::string>*>(userp);
  std::string_view line(data, size * nmemb);
  // A new status line starts a new response (redirect hop); keep only the last.
  if (line.starts_with("HTTP/")) {
    headers->clear();
    return size * nmemb;
  }
  auto colon = line.find(':');
  if (colon == std::string_view::npos) return size * nmemb;
  std::string name(line.substr(0, colon));
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  std::string_view value = line.substr(colon + 1);
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) value.remove_prefix(1);
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) value.remove_suffix(1);
  (*headers)[name] = std::string(value);
  return size * nmemb;
}

HttpResponse CurlTransport::get(const std::string& url, const std::vector<std::string>& headers) {
  CURL* c = handle_.get();
  curl_easy_reset(c);

  curl_slist* list = nullptr;
  for (const auto& h : headers) list = curl_slist_append(list, h.c_str());
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_list(list, &curl_slist_free_all);

  HttpResponse resp;
  curl_easy_setopt(c, CURLOPT_URL, url.c_str());
  curl_easy_setopt(c, CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(c, CURLOPT_HTTPHEADER, header_list.get());
  curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, &CurlTransport::write_cb);
  curl_easy_setopt(c, CURLOPT_WRITEDATA, static_cast<void*>(&resp.body));
  curl_easy_setopt(c, CURLOPT_HEADERFUNCTION, &CurlTransport::header_cb);
  curl_easy_setopt(c, CURLOPT_HEADERDATA, static_cast<void*>(&resp.headers));
  curl_easy_setopt(c, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
  curl_easy_setopt(c, CURLOPT_FAILONERROR, 0L);  // status handling belongs to Fetcher
  curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(c, CURLOPT_USERAGENT, "windwatch/1.0");

  CURLcode rc = curl_easy_perform(c);
  if (rc != CURLE_OK) {
    throw TransportError(std::string("GET ") + url + " failed: " + curl_easy_strerror(rc));
  }
  long code = 0;
  curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &code);
  resp.status = code;
  return resp;
}

} // namespace windwatch::net
