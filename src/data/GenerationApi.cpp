#include "data/GenerationApi.hpp"
#include "net/Errors.hpp"
#include <algorithm>
#include <exception>
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace windwatch::data {

GenerationApi::GenerationApi(const net::Fetcher& fetcher, ApiEndpoints endpoints)
    : fetcher_(fetcher), endpoints_(std::move(endpoints)) {
  while (!endpoints_.base_url.empty() && endpoints_.base_url.back() == '/')
    endpoints_.base_url.pop_back();
}

std::string GenerationApi::dataset_url() const {
  return endpoints_.base_url + "/" + std::to_string(endpoints_.dataset) + "/data";
}

std::string GenerationApi::history_url(util::SysTime now) const {
  return dataset_url() +
         "?startTime=" + util::format_rfc3339_utc(util::months_before(now, 1)) +
         "&endTime=" + util::format_rfc3339_utc(now) +
         "&pageSize=" + std::to_string(endpoints_.page_size) +
         "&sortOrder=asc";
}

std::string GenerationApi::latest_url() const {
  return dataset_url() + "/latest";
}

static json parse_body(const std::string& body, const char* what) {
  try {
    return json::parse(body);
  } catch (const json::parse_error&) {
    std::throw_with_nested(net::MalformedResponseError(std::string(what) + ": response is not valid JSON"));
  }
}

float parse_historical_max(const std::string& body, int page_size) {
  json j = parse_body(body, "historical data");

  const json* total = nullptr;
  const json* data = nullptr;
  if (j.is_object()) {
    auto pit = j.find("pagination");
    if (pit != j.end() && pit->is_object()) {
      auto tit = pit->find("total");
      if (tit != pit->end() && tit->is_number()) total = &*tit;
    }
    auto dit = j.find("data");
    if (dit != j.end() && dit->is_array()) data = &*dit;
  }
  if (!total || !data) {
    throw net::MalformedResponseError("historical data: pagination.total or data array missing");
  }

  // Capped at the page size in floating point, so any JSON number converts safely.
  double declared = total->get<double>();
  long long count = declared >= page_size ? page_size : static_cast<long long>(std::max(declared, 0.0));
  if (count <= 0 || data->empty() || (*data)[0].is_null()) {
    throw net::HistoricalDataNotFoundError("historical data: no observations to derive the maximum from");
  }

  // The declared total may exceed the returned page; indices past the end count as 0.
  float max_power = 0.0f;
  for (long long i = 0; i < count; ++i) {
    float power = 0.0f;
    if (static_cast<size_t>(i) < data->size()) {
      const json& el = (*data)[static_cast<size_t>(i)];
      if (el.is_object()) {
        auto vit = el.find("value");
        if (vit != el.end() && vit->is_number()) power = vit->get<float>();
      }
    }
    if (power > max_power) max_power = power;
  }
  return max_power;
}

model::Reading parse_latest(const std::string& body) {
  json j = parse_body(body, "latest data");

  if (!j.is_object()) throw net::MalformedResponseError("latest data: expected a JSON object");
  auto eit = j.find("endTime");
  auto vit = j.find("value");
  if (eit == j.end() || !eit->is_string() || vit == j.end() || !vit->is_number()) {
    throw net::MalformedResponseError("latest data: endTime or value missing");
  }

  model::Reading r;
  r.end_time = eit->get<std::string>();
  r.value = vit->get<float>();
  auto parsed = util::parse_rfc3339(r.end_time);
  if (!parsed) {
    throw net::MalformedResponseError("latest data: endTime '" + r.end_time + "' is not an RFC 3339 timestamp");
  }
  r.observed_at = *parsed;
  return r;
}

float GenerationApi::historical_max(util::SysTime now) const {
  return parse_historical_max(fetcher_.fetch(history_url(now)), endpoints_.page_size);
}

model::Reading GenerationApi::latest() {
  return parse_latest(fetcher_.fetch(latest_url()));
}

} // namespace windwatch::data
