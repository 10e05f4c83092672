#pragma once
#include <string>
#include "data/IReadingSource.hpp"
#include "net/Fetcher.hpp"
#include "util/Timestamp.hpp"

namespace windwatch::data {

struct ApiEndpoints {
  std::string base_url{"https://data.fingrid.fi/api/datasets"};
  int dataset{181};       // wind power generation, 3 min resolution
  int page_size{20000};   // provider maximum
};

// Fingrid open-data accessors built on the retrying Fetcher.
class GenerationApi : public IReadingSource {
public:
  GenerationApi(const net::Fetcher& fetcher, ApiEndpoints endpoints);

  // Maximum value over [now - 1 month, now], first page only.
  // Throws MalformedResponseError, HistoricalDataNotFoundError or a fetch error.
  [[nodiscard]] float historical_max(util::SysTime now) const;

  // Throws MalformedResponseError or a fetch error.
  [[nodiscard]] model::Reading latest() override;

  [[nodiscard]] std::string history_url(util::SysTime now) const;
  [[nodiscard]] std::string latest_url() const;

private:
  [[nodiscard]] std::string dataset_url() const;

  const net::Fetcher& fetcher_;
  ApiEndpoints endpoints_;
};

// Body parsers, exposed for tests.
[[nodiscard]] float parse_historical_max(const std::string& body, int page_size);
[[nodiscard]] model::Reading parse_latest(const std::string& body);

} // namespace windwatch::data
