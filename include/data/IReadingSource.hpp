#pragma once
#include "model/Reading.hpp"

namespace windwatch::data {

// Source of the latest reading, consumed by the dashboard on every full redraw.
class IReadingSource {
public:
  virtual ~IReadingSource() = default;

  // Throws on any failure; there is no stale-data fallback.
  [[nodiscard]] virtual model::Reading latest() = 0;
};

} // namespace windwatch::data
