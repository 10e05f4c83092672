#pragma once

#include <functional>
#include <string_view>
#include "data/IReadingSource.hpp"
#include "model/DashboardState.hpp"
#include "util/Timestamp.hpp"

namespace windwatch::app {

enum class RedrawKind { Full, Partial };

// Owns the dashboard state and turns each scheduler tick into one frame.
class Dashboard {
public:
  using FrameSink = std::function<void(std::string_view)>;

  Dashboard(data::IReadingSource& source, float historical_max, FrameSink sink);

  // Full redraw when the countdown has run out (always on the first tick),
  // partial otherwise. Reading failures propagate.
  RedrawKind tick(util::SysTime now);

  [[nodiscard]] const model::DashboardState& state() const { return state_; }

private:
  data::IReadingSource& source_;
  model::DashboardState state_;
  FrameSink sink_;
};

} // namespace windwatch::app
