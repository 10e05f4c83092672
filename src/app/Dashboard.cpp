#include "app/Dashboard.hpp"
#include "ui/Renderer.hpp"

namespace windwatch::app {

Dashboard::Dashboard(data::IReadingSource& source, float historical_max, FrameSink sink)
    : source_(source), sink_(std::move(sink)) {
  state_.max_power = historical_max;
}

RedrawKind Dashboard::tick(util::SysTime now) {
  if (state_.next_update_in.count() <= 0) {
    auto reading = source_.latest();
    sink_(ui::render_full(state_, reading, now));
    return RedrawKind::Full;
  }
  sink_(ui::render_partial(state_, now));
  return RedrawKind::Partial;
}

} // namespace windwatch::app
