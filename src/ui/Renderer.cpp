#include "ui/Renderer.hpp"
#include "ui/Formatting.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

using namespace std::chrono;

namespace windwatch::ui {

// "| 0 |" + bar + "|" + max cell + "|"
static constexpr int kBarRowFixedCols = 5 + kGaugeSteps + 1 + 1;
static constexpr int kInstructionRows = 3;  // two instruction lines + bottom border

static const char* kClearHome = "\x1B[2J\x1B[H";

static std::string cursor_prev_lines(int n) {
  return "\x1B[" + std::to_string(n) + "F";
}

int gauge_bar_length(float value, float max_power) {
  if (!(max_power > 0.0f)) return 0;
  double ratio = static_cast<double>(value) / static_cast<double>(max_power);
  if (std::isnan(ratio)) return 0;
  double cells = std::floor(ratio * kGaugeSteps);
  return static_cast<int>(std::clamp(cells, 0.0, static_cast<double>(kGaugeSteps)));
}

std::string gauge_bar(int length) {
  length = std::clamp(length, 0, kGaugeSteps);
  if (length == 0) return repeat_char(' ', kGaugeSteps);
  return repeat_char('-', length - 1) + "x" + repeat_char(' ', kGaugeSteps - length);
}

std::string split_row(const model::LayoutStrings& layout, const std::string& left, const std::string& right) {
  return "| " + pad_right(left, layout.left_col_w) + "| " + pad_right(right, layout.right_col_w) + "|";
}

std::string render_full(model::DashboardState& state, const model::Reading& reading, util::SysTime now) {
  state.max_power = std::max(state.max_power, reading.value);

  const std::string max_text = util::format_float(state.max_power);
  const std::string power_text = util::format_float(reading.value) + " MW";

  // Width: the bar row or the minimum, then widened until the power value fits its column.
  int width = std::max(kBarRowFixedCols + display_cols(max_text) + 2, kMinTableWidth);
  while (width - (width / 2 + 3) < display_cols(power_text)) ++width;

  int middle = width / 2;
  int max_cell = width - kBarRowFixedCols;

  model::LayoutStrings layout;
  layout.table_width = width;
  layout.left_col_w = middle - 2;
  layout.right_col_w = width - (middle + 3);
  layout.split_row_separator = "|" + repeat_char('_', middle - 1) + "|" + repeat_char('_', width - (middle + 2)) + "|";
  const std::string line = repeat_char('_', width - 2);
  layout.row_separator = "|" + line + "|";

  const int bar_len = gauge_bar_length(reading.value, state.max_power);
  std::vector<std::string> rows;
  rows.push_back(" " + line + " ");
  rows.push_back(centered_row(width, util::format_date_utc(now) + " (UTC)"));
  rows.push_back(layout.row_separator);
  rows.push_back("| 0 |" + gauge_bar(bar_len) + "|" + pad_right(" " + max_text, max_cell) + "|");
  rows.push_back("|___|" + repeat_char('_', kGaugeSteps) + "|" + repeat_char('_', max_cell) + "|");
  rows.push_back(split_row(layout, "Power", power_text));
  rows.push_back(layout.split_row_separator);
  for (int i = 0; i < kTimeAreaRows; ++i) rows.emplace_back();
  rows.push_back(centered_row(width, "Press <Esc> or"));
  rows.push_back(centered_row(width, "\"q\" to quit"));
  rows.push_back(layout.row_separator);

  state.layout = std::move(layout);
  state.last_update_end = reading.end_time;

  std::string frame = kClearHome;
  for (const auto& r : rows) { frame += r; frame += '\n'; }
  frame += cursor_prev_lines(kTimeAreaRows + kInstructionRows);
  frame += render_partial(state, now);
  return frame;
}

std::string render_partial(model::DashboardState& state, util::SysTime now) {
  if (!state.layout.populated() || state.last_update_end.empty()) {
    throw std::logic_error("partial redraw requested before the first full redraw");
  }
  auto end = util::parse_rfc3339(state.last_update_end);
  if (!end) {
    throw std::runtime_error("last update end '" + state.last_update_end + "' is not a timestamp");
  }
  state.next_update_in = duration_cast<milliseconds>((*end + kDataWindow) - now);

  const auto& layout = state.layout;
  std::string out;
  out += split_row(layout, "Time", util::format_clock_utc(now));
  out += '\n';
  out += layout.split_row_separator;
  out += '\n';
  out += split_row(layout, "Update", util::format_countdown(state.next_update_in));
  out += '\n';
  out += layout.split_row_separator;
  out += '\n';
  out += cursor_prev_lines(kTimeAreaRows);
  return out;
}

} // namespace windwatch::ui
