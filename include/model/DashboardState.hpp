#pragma once
#include <chrono>
#include <string>

namespace windwatch::model {

// Geometry cached by the last full redraw and reused by partial redraws.
// Empty until the first full redraw.
struct LayoutStrings {
  int table_width{0};
  int left_col_w{0};            // text cell width of the left split column
  int right_col_w{0};           // text cell width of the right split column
  std::string split_row_separator;
  std::string row_separator;

  [[nodiscard]] bool populated() const { return table_width > 0 && !split_row_separator.empty(); }
};

struct DashboardState {
  float max_power{0.0f};                          // never decreases after startup
  std::chrono::milliseconds next_update_in{0};    // <= 0 forces a full redraw
  std::string last_update_end;                    // raw endTime of the last reading
  LayoutStrings layout;
};

} // namespace windwatch::model
