#pragma once

#include <chrono>
#include <string>
#include "model/DashboardState.hpp"
#include "model/Reading.hpp"
#include "util/Timestamp.hpp"

namespace windwatch::ui {

inline constexpr int kGaugeSteps = 12;
inline constexpr int kMinTableWidth = 23;
inline constexpr int kTimeAreaRows = 4;  // Time, separator, Update, separator
inline constexpr auto kDataWindow = std::chrono::minutes(3);

// floor(value / max_power * kGaugeSteps) clamped to [0, kGaugeSteps]; 0 when max_power <= 0.
[[nodiscard]] int gauge_bar_length(float value, float max_power);

// kGaugeSteps cells: "-----x      " for length 6, all blanks for 0.
[[nodiscard]] std::string gauge_bar(int length);

// "| left    | right     |" using the cached column widths.
[[nodiscard]] std::string split_row(const model::LayoutStrings& layout,
                                    const std::string& left, const std::string& right);

// Recompute geometry from `reading`, update max_power, layout and last_update_end,
// and return the whole table followed by the time rows. The cursor is left on the
// first time row so later partial frames overwrite only that area.
[[nodiscard]] std::string render_full(model::DashboardState& state,
                                      const model::Reading& reading,
                                      util::SysTime now);

// Update next_update_in and return the time rows only, cursor moved back over them.
// Throws std::logic_error if no full redraw has populated the state yet.
[[nodiscard]] std::string render_partial(model::DashboardState& state, util::SysTime now);

} // namespace windwatch::ui
