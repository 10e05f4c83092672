#pragma once

#include <string>

namespace windwatch::ui {

// UTF-8 text width utilities (one column per codepoint, SGR sequences skipped)
int u8_len(unsigned char c);
int display_cols(const std::string& s);

// Table cell helpers. None of them truncate: an oversized cell widens its row.
std::string repeat_char(char ch, int n);
std::string pad_right(const std::string& s, int w);
std::string centered_row(int row_width, const std::string& text);

} // namespace windwatch::ui
