#include "ui/Formatting.hpp"
#include <algorithm>

namespace windwatch::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i=0; i<s.size();){
    // Skip ANSI escape sequences
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++; // skip final byte
      continue;
    }
    int len = u8_len((unsigned char)s[i]);
    i += len;
    cols += 1;
  }
  return cols;
}

std::string repeat_char(char ch, int n) {
  return std::string(static_cast<size_t>(std::max(0, n)), ch);
}

std::string pad_right(const std::string& s, int w) {
  int cols = display_cols(s);
  if (cols >= w) return s;
  return s + std::string(w - cols, ' ');
}

// "|   text   |" spanning row_width columns; odd slack goes to the right.
std::string centered_row(int row_width, const std::string& text) {
  int inner = row_width - 2;
  int left = std::max(0, (inner - display_cols(text)) / 2);
  std::string row = "|" + repeat_char(' ', left) + text;
  return pad_right(row, row_width - 1) + "|";
}

} // namespace windwatch::ui
