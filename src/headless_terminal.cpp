#include "headless_terminal.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
  : rows_(rows), cols_(cols),
    screen_(static_cast<size_t>(rows), std::string(static_cast<size_t>(cols), ' ')),
    attrs_(static_cast<size_t>(rows), std::string(static_cast<size_t>(cols), ' ')) {}

void HeadlessTerminal::clear() {
  for (auto& s : screen_) s.assign(static_cast<size_t>(cols_), ' ');
  for (auto& a : attrs_) a.assign(static_cast<size_t>(cols_), ' ');
}

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  put(row, col, text, static_cast<char>('0' + color_pair_id % 10));
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_) return;
  for (int c = std::max(0, col); c < cols_; ++c) {
    screen_[row][c] = ' ';
    attrs_[row][c] = ' ';
  }
}

void HeadlessTerminal::put(int row, int col, const std::string& text, char attr) {
  if (row < 0 || row >= rows_) return;
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + static_cast<int>(i);
    if (c < 0) continue;
    if (c >= cols_) break;
    screen_[row][c] = text[i];
    attrs_[row][c] = attr;
  }
}
