#include "column_widths.hpp"
#include <algorithm>
#include "config.hpp"

ColumnWidths::ColumnWidths(int default_width)
  : default_width_(std::max(MG_MIN_COLUMN_WIDTH, default_width)) {}

int ColumnWidths::get(int col) const {
  auto it = widths_.find(col);
  return it == widths_.end() ? default_width_ : it->second;
}

void ColumnWidths::set(int col, int width) {
  if (col < 0) return;
  widths_[col] = std::max(MG_MIN_COLUMN_WIDTH, width);
}

void ColumnWidths::on_column_inserted(int col) {
  std::map<int, int> shifted;
  for (const auto& [idx, w] : widths_) shifted[idx >= col ? idx + 1 : idx] = w;
  widths_ = std::move(shifted);
}

void ColumnWidths::on_column_removed(int col) {
  widths_.erase(col);
  std::map<int, int> shifted;
  for (const auto& [idx, w] : widths_) shifted[idx > col ? idx - 1 : idx] = w;
  widths_ = std::move(shifted);
}
