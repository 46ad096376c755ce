#pragma once
/*
 * ColumnWidths
 *
 * Purpose: sparse column -> display width map with a fixed default.
 * Note: keys follow column identity across structural edits (shift on insert/remove).
 */
#include <map>

class ColumnWidths {
public:
  explicit ColumnWidths(int default_width);

  int get(int col) const;
  void set(int col, int width);
  bool has(int col) const { return widths_.count(col) != 0; }
  void clear() { widths_.clear(); }
  int default_width() const { return default_width_; }
  int size() const { return static_cast<int>(widths_.size()); }

  void on_column_inserted(int col);
  void on_column_removed(int col);

private:
  int default_width_;
  std::map<int, int> widths_;
};
