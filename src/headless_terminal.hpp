#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal used by tests to assert on rendered output.
 * Model: a rows x cols character screen plus a parallel attribute screen
 *        (' ' plain, 'R' reversed, digit = color pair id).
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override { put(row, col, text, ' '); }
  void draw_reversed(int row, int col, const std::string& text) override { put(row, col, text, 'R'); }
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void set_cursor_visible(bool visible) override { cursor_visible_ = visible; }
  void refresh() override { refresh_count_++; }
  void clear_to_eol(int row, int col) override;
  void set_mouse_tracking(bool on) override { mouse_tracking_ = on; }

  const std::string& line(int row) const { return screen_.at(row); }
  char attr_at(int row, int col) const { return attrs_.at(row).at(col); }
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  bool cursor_visible() const { return cursor_visible_; }
  int refresh_count() const { return refresh_count_; }
  bool mouse_tracking() const { return mouse_tracking_; }

private:
  void put(int row, int col, const std::string& text, char attr);
  int rows_;
  int cols_;
  std::vector<std::string> screen_;
  std::vector<std::string> attrs_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  bool cursor_visible_ = true;
  int refresh_count_ = 0;
  bool mouse_tracking_ = false;
};
