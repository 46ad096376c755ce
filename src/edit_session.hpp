#pragma once
/*
 * EditSession
 *
 * Purpose: single-cell edit buffer lifecycle (Idle <-> Editing(row,col,buffer)).
 * Commit writes the buffer verbatim into the target cell; cancel discards it.
 * Structural edits call the on_* hooks so the target keeps pointing at the same cell.
 */
#include <optional>
#include <string>
#include "types.hpp"
#include "grid.hpp"

class EditSession {
public:
  bool active() const { return target_.has_value(); }
  std::optional<CellPos> target() const { return target_; }
  const std::string& buffer() const { return buffer_; }
  int caret() const { return caret_; }
  bool is_editing(int row, int col) const { return target_ && target_->row == row && target_->col == col; }

  void begin(CellPos pos, std::string seed);
  // returns the cell written, nullopt when idle or the target vanished
  std::optional<CellPos> commit(Grid& grid);
  void cancel();

  void insert_text(const std::string& s);
  void backspace();
  void delete_forward();
  void move_caret(int delta);
  void caret_home() { caret_ = 0; }
  void caret_end() { caret_ = static_cast<int>(buffer_.size()); }

  void on_row_inserted(int row);
  void on_row_removed(int row);
  void on_column_inserted(int col);
  void on_column_removed(int col);

private:
  std::optional<CellPos> target_;
  std::string buffer_;
  int caret_ = 0;
};
