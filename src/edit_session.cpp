#include "edit_session.hpp"
#include <algorithm>

static inline bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

void EditSession::begin(CellPos pos, std::string seed) {
  target_ = pos;
  buffer_ = std::move(seed);
  caret_ = static_cast<int>(buffer_.size());
}

std::optional<CellPos> EditSession::commit(Grid& grid) {
  if (!target_) return std::nullopt;
  CellPos pos = *target_;
  bool ok = grid.has_cell(pos.row, pos.col);
  if (ok) grid.set_cell(pos.row, pos.col, buffer_);
  cancel();
  if (!ok) return std::nullopt;
  return pos;
}

void EditSession::cancel() {
  target_.reset();
  buffer_.clear();
  caret_ = 0;
}

void EditSession::insert_text(const std::string& s) {
  if (!target_) return;
  caret_ = std::clamp(caret_, 0, static_cast<int>(buffer_.size()));
  buffer_.insert(static_cast<size_t>(caret_), s);
  caret_ += static_cast<int>(s.size());
}

void EditSession::backspace() {
  if (!target_ || caret_ <= 0) return;
  int start = caret_ - 1;
  while (start > 0 && is_continuation(static_cast<unsigned char>(buffer_[start]))) start--;
  buffer_.erase(static_cast<size_t>(start), static_cast<size_t>(caret_ - start));
  caret_ = start;
}

void EditSession::delete_forward() {
  int n = static_cast<int>(buffer_.size());
  if (!target_ || caret_ >= n) return;
  int end = caret_ + 1;
  while (end < n && is_continuation(static_cast<unsigned char>(buffer_[end]))) end++;
  buffer_.erase(static_cast<size_t>(caret_), static_cast<size_t>(end - caret_));
}

void EditSession::move_caret(int delta) {
  int n = static_cast<int>(buffer_.size());
  int step = delta < 0 ? -1 : 1;
  for (int i = 0; i != delta; i += step) {
    int next = caret_ + step;
    if (next < 0 || next > n) break;
    while (next > 0 && next < n && is_continuation(static_cast<unsigned char>(buffer_[next]))) next += step;
    caret_ = next;
  }
}

void EditSession::on_row_inserted(int row) {
  if (target_ && target_->row >= row) target_->row++;
}

void EditSession::on_row_removed(int row) {
  if (!target_) return;
  if (target_->row == row) cancel();
  else if (target_->row > row) target_->row--;
}

void EditSession::on_column_inserted(int col) {
  if (target_ && target_->col >= col) target_->col++;
}

void EditSession::on_column_removed(int col) {
  if (!target_) return;
  if (target_->col == col) cancel();
  else if (target_->col > col) target_->col--;
}
