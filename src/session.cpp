#include "session.hpp"
#include <algorithm>
#include "clipboard_codec.hpp"
#include "sorter.hpp"
#include "config.hpp"

Session::Session()
  : grid_(Grid::blank(MG_DEFAULT_ROWS, MG_DEFAULT_COLS)),
    history_(MG_UNDO_LIMIT),
    widths_(MG_DEFAULT_COLUMN_WIDTH) {}

void Session::reset_transient() {
  selection_ = NoSelection{};
  edit_.cancel();
  history_.clear();
  widths_.clear();
  search_.clear();
  sort_marker_.reset();
  drag_anchor_.reset();
  last_cursor_ = {};
}

void Session::new_document() {
  grid_.reset(MG_DEFAULT_ROWS, MG_DEFAULT_COLS);
  reset_transient();
  file_path_.reset();
  dirty_ = false;
}

void Session::load_rows(Rows rows, std::optional<std::filesystem::path> name) {
  grid_.assign(std::move(rows));
  grid_.normalize();
  reset_transient();
  file_path_ = std::move(name);
  dirty_ = false;
}

void Session::mark_saved(const std::filesystem::path& path) {
  file_path_ = path;
  dirty_ = false;
}

CellPos Session::cursor() const {
  if (auto t = edit_.target()) return *t;
  return std::visit(overloaded{
    [this](const NoSelection&) { return last_cursor_; },
    [](const CellRange& r) { return r.end; },
    [this](const ColumnSelection& c) { return CellPos{last_cursor_.row, c.col}; },
    [this](const RowSelection& r) { return CellPos{r.row, last_cursor_.col}; },
  }, selection_);
}

void Session::focus_cell(CellPos pos) {
  commit_edit();
  selection_ = single_cell(pos.row, pos.col);
  last_cursor_ = pos;
}

void Session::select_cell(int row, int col) {
  focus_cell({row, col});
  drag_anchor_ = CellPos{row, col};
}

void Session::select_range(CellPos start, CellPos end) {
  commit_edit();
  selection_ = CellRange{start, end};
  last_cursor_ = end;
}

void Session::drag_to(int row, int col) {
  if (!drag_anchor_) return;
  selection_ = CellRange{*drag_anchor_, {row, col}};
  last_cursor_ = {row, col};
}

void Session::select_row(int row) {
  commit_edit();
  selection_ = RowSelection{row};
  last_cursor_.row = row;
  drag_anchor_.reset();
}

void Session::select_column(int col) {
  commit_edit();
  selection_ = ColumnSelection{col};
  last_cursor_.col = col;
  drag_anchor_.reset();
}

void Session::select_all() {
  if (edit_.active()) return;
  if (auto all = ::select_all(grid_)) selection_ = *all;
}

void Session::escape() {
  if (edit_.active()) { cancel_edit(); return; }
  selection_ = NoSelection{};
  drag_anchor_.reset();
}

bool Session::move(int drow, int dcol, bool extend) {
  if (edit_.active()) return false;
  int rows = grid_.row_count();
  int cols = grid_.col_count();
  if (rows == 0 || cols == 0) return false;
  // row, column and empty selections move from the cursor they remember
  CellPos current = cursor();
  current = {std::clamp(current.row, 0, rows - 1), std::clamp(current.col, 0, cols - 1)};
  CellPos anchor = current;
  if (const auto* r = std::get_if<CellRange>(&selection_)) {
    anchor = r->start;
    current = r->end;
  }
  CellPos next{std::clamp(current.row + drow, 0, rows - 1), std::clamp(current.col + dcol, 0, cols - 1)};
  selection_ = extend ? Selection{CellRange{anchor, next}} : single_cell(next.row, next.col);
  last_cursor_ = next;
  return true;
}

bool Session::begin_edit(int row, int col) {
  if (!grid_.has_cell(row, col)) return false;
  if (edit_.is_editing(row, col)) return true;
  commit_edit();
  edit_.begin({row, col}, grid_.cell(row, col));
  selection_ = NoSelection{};
  drag_anchor_.reset();
  last_cursor_ = {row, col};
  return true;
}

bool Session::begin_edit_at_selection() {
  if (edit_.active() || !is_single_cell(selection_)) return false;
  CellPos p = std::get<CellRange>(selection_).start;
  return begin_edit(p.row, p.col);
}

bool Session::type_text(const std::string& text) {
  if (text.empty()) return false;
  if (edit_.active()) { edit_.insert_text(text); return true; }
  if (!is_single_cell(selection_)) return false;
  CellPos p = std::get<CellRange>(selection_).start;
  if (!grid_.has_cell(p.row, p.col)) return false;
  edit_.begin(p, text);
  selection_ = NoSelection{};
  drag_anchor_.reset();
  last_cursor_ = p;
  return true;
}

bool Session::commit_edit() {
  auto target = edit_.target();
  if (!target) return false;
  std::string before = grid_.cell(target->row, target->col);
  auto written = edit_.commit(grid_);
  if (!written) return false;
  dirty_ = true;
  if (sort_marker_ && sort_marker_->col == written->col && grid_.cell(written->row, written->col) != before) {
    invalidate_sort();
  }
  return true;
}

void Session::cancel_edit() {
  edit_.cancel();
}

bool Session::confirm() {
  auto target = edit_.target();
  if (!target) return false;
  commit_edit();
  int rows = grid_.row_count();
  if (rows == 0) return true;
  focus_cell({std::clamp(target->row + 1, 0, rows - 1), target->col});
  return true;
}

void Session::delete_selection() {
  if (edit_.active() || std::holds_alternative<NoSelection>(selection_)) return;
  save_undo_state();
  clear_cells(selection_, grid_);
  invalidate_sort();
}

std::string Session::copy() const {
  if (edit_.active()) return std::string();
  return extract_text(grid_, selection_);
}

std::string Session::cut() {
  if (edit_.active()) return std::string();
  save_undo_state();
  std::string text = extract_text(grid_, selection_);
  if (!text.empty()) {
    clear_cells(selection_, grid_);
    invalidate_sort();
  }
  return text;
}

void Session::paste(const std::string& text) {
  if (edit_.active() || text.empty()) return;
  save_undo_state();
  paste_text(grid_, text, paste_anchor(selection_));
  invalidate_sort();
}

void Session::add_row() {
  save_undo_state();
  grid_.add_row();
  invalidate_sort();
}

void Session::add_column() {
  save_undo_state();
  grid_.add_column();
  invalidate_sort();
}

bool Session::insert_row_at(int row) {
  if (row < 0 || row > grid_.row_count()) return false;
  save_undo_state();
  grid_.insert_row_at(row);
  edit_.on_row_inserted(row);
  invalidate_sort();
  return true;
}

bool Session::insert_column_at(int col) {
  if (col < 0 || col > grid_.col_count()) return false;
  save_undo_state();
  grid_.insert_column_at(col);
  edit_.on_column_inserted(col);
  widths_.on_column_inserted(col);
  invalidate_sort();
  return true;
}

bool Session::delete_row(int row) {
  if (row < 0 || row >= grid_.row_count()) return false;
  save_undo_state();
  grid_.delete_row(row);
  edit_.on_row_removed(row);
  invalidate_sort();
  return true;
}

bool Session::delete_column(int col) {
  if (col < 0 || col >= grid_.col_count()) return false;
  save_undo_state();
  grid_.delete_column(col);
  edit_.on_column_removed(col);
  widths_.on_column_removed(col);
  invalidate_sort();
  return true;
}

bool Session::sort_by_column(int col, bool ascending) {
  commit_edit();
  if (grid_.empty() || col < 0 || col >= grid_.col_count()) return false;
  save_undo_state();
  sort_rows_by_column(grid_, col, ascending, frozen_header_);
  sort_marker_ = SortMarker{col, ascending};
  return true;
}

bool Session::clear_cell(int row, int col) {
  if (!grid_.has_cell(row, col)) return false;
  save_undo_state();
  grid_.set_cell(row, col, std::string());
  invalidate_sort();
  return true;
}

void Session::save_undo_state() {
  history_.save(grid_);
  dirty_ = true;
}

bool Session::undo() {
  commit_edit();
  if (!history_.undo(grid_)) return false;
  dirty_ = true;
  invalidate_sort();
  return true;
}

bool Session::redo() {
  commit_edit();
  if (!history_.redo(grid_)) return false;
  dirty_ = true;
  invalidate_sort();
  return true;
}

int Session::find(const std::string& query) {
  commit_edit();
  search_.perform(grid_, query, case_sensitive_);
  if (auto first = search_.current()) focus_cell(*first);
  return static_cast<int>(search_.results().size());
}

bool Session::next_result() {
  auto pos = search_.next();
  if (!pos) return false;
  focus_cell(*pos);
  return true;
}

bool Session::prev_result() {
  auto pos = search_.prev();
  if (!pos) return false;
  focus_cell(*pos);
  return true;
}
