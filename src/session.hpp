#pragma once
/*
 * Session
 *
 * Purpose: the single editing session: grid, selection, edit buffer, history,
 *          column widths, search results and the advisory sort marker.
 * Design: every input-level operation is a method here; the front end only
 *         translates keys/mouse/commands into these calls and renders the state.
 * Rules: mutating ops snapshot history first (edit commits do not);
 *        clipboard/select-all/delete are ignored while a cell is being edited.
 */
#include <filesystem>
#include <optional>
#include <string>
#include "types.hpp"
#include "grid.hpp"
#include "selection.hpp"
#include "edit_session.hpp"
#include "history.hpp"
#include "column_widths.hpp"
#include "search_index.hpp"

class Session {
public:
  Session();

  // document
  void new_document();
  void load_rows(Rows rows, std::optional<std::filesystem::path> name);
  const Rows& rows() const { return grid_.rows(); }
  const Grid& grid() const { return grid_; }
  void mark_saved(const std::filesystem::path& path);
  bool dirty() const { return dirty_; }
  const std::optional<std::filesystem::path>& file_path() const { return file_path_; }

  // selection
  const Selection& selection() const { return selection_; }
  CellPos cursor() const;
  void select_cell(int row, int col);
  void select_range(CellPos start, CellPos end);
  void drag_to(int row, int col);
  void end_drag() { drag_anchor_.reset(); }
  void select_row(int row);
  void select_column(int col);
  void select_all();
  void escape();
  bool move(int drow, int dcol, bool extend);

  // edit session
  const EditSession& edit() const { return edit_; }
  bool editing() const { return edit_.active(); }
  bool begin_edit(int row, int col);
  bool begin_edit_at_selection();
  bool type_text(const std::string& text);
  void edit_backspace() { edit_.backspace(); }
  void edit_delete() { edit_.delete_forward(); }
  void edit_caret(int delta) { edit_.move_caret(delta); }
  void edit_home() { edit_.caret_home(); }
  void edit_end() { edit_.caret_end(); }
  bool commit_edit();
  void cancel_edit();
  bool confirm();

  // mutations (all undoable)
  void delete_selection();
  std::string copy() const;
  std::string cut();
  void paste(const std::string& text);
  void add_row();
  void add_column();
  bool insert_row_at(int row);
  bool insert_column_at(int col);
  bool delete_row(int row);
  bool delete_column(int col);
  bool sort_by_column(int col, bool ascending);
  bool clear_cell(int row, int col);

  // history
  void save_undo_state();
  bool undo();
  bool redo();
  const History& history() const { return history_; }

  // search
  int find(const std::string& query);
  bool next_result();
  bool prev_result();
  const SearchIndex& search() const { return search_; }

  // options and display state
  bool frozen_header() const { return frozen_header_; }
  void set_frozen_header(bool on) { frozen_header_ = on; }
  bool case_sensitive() const { return case_sensitive_; }
  void set_case_sensitive(bool on) { case_sensitive_ = on; }
  const std::optional<SortMarker>& sort_marker() const { return sort_marker_; }
  const ColumnWidths& widths() const { return widths_; }
  int column_width(int col) const { return widths_.get(col); }
  void set_column_width(int col, int width) { widths_.set(col, width); }

private:
  void reset_transient();
  void invalidate_sort() { sort_marker_.reset(); }
  void focus_cell(CellPos pos);

  Grid grid_;
  Selection selection_ = NoSelection{};
  EditSession edit_;
  History history_;
  ColumnWidths widths_;
  SearchIndex search_;
  std::optional<SortMarker> sort_marker_;
  std::optional<CellPos> drag_anchor_;
  CellPos last_cursor_{};
  bool frozen_header_ = false;
  bool case_sensitive_ = false;
  bool dirty_ = false;
  std::optional<std::filesystem::path> file_path_;
};
