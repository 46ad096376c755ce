#pragma once
/*
 * History
 *
 * Purpose: linear undo/redo over full grid snapshots.
 * Rules: a new snapshot clears redo; the undo side is bounded and drops its
 *        oldest entry first once the limit is exceeded.
 */
#include <deque>
#include <vector>
#include "grid.hpp"
#include "config.hpp"

class History {
public:
  explicit History(size_t limit = MG_UNDO_LIMIT) : limit_(limit == 0 ? 1 : limit) {}

  void save(const Grid& current);
  bool undo(Grid& current);
  bool redo(Grid& current);
  void clear();
  void clear_redo() { redo_entries_.clear(); }

  bool can_undo() const { return !undo_entries_.empty(); }
  bool can_redo() const { return !redo_entries_.empty(); }
  size_t undo_size() const { return undo_entries_.size(); }
  size_t redo_size() const { return redo_entries_.size(); }
  size_t limit() const { return limit_; }
  const Grid* last_entry() const { return undo_entries_.empty() ? nullptr : &undo_entries_.back(); }

private:
  size_t limit_;
  std::deque<Grid> undo_entries_;
  std::vector<Grid> redo_entries_;
};
