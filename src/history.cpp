#include "history.hpp"

void History::save(const Grid& current) {
  undo_entries_.push_back(current);
  redo_entries_.clear();
  while (undo_entries_.size() > limit_) undo_entries_.pop_front();
}

bool History::undo(Grid& current) {
  if (undo_entries_.empty()) return false;
  redo_entries_.push_back(std::move(current));
  current = std::move(undo_entries_.back());
  undo_entries_.pop_back();
  return true;
}

bool History::redo(Grid& current) {
  if (redo_entries_.empty()) return false;
  undo_entries_.push_back(std::move(current));
  current = std::move(redo_entries_.back());
  redo_entries_.pop_back();
  return true;
}

void History::clear() {
  undo_entries_.clear();
  redo_entries_.clear();
}
