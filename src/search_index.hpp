#pragma once
/*
 * SearchIndex
 *
 * Purpose: row-major substring scan over the grid, with a cyclic result pointer.
 * Note: results are a snapshot; edits after perform() do not refresh them.
 */
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"
#include "grid.hpp"

class SearchIndex {
public:
  void perform(const Grid& grid, const std::string& query, bool case_sensitive);
  void clear();

  // rotate the pointer (wrapping both ways); nullopt when there are no results
  std::optional<CellPos> next();
  std::optional<CellPos> prev();
  std::optional<CellPos> current() const;

  const std::vector<CellPos>& results() const { return results_; }
  int current_index() const { return current_; }
  const std::string& query() const { return query_; }
  bool case_sensitive() const { return case_sensitive_; }

private:
  std::vector<CellPos> results_;
  int current_ = 0;
  std::string query_;
  bool case_sensitive_ = false;
};

// true if pattern occurs in s; empty pattern never matches
bool contains_substring(const std::string& s, const std::string& pattern);
std::string fold_case(std::string s);
