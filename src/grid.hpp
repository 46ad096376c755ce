#pragma once
/*
 * Grid
 *
 * Purpose: rectangular matrix of text cells (rows of equal length).
 * Invariant: every public mutator leaves all rows the same length, except
 *            ensure_cell(), which paste uses and must close with normalize().
 * Bounds: coordinate-taking ops are no-ops when out of range (inserts may append).
 */
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"

class Grid {
public:
  Grid() = default;
  explicit Grid(Rows rows) : rows_(std::move(rows)) {}
  static Grid blank(int rows, int cols);

  bool empty() const { return rows_.empty(); }
  int row_count() const { return static_cast<int>(rows_.size()); }
  int col_count() const;
  int row_length(int r) const;
  bool has_cell(int r, int c) const;
  const std::string& cell(int r, int c) const;
  void set_cell(int r, int c, std::string s);
  const Rows& rows() const { return rows_; }

  void assign(Rows rows) { rows_ = std::move(rows); }
  void reset(int rows, int cols);
  void normalize();
  bool is_rectangular() const;

  void add_row();
  void add_column();
  bool insert_row_at(int r);
  bool insert_column_at(int c);
  bool delete_row(int r);
  bool delete_column(int c);

  // grows rows (sized to the current max width), then the target row only
  void ensure_cell(int r, int c);

  bool operator==(const Grid& o) const { return rows_ == o.rows_; }
  bool operator!=(const Grid& o) const { return rows_ != o.rows_; }

private:
  int new_row_width() const;
  Rows rows_;
};

// 0 -> A, 25 -> Z, 26 -> AA
std::string column_name(int idx);
// inverse of column_name (case-insensitive); a plain number is taken as 1-based
std::optional<int> parse_column_name(const std::string& s);
