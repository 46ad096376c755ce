#include "grid.hpp"
#include <algorithm>
#include <cctype>
#include "config.hpp"

static const std::string kEmptyCell;

Grid Grid::blank(int rows, int cols) {
  Grid g;
  g.reset(rows, cols);
  return g;
}

int Grid::col_count() const {
  size_t m = 0;
  for (const auto& r : rows_) m = std::max(m, r.size());
  return static_cast<int>(m);
}

int Grid::row_length(int r) const {
  if (r < 0 || r >= row_count()) return 0;
  return static_cast<int>(rows_[r].size());
}

bool Grid::has_cell(int r, int c) const {
  return r >= 0 && r < row_count() && c >= 0 && c < static_cast<int>(rows_[r].size());
}

const std::string& Grid::cell(int r, int c) const {
  if (!has_cell(r, c)) return kEmptyCell;
  return rows_[r][c];
}

void Grid::set_cell(int r, int c, std::string s) {
  if (!has_cell(r, c)) return;
  rows_[r][c] = std::move(s);
}

void Grid::reset(int rows, int cols) {
  rows_.assign(static_cast<size_t>(std::max(0, rows)),
               std::vector<std::string>(static_cast<size_t>(std::max(0, cols))));
}

void Grid::normalize() {
  size_t width = static_cast<size_t>(col_count());
  for (auto& r : rows_) {
    if (r.size() < width) r.resize(width);
  }
}

bool Grid::is_rectangular() const {
  if (rows_.empty()) return true;
  size_t w = rows_.front().size();
  return std::all_of(rows_.begin(), rows_.end(), [w](const std::vector<std::string>& r){ return r.size() == w; });
}

int Grid::new_row_width() const {
  return rows_.empty() ? MG_DEFAULT_COLS : static_cast<int>(rows_.front().size());
}

void Grid::add_row() {
  rows_.emplace_back(static_cast<size_t>(new_row_width()));
}

void Grid::add_column() {
  if (rows_.empty()) { rows_.emplace_back(1); return; }
  for (auto& r : rows_) r.emplace_back();
}

bool Grid::insert_row_at(int r) {
  if (r < 0 || r > row_count()) return false;
  rows_.insert(rows_.begin() + static_cast<std::ptrdiff_t>(r),
               std::vector<std::string>(static_cast<size_t>(new_row_width())));
  return true;
}

bool Grid::insert_column_at(int c) {
  if (c < 0 || c > col_count()) return false;
  if (rows_.empty()) { rows_.emplace_back(1); return true; }
  for (auto& row : rows_) {
    size_t pos = std::min(static_cast<size_t>(c), row.size());
    row.insert(row.begin() + static_cast<std::ptrdiff_t>(pos), std::string());
  }
  return true;
}

bool Grid::delete_row(int r) {
  if (r < 0 || r >= row_count()) return false;
  rows_.erase(rows_.begin() + static_cast<std::ptrdiff_t>(r));
  return true;
}

bool Grid::delete_column(int c) {
  if (c < 0 || c >= col_count()) return false;
  for (auto& row : rows_) {
    if (static_cast<size_t>(c) < row.size()) row.erase(row.begin() + static_cast<std::ptrdiff_t>(c));
  }
  return true;
}

void Grid::ensure_cell(int r, int c) {
  if (r < 0 || c < 0) return;
  size_t width = static_cast<size_t>(col_count());
  while (r >= row_count()) rows_.emplace_back(width);
  auto& row = rows_[r];
  if (static_cast<size_t>(c) >= row.size()) row.resize(static_cast<size_t>(c) + 1);
}

std::string column_name(int idx) {
  std::string out;
  if (idx < 0) return out;
  long n = static_cast<long>(idx) + 1;
  while (n > 0) {
    n -= 1;
    out.insert(out.begin(), static_cast<char>('A' + n % 26));
    n /= 26;
  }
  return out;
}

std::optional<int> parse_column_name(const std::string& s) {
  if (s.empty() || s.size() > 6) return std::nullopt;
  bool digits = std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
  if (digits) {
    int n = std::stoi(s);
    if (n < 1) return std::nullopt;
    return n - 1;
  }
  long n = 0;
  for (unsigned char c : s) {
    if (!std::isalpha(c)) return std::nullopt;
    n = n * 26 + (std::toupper(c) - 'A' + 1);
  }
  return static_cast<int>(n - 1);
}
