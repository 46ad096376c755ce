#include "sorter.hpp"
#include <algorithm>
#include <charconv>
#include <vector>

std::optional<double> parse_number(const std::string& s) {
  const char* first = s.data();
  const char* last = s.data() + s.size();
  bool plus = first != last && *first == '+';
  if (plus) first++;
  if (first == last || (plus && *first == '-')) return std::nullopt;
  double v = 0.0;
  auto [ptr, ec] = std::from_chars(first, last, v);
  if (ec != std::errc() || ptr != last) return std::nullopt;
  return v;
}

int compare_cells(const std::string& a, const std::string& b) {
  auto na = parse_number(a);
  auto nb = parse_number(b);
  if (na && nb) {
    if (*na < *nb) return -1;
    if (*na > *nb) return 1;
    return 0;  // includes NaN pairs
  }
  int c = a.compare(b);
  return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

// Bottom-up merge sort built on std::merge: stable, and never reads out of
// range even when the comparator is not a strict weak order (mixed columns).
template <typename T, typename Less>
static void stable_merge_sort(std::vector<T>& v, Less less) {
  size_t n = v.size();
  std::vector<T> tmp(n);
  for (size_t width = 1; width < n; width *= 2) {
    for (size_t lo = 0; lo < n; lo += 2 * width) {
      size_t mid = std::min(lo + width, n);
      size_t hi = std::min(lo + 2 * width, n);
      std::merge(std::make_move_iterator(v.begin() + lo), std::make_move_iterator(v.begin() + mid),
                 std::make_move_iterator(v.begin() + mid), std::make_move_iterator(v.begin() + hi),
                 tmp.begin() + lo, less);
    }
    v.swap(tmp);
  }
}

void sort_rows_by_column(Grid& grid, int col, bool ascending, bool frozen_header) {
  if (grid.empty() || col < 0) return;
  Rows rows = grid.rows();
  std::vector<std::string> header;
  bool keep_header = frozen_header && !rows.empty();
  if (keep_header) {
    header = std::move(rows.front());
    rows.erase(rows.begin());
  }
  auto key = [col](const std::vector<std::string>& r) -> const std::string& {
    static const std::string empty;
    return static_cast<size_t>(col) < r.size() ? r[col] : empty;
  };
  stable_merge_sort(rows, [&](const std::vector<std::string>& a, const std::vector<std::string>& b) {
    int c = compare_cells(key(a), key(b));
    return ascending ? c < 0 : c > 0;
  });
  if (keep_header) rows.insert(rows.begin(), std::move(header));
  grid.assign(std::move(rows));
}
