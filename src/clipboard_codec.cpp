#include "clipboard_codec.hpp"

std::vector<std::string> split_records(const std::string& text) {
  std::vector<std::string> lines;
  size_t st = 0;
  while (st < text.size()) {
    size_t pos = text.find('\n', st);
    size_t end = (pos == std::string::npos) ? text.size() : pos;
    size_t len = end - st;
    if (len > 0 && text[end - 1] == '\r') len--;
    lines.emplace_back(text.substr(st, len));
    if (pos == std::string::npos) break;
    st = pos + 1;
  }
  return lines;
}

std::vector<std::string> split_fields(const std::string& record, char sep) {
  std::vector<std::string> out;
  size_t st = 0;
  while (true) {
    size_t pos = record.find(sep, st);
    if (pos == std::string::npos) { out.emplace_back(record.substr(st)); break; }
    out.emplace_back(record.substr(st, pos - st));
    st = pos + 1;
  }
  return out;
}

static void join_into(std::string& out, const std::vector<std::string>& parts, char sep) {
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += sep;
    out += parts[i];
  }
}

std::string extract_text(const Grid& grid, const Selection& sel) {
  return std::visit(overloaded{
    [](const NoSelection&) { return std::string(); },
    [&grid, &sel](const CellRange&) {
      std::string out;
      auto b = normalized_bounds(sel, grid);
      if (!b) return out;
      std::vector<std::string> cells;
      for (int r = b->min_row; r <= b->max_row; ++r) {
        cells.clear();
        for (int c = b->min_col; c <= b->max_col; ++c) cells.push_back(grid.cell(r, c));
        if (r > b->min_row) out += '\n';
        join_into(out, cells, '\t');
      }
      return out;
    },
    [&grid](const ColumnSelection& c) {
      std::vector<std::string> cells;
      cells.reserve(static_cast<size_t>(grid.row_count()));
      for (int r = 0; r < grid.row_count(); ++r) cells.push_back(grid.cell(r, c.col));
      std::string out;
      join_into(out, cells, '\n');
      return out;
    },
    [&grid](const RowSelection& r) {
      std::string out;
      if (r.row < 0 || r.row >= grid.row_count()) return out;
      join_into(out, grid.rows()[r.row], '\t');
      return out;
    },
  }, sel);
}

void paste_text(Grid& grid, const std::string& text, CellPos anchor) {
  if (anchor.row < 0 || anchor.col < 0) return;
  auto lines = split_records(text);
  for (size_t i = 0; i < lines.size(); ++i) {
    int row = anchor.row + static_cast<int>(i);
    auto cells = split_fields(lines[i]);
    for (size_t j = 0; j < cells.size(); ++j) {
      int col = anchor.col + static_cast<int>(j);
      grid.ensure_cell(row, col);
      grid.set_cell(row, col, std::move(cells[j]));
    }
  }
  grid.normalize();
}
