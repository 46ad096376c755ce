#include "renderer.hpp"
#include <algorithm>
#include <sstream>

static int digits_of(int n) {
  int d = 1;
  while (n >= 10) { n /= 10; d++; }
  return d;
}

static std::string fit(const std::string& s, int width) {
  if (width <= 0) return std::string();
  if (static_cast<int>(s.size()) >= width) return s.substr(0, static_cast<size_t>(width));
  return s + std::string(static_cast<size_t>(width - static_cast<int>(s.size())), ' ');
}

static std::string centered(const std::string& s, int width) {
  if (width <= 0) return std::string();
  int pad = std::max(0, (width - static_cast<int>(s.size())) / 2);
  return fit(std::string(static_cast<size_t>(pad), ' ') + s, width);
}

static const char* mode_name(Mode mode) {
  switch (mode) {
    case Mode::Normal: return "NORMAL";
    case Mode::Edit: return "EDIT";
    case Mode::Command: return "COMMAND";
    case Mode::Search: return "SEARCH";
  }
  return "";
}

GridLayout Renderer::layout(TermSize sz, const Session& s, Viewport& vp) const {
  const Grid& g = s.grid();
  GridLayout l;
  l.status_row = std::max(0, sz.rows - 1);
  l.gutter = std::max(3, digits_of(std::max(1, g.row_count())) + 1);
  bool frozen = s.frozen_header() && !g.empty();
  int min_first = 0;
  if (frozen) {
    l.frozen_screen_row = 1;
    l.body_top = 2;
    min_first = 1;
  }
  l.body_rows = std::max(0, l.status_row - l.body_top);

  CellPos focus = s.cursor();
  int top = vp.top_row;
  if (focus.row >= min_first) {
    if (focus.row < top) top = focus.row;
    if (l.body_rows > 0 && focus.row >= top + l.body_rows) top = focus.row - l.body_rows + 1;
  }
  top = std::min(top, std::max(min_first, g.row_count() - 1));
  vp.top_row = std::max(min_first, top);
  l.first_body_row = vp.top_row;

  int cols = g.col_count();
  int avail = std::max(0, sz.cols - l.gutter);
  int left = std::clamp(vp.left_col, 0, std::max(0, cols - 1));
  if (focus.col >= 0 && focus.col < cols) {
    if (focus.col < left) left = focus.col;
    auto span_width = [&](int from, int to) {
      int w = 0;
      for (int c = from; c <= to; ++c) w += s.column_width(c);
      return w;
    };
    while (left < focus.col && span_width(left, focus.col) > avail) left++;
  }
  vp.left_col = left;

  int x = l.gutter;
  for (int c = left; c < cols && x < sz.cols; ++c) {
    int w = s.column_width(c);
    l.columns.push_back({c, x, std::min(w, sz.cols - x)});
    x += w;
  }
  return l;
}

int Renderer::screen_row_of(const GridLayout& l, int grid_row) {
  if (l.frozen_screen_row >= 0 && grid_row == 0) return l.frozen_screen_row;
  if (grid_row >= l.first_body_row && grid_row < l.first_body_row + l.body_rows) {
    return l.body_top + (grid_row - l.first_body_row);
  }
  return -1;
}

HitTarget Renderer::hit_test(const GridLayout& l, const Session& s, int y, int x) {
  HitTarget h;
  auto column_at = [&l](int sx) {
    for (const auto& span : l.columns) if (sx >= span.x && sx < span.x + span.width) return span.col;
    return -1;
  };
  if (y == l.status_row) return h;
  if (y == l.header_row) {
    if (x < l.gutter) { h.kind = HitTarget::Kind::Corner; return h; }
    h.col = column_at(x);
    if (h.col >= 0) h.kind = HitTarget::Kind::ColumnHeader;
    return h;
  }
  int row = -1;
  if (y == l.frozen_screen_row) row = 0;
  else if (y >= l.body_top && y < l.body_top + l.body_rows) row = l.first_body_row + (y - l.body_top);
  if (row < 0 || row >= s.grid().row_count()) return h;
  h.row = row;
  if (x < l.gutter) { h.kind = HitTarget::Kind::RowGutter; return h; }
  h.col = column_at(x);
  if (h.col >= 0) h.kind = HitTarget::Kind::Cell;
  return h;
}

void Renderer::render(ITerminal& term,
                      const Session& s,
                      Viewport& vp,
                      Mode mode,
                      const std::string& message,
                      const std::string& cmdline) {
  TermSize sz = term.getSize();
  term.clear();
  last_ = layout(sz, s, vp);
  const GridLayout& l = last_;
  const Grid& g = s.grid();
  const Selection& sel = s.selection();
  const EditSession& edit = s.edit();
  int cursor_y = -1, cursor_x = -1;

  // column letters
  term.draw_text(l.header_row, 0, std::string(static_cast<size_t>(l.gutter), ' '));
  const auto* col_sel = std::get_if<ColumnSelection>(&sel);
  for (const auto& span : l.columns) {
    std::string label = column_name(span.col);
    if (s.sort_marker() && s.sort_marker()->col == span.col) label += s.sort_marker()->ascending ? "^" : "v";
    std::string text = centered(label, span.width - 1) + "|";
    text = fit(text, span.width);
    if (col_sel && col_sel->col == span.col) term.draw_reversed(l.header_row, span.x, text);
    else term.draw_colored(l.header_row, span.x, text, kPairHeader);
  }

  auto draw_row = [&](int screen_y, int r) {
    const auto* row_sel = std::get_if<RowSelection>(&sel);
    std::string num = std::to_string(r + 1);
    std::string gutter = std::string(static_cast<size_t>(std::max(0, l.gutter - 1 - static_cast<int>(num.size()))), ' ') + num + " ";
    if (row_sel && row_sel->row == r) term.draw_reversed(screen_y, 0, gutter);
    else term.draw_text(screen_y, 0, gutter);
    bool frozen_row = (r == 0 && l.frozen_screen_row >= 0);
    for (const auto& span : l.columns) {
      int inner = std::max(0, span.width - 1);
      if (edit.is_editing(r, span.col)) {
        const std::string& buf = edit.buffer();
        int start = std::max(0, edit.caret() - std::max(0, inner - 1));
        std::string vis = buf.substr(static_cast<size_t>(std::min(start, static_cast<int>(buf.size()))));
        term.draw_text(screen_y, span.x, fit(vis, inner));
        term.draw_text(screen_y, span.x + inner, fit("|", span.width - inner));
        cursor_y = screen_y;
        cursor_x = span.x + std::min(inner, edit.caret() - start);
        continue;
      }
      std::string text = fit(g.cell(r, span.col), inner) + "|";
      text = fit(text, span.width);
      if (contains(sel, g, r, span.col)) term.draw_reversed(screen_y, span.x, text);
      else if (frozen_row) term.draw_colored(screen_y, span.x, text, kPairFrozen);
      else term.draw_text(screen_y, span.x, text);
    }
    if (!l.columns.empty()) term.clear_to_eol(screen_y, l.columns.back().x + l.columns.back().width);
  };

  if (l.frozen_screen_row >= 0) draw_row(l.frozen_screen_row, 0);
  for (int i = 0; i < l.body_rows; ++i) {
    int r = l.first_body_row + i;
    if (r >= g.row_count()) break;
    draw_row(l.body_top + i, r);
  }

  std::string status;
  if (mode == Mode::Command) {
    status = ":" + cmdline;
  } else if (mode == Mode::Search) {
    status = "/" + cmdline;
  } else {
    CellPos cur = s.cursor();
    std::ostringstream oss;
    oss << mode_name(mode) << "  "
        << (s.file_path() ? s.file_path()->string() : "[no file]")
        << (s.dirty() ? " [+]" : "")
        << "  " << column_name(cur.col) << (cur.row + 1)
        << "  " << g.row_count() << "x" << g.col_count();
    if (s.frozen_header()) oss << "  [header]";
    if (!message.empty()) oss << "  | " << message;
    status = oss.str();
  }
  term.draw_text(l.status_row, 0, fit(status, std::max(0, sz.cols - 1)));

  if (mode == Mode::Command || mode == Mode::Search) {
    term.set_cursor_visible(true);
    term.move_cursor(l.status_row, std::min(sz.cols - 1, static_cast<int>(cmdline.size()) + 1));
  } else if (cursor_y >= 0) {
    term.set_cursor_visible(true);
    term.move_cursor(cursor_y, cursor_x);
  } else {
    term.set_cursor_visible(false);
    term.move_cursor(l.status_row, 0);
  }
  term.refresh();
}
