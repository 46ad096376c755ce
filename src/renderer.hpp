#pragma once
/*
 * Renderer
 *
 * Purpose: draw column letters, row gutter, cells, selection and status line,
 *          and keep the viewport scrolled onto the focused cell.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: keeps only the last computed layout, for mouse hit testing.
 */
#include <string>
#include <vector>
#include "types.hpp"
#include "iterminal.hpp"
#include "session.hpp"

struct ColumnSpan { int col; int x; int width; };

struct GridLayout {
  int gutter = 0;             // row-number gutter, the UI's column 0
  int header_row = 0;
  int frozen_screen_row = -1; // pinned grid row 0, -1 when not frozen
  int body_top = 1;
  int body_rows = 0;
  int first_body_row = 0;
  int status_row = 0;
  std::vector<ColumnSpan> columns;
};

struct HitTarget {
  enum class Kind { None, Corner, ColumnHeader, RowGutter, Cell };
  Kind kind = Kind::None;
  int row = -1;
  int col = -1;
};

class Renderer {
public:
  GridLayout layout(TermSize sz, const Session& s, Viewport& vp) const;
  void render(ITerminal& term,
              const Session& s,
              Viewport& vp,
              Mode mode,
              const std::string& message,
              const std::string& cmdline);
  const GridLayout& last_layout() const { return last_; }

  static int screen_row_of(const GridLayout& l, int grid_row);
  static HitTarget hit_test(const GridLayout& l, const Session& s, int y, int x);

private:
  GridLayout last_;
};
