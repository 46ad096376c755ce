#pragma once
/*
 * Sorter
 *
 * Purpose: stable row sort by one column.
 * Compare: numeric when both cells parse as floating point, text (byte order) otherwise,
 *          decided per pair. Missing cells compare as empty text.
 */
#include <optional>
#include <string>
#include "grid.hpp"

std::optional<double> parse_number(const std::string& s);

// <0, 0, >0 like strcmp
int compare_cells(const std::string& a, const std::string& b);

// row 0 stays in place when frozen_header is set; no-op on an empty grid
void sort_rows_by_column(Grid& grid, int col, bool ascending, bool frozen_header);
