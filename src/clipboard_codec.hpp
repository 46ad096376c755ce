#pragma once
/*
 * ClipboardCodec
 *
 * Purpose: selection <-> spreadsheet-compatible text ('\t' fields, '\n' records).
 * Note: embedded tabs/newlines inside a cell are not escaped; re-pasting such a
 *       cell splits it into extra fields/records.
 */
#include <string>
#include <vector>
#include "grid.hpp"
#include "selection.hpp"

// empty string means "nothing to copy"
std::string extract_text(const Grid& grid, const Selection& sel);

// grows the grid on demand and re-rectangularizes before returning
void paste_text(Grid& grid, const std::string& text, CellPos anchor);

// '\n'-separated records; a trailing '\r' is dropped, a final empty record is not produced
std::vector<std::string> split_records(const std::string& text);
std::vector<std::string> split_fields(const std::string& record, char sep = '\t');
