#pragma once
/*
 * CsvFile
 *
 * Purpose: delimited text <-> rows of strings for the document load/save boundary.
 * Format: fields may be double-quoted (delimiter, CR/LF and "" escapes inside);
 *         LF or CRLF record ends; leading UTF-8 BOM skipped. First record is ordinary row 0.
 * Errors: an unterminated quote fails the whole parse; out is left untouched.
 */
#include <filesystem>
#include <string>
#include "types.hpp"

bool parse_csv(const std::string& bytes, char delimiter, Rows& out, std::string& msg);
std::string format_csv(const Rows& rows, char delimiter);

bool load_csv_file(const std::filesystem::path& path, char delimiter, Rows& out, std::string& msg);
bool save_csv_file(const std::filesystem::path& path, const Rows& rows, char delimiter, std::string& msg);
