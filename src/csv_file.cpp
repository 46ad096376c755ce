#include "csv_file.hpp"
#include "file_io.hpp"

bool parse_csv(const std::string& bytes, char delimiter, Rows& out, std::string& msg) {
  Rows rows;
  std::vector<std::string> record;
  std::string field;
  size_t i = 0;
  size_t n = bytes.size();
  if (n >= 3 && bytes.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3;
  int line = 1;
  bool in_quotes = false;
  int quote_line = 0;
  bool pending = false;  // true once the current record has any content
  auto end_field = [&]() { record.push_back(std::move(field)); field.clear(); };
  auto end_record = [&]() { end_field(); rows.push_back(std::move(record)); record.clear(); pending = false; };
  for (; i < n; ++i) {
    char c = bytes[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < n && bytes[i + 1] == '"') { field += '"'; ++i; }
        else in_quotes = false;
      } else {
        if (c == '\n') line++;
        field += c;
      }
      continue;
    }
    if (c == '"' && field.empty()) {
      in_quotes = true;
      quote_line = line;
      pending = true;
    } else if (c == delimiter) {
      end_field();
      pending = true;
    } else if (c == '\r' && i + 1 < n && bytes[i + 1] == '\n') {
      continue;
    } else if (c == '\n') {
      end_record();
      line++;
    } else {
      field += c;
      pending = true;
    }
  }
  if (in_quotes) {
    msg = "malformed csv: unterminated quote at line " + std::to_string(quote_line);
    return false;
  }
  if (pending || !field.empty() || !record.empty()) end_record();
  out = std::move(rows);
  return true;
}

static bool needs_quotes(const std::string& s, char delimiter) {
  for (char c : s) {
    if (c == delimiter || c == '"' || c == '\n' || c == '\r') return true;
  }
  return false;
}

std::string format_csv(const Rows& rows, char delimiter) {
  std::string out;
  for (const auto& row : rows) {
    for (size_t j = 0; j < row.size(); ++j) {
      if (j > 0) out += delimiter;
      const std::string& s = row[j];
      if (!needs_quotes(s, delimiter)) { out += s; continue; }
      out += '"';
      for (char c : s) {
        if (c == '"') out += '"';
        out += c;
      }
      out += '"';
    }
    out += '\n';
  }
  return out;
}

bool load_csv_file(const std::filesystem::path& path, char delimiter, Rows& out, std::string& msg) {
  std::string bytes;
  if (!read_file_bytes(path, bytes, msg)) return false;
  std::string parse_msg;
  if (!parse_csv(bytes, delimiter, out, parse_msg)) { msg = parse_msg + ": " + path.string(); return false; }
  return true;
}

bool save_csv_file(const std::filesystem::path& path, const Rows& rows, char delimiter, std::string& msg) {
  return write_file_atomic(path, format_csv(rows, delimiter), msg);
}
