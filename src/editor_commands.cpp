#include "editor.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <filesystem>
#include "config.hpp"

static bool parse_on_off(const std::string& s, bool& out) {
  if (s == "on" || s == "true" || s == "1") { out = true; return true; }
  if (s == "off" || s == "false" || s == "0") { out = false; return true; }
  return false;
}

static bool all_digits(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
}

void Editor::register_commands() {
  registry_.register_command("w", [this](const std::vector<std::string>& args){
    if (!args.empty()) save_to(std::filesystem::path(args[0]), false);
    else save_to(std::nullopt, false);
  });
  registry_.register_command("q", [this](const std::vector<std::string>&){ close_or_quit(false); });
  registry_.register_command("q!", [this](const std::vector<std::string>&){ close_or_quit(true); });
  registry_.register_command("wq", [this](const std::vector<std::string>& args){
    if (!args.empty()) { save_to(std::filesystem::path(args[0]), true); return; }
    if (session_.file_path()) { save_to(std::nullopt, true); return; }
    if (!session_.dirty()) { close_or_quit(true); return; }
    message_ = "dont have path: use :wq <path>";
  });
  registry_.register_alias("x", "wq");
  registry_.register_command("e", [this](const std::vector<std::string>& args){
    if (args.empty()) { message_ = "e: use :e <path>"; return; }
    open_file_async(args[0], false);
  });
  registry_.register_command("e!", [this](const std::vector<std::string>& args){
    if (args.empty()) { message_ = "e!: use :e! <path>"; return; }
    open_file_async(args[0], true);
  });
  registry_.register_command("new", [this](const std::vector<std::string>& args){
    if (session_.dirty() && (args.empty() || args[0] != "!")) { message_ = "unsaved changes, use :new !"; return; }
    session_.new_document();
    vp_ = Viewport{};
    message_ = "new grid " + std::to_string(MG_DEFAULT_ROWS) + "x" + std::to_string(MG_DEFAULT_COLS);
  });

  registry_.register_command("addrow", [this](const std::vector<std::string>&){
    session_.add_row();
    message_ = "rows: " + std::to_string(session_.grid().row_count());
  });
  registry_.register_command("addcol", [this](const std::vector<std::string>&){
    session_.add_column();
    message_ = "columns: " + std::to_string(session_.grid().col_count());
  });
  registry_.register_command("ir", [this](const std::vector<std::string>&){
    if (!session_.insert_row_at(session_.cursor().row)) message_ = "ir: no row here";
  });
  registry_.register_command("irb", [this](const std::vector<std::string>&){
    int r = session_.grid().empty() ? 0 : session_.cursor().row + 1;
    if (!session_.insert_row_at(r)) message_ = "irb: no row here";
  });
  registry_.register_command("ic", [this](const std::vector<std::string>&){
    if (!session_.insert_column_at(session_.cursor().col)) message_ = "ic: no column here";
  });
  registry_.register_command("icr", [this](const std::vector<std::string>&){
    int c = session_.grid().col_count() == 0 ? 0 : session_.cursor().col + 1;
    if (!session_.insert_column_at(c)) message_ = "icr: no column here";
  });
  registry_.register_command("dr", [this](const std::vector<std::string>& args){
    int r = session_.cursor().row;
    if (!args.empty()) {
      if (!all_digits(args[0]) || args[0].size() > 9) { message_ = "dr: use :dr [row number]"; return; }
      r = std::stoi(args[0]) - 1;
    }
    if (!session_.delete_row(r)) message_ = "dr: row out of range";
  });
  registry_.register_command("dc", [this](const std::vector<std::string>& args){
    int c = session_.cursor().col;
    if (!args.empty()) {
      auto parsed = parse_column_name(args[0]);
      if (!parsed) { message_ = "dc: use :dc [column]"; return; }
      c = *parsed;
    }
    if (!session_.delete_column(c)) message_ = "dc: column out of range";
  });
  registry_.register_command("clear", [this](const std::vector<std::string>&){
    CellPos p = session_.cursor();
    if (!session_.clear_cell(p.row, p.col)) message_ = "clear: no cell here";
  });
  registry_.register_command("sort", [this](const std::vector<std::string>& args){
    bool ascending = true;
    int col = session_.cursor().col;
    for (const auto& a : args) {
      if (a == "asc") ascending = true;
      else if (a == "desc") ascending = false;
      else if (auto parsed = parse_column_name(a)) col = *parsed;
      else { message_ = "sort: use :sort [asc|desc] [column]"; return; }
    }
    if (!session_.sort_by_column(col, ascending)) { message_ = "sort: nothing to sort"; return; }
    message_ = "sorted by " + column_name(col) + (ascending ? " ascending" : " descending");
  });

  registry_.register_command("find", [this](const std::vector<std::string>& args){
    std::string q;
    for (size_t i = 0; i < args.size(); ++i) { if (i) q.push_back(' '); q += args[i]; }
    session_.find(q);
    report_search();
  });
  registry_.register_command("next", [this](const std::vector<std::string>&){
    session_.next_result();
    report_search();
  });
  registry_.register_command("prev", [this](const std::vector<std::string>&){
    session_.prev_result();
    report_search();
  });
  registry_.register_command("undo", [this](const std::vector<std::string>&){
    message_ = session_.undo() ? "undo" : "already at oldest change";
  });
  registry_.register_command("redo", [this](const std::vector<std::string>&){
    message_ = session_.redo() ? "redo" : "already at newest change";
  });
  registry_.register_command("help", [this](const std::vector<std::string>&){
    std::string out = "commands:";
    for (const auto& n : registry_.names()) { out.push_back(' '); out += n; }
    message_ = out;
  });

  registry_.register_command("set header", [this](const std::vector<std::string>& args){
    bool on = !session_.frozen_header();
    if (!args.empty() && !parse_on_off(args[0], on)) { message_ = "set header: use :set header on|off"; return; }
    session_.set_frozen_header(on);
    message_ = on ? "header on" : "header off";
  });
  registry_.register_command("set case", [this](const std::vector<std::string>& args){
    bool on = !session_.case_sensitive();
    if (!args.empty() && !parse_on_off(args[0], on)) { message_ = "set case: use :set case on|off"; return; }
    session_.set_case_sensitive(on);
    message_ = on ? "case-sensitive search" : "case-insensitive search";
  });
  registry_.register_command("set width", [this](const std::vector<std::string>& args){
    if (args.empty()) { message_ = "set width: use :set width <n>"; return; }
    const std::string& s = args[0];
    if (!all_digits(s) || s.size() > 4) { message_ = "set width: width must be a number"; return; }
    int w = std::stoi(s);
    int col = session_.cursor().col;
    session_.set_column_width(col, w);
    message_ = "width of " + column_name(col) + ": " + std::to_string(session_.column_width(col));
  });
  registry_.register_command("set delimiter", [this](const std::vector<std::string>& args){
    if (args.empty() || args[0].empty()) { message_ = "set delimiter: use :set delimiter <c>|tab"; return; }
    if (args[0] == "tab" || args[0] == "\\t") delimiter_ = '\t';
    else if (args[0].size() == 1 && args[0][0] != '"') delimiter_ = args[0][0];
    else { message_ = "set delimiter: use :set delimiter <c>|tab"; return; }
    message_ = delimiter_ == '\t' ? "delimiter tab" : std::string("delimiter ") + delimiter_;
  });
  registry_.register_command("set mouse", [this](const std::vector<std::string>& args){
    bool on = !enable_mouse_;
    if (!args.empty() && !parse_on_off(args[0], on)) { message_ = "set mouse: use :set mouse on|off"; return; }
    set_mouse(on);
    message_ = on ? "mouse on" : "mouse off";
  });
}
