#include <ncurses.h>
#include "editor.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include "clipboard_codec.hpp"
#include "csv_file.hpp"
#include "file_io.hpp"
#include "config.hpp"

static constexpr int ctrl(char c) { return c & 0x1f; }
static constexpr int ESC = 27;
static constexpr int KEY_SHIFT_F3 = KEY_F(15);
static constexpr auto kDoubleClick = std::chrono::milliseconds(400);

static inline bool is_printable(int ch) { return ch >= 32 && ch <= 126; }
static inline bool is_enter(int ch) { return ch == '\n' || ch == '\r' || ch == KEY_ENTER; }
static inline bool is_backspace(int ch) { return ch == KEY_BACKSPACE || ch == 127 || ch == 8; }

static char delimiter_for(const std::filesystem::path& path, char fallback) {
  std::string ext = path.extension().string();
  for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (ext == ".tsv" || ext == ".tab") return '\t';
  return fallback;
}

static int count_records(const std::string& text) {
  return 1 + static_cast<int>(std::count(text.begin(), text.end(), '\n'));
}

Editor::Editor(ITerminal& term, IClipboard& clipboard, const std::optional<std::filesystem::path>& file)
  : term_(term), clipboard_(clipboard) {
  if (file) open_file_sync(*file);
  register_commands();
  load_rc();
}

Mode Editor::mode() const {
  if (prompt_ == Prompt::Command) return Mode::Command;
  if (prompt_ == Prompt::Search) return Mode::Search;
  if (session_.editing()) return Mode::Edit;
  return Mode::Normal;
}

void Editor::run() {
  set_mouse(enable_mouse_);
  while (!should_quit_) {
    poll_mailbox();
    render();
    int ch = getch();
    handle_input(ch);
  }
}

void Editor::render() {
  renderer_.render(term_, session_, vp_, mode(), message_, cmdline_);
}

void Editor::handle_input(int ch) {
  if (ch == ERR || ch == KEY_RESIZE) return;
  if (ch == KEY_MOUSE) { if (enable_mouse_) handle_mouse(); return; }
  if (prompt_ != Prompt::None) { handle_prompt_input(ch); return; }
  if (session_.editing()) { handle_edit_input(ch); return; }
  handle_normal_input(ch);
}

void Editor::handle_normal_input(int ch) {
  int page = std::max(1, renderer_.last_layout().body_rows);
  switch (ch) {
    case KEY_UP: session_.move(-1, 0, false); return;
    case KEY_DOWN: session_.move(1, 0, false); return;
    case KEY_LEFT: session_.move(0, -1, false); return;
    case KEY_RIGHT: session_.move(0, 1, false); return;
    case KEY_SR: session_.move(-1, 0, true); return;
    case KEY_SF: session_.move(1, 0, true); return;
    case KEY_SLEFT: session_.move(0, -1, true); return;
    case KEY_SRIGHT: session_.move(0, 1, true); return;
    case KEY_PPAGE: session_.move(-page, 0, false); return;
    case KEY_NPAGE: session_.move(page, 0, false); return;
    case KEY_HOME: session_.move(0, -session_.grid().col_count(), false); return;
    case KEY_END: session_.move(0, session_.grid().col_count(), false); return;
    case ESC: session_.escape(); return;
    case KEY_DC: session_.delete_selection(); return;
    case KEY_SHIFT_F3: session_.prev_result(); report_search(); return;
    default: break;
  }
  if (ch == KEY_F(3)) { session_.next_result(); report_search(); return; }
  if (is_enter(ch)) { session_.begin_edit_at_selection(); return; }
  if (is_backspace(ch)) { session_.delete_selection(); return; }
  if (ch == ctrl('c')) { copy_selection(); return; }
  if (ch == ctrl('x')) { cut_selection(); return; }
  if (ch == ctrl('v')) { paste_clipboard(); return; }
  if (ch == ctrl('a')) { session_.select_all(); return; }
  if (ch == ctrl('z')) { message_ = session_.undo() ? "undo" : "already at oldest change"; return; }
  if (ch == ctrl('y')) { message_ = session_.redo() ? "redo" : "already at newest change"; return; }
  if (ch == ctrl('f')) { prompt_ = Prompt::Search; cmdline_.clear(); return; }
  if (ch == ctrl('k')) { prompt_ = Prompt::Command; cmdline_.clear(); return; }
  if (ch == ctrl('s')) { save_to(std::nullopt, false); return; }
  if (ch == ctrl('q')) { close_or_quit(false); return; }
  if (is_printable(ch)) { session_.type_text(std::string(1, static_cast<char>(ch))); return; }
}

void Editor::handle_edit_input(int ch) {
  if (ch == ESC) { session_.cancel_edit(); return; }
  if (is_enter(ch)) { session_.confirm(); return; }
  if (is_backspace(ch)) { session_.edit_backspace(); return; }
  switch (ch) {
    case KEY_DC: session_.edit_delete(); return;
    case KEY_LEFT: session_.edit_caret(-1); return;
    case KEY_RIGHT: session_.edit_caret(1); return;
    case KEY_HOME: session_.edit_home(); return;
    case KEY_END: session_.edit_end(); return;
    default: break;
  }
  if (is_printable(ch)) session_.type_text(std::string(1, static_cast<char>(ch)));
}

void Editor::handle_prompt_input(int ch) {
  if (ch == ESC) { prompt_ = Prompt::None; cmdline_.clear(); return; }
  if (is_backspace(ch)) {
    if (cmdline_.empty()) prompt_ = Prompt::None;
    else cmdline_.pop_back();
    return;
  }
  if (is_enter(ch)) {
    Prompt p = prompt_;
    std::string line = cmdline_;
    prompt_ = Prompt::None;
    cmdline_.clear();
    if (p == Prompt::Search) {
      session_.find(line);
      report_search();
    } else {
      execute_command_line(line);
    }
    return;
  }
  if (is_printable(ch)) cmdline_.push_back(static_cast<char>(ch));
}

void Editor::handle_mouse() {
  MEVENT me;
  if (getmouse(&me) != OK) return;
  HitTarget h = Renderer::hit_test(renderer_.last_layout(), session_, me.y, me.x);
  if (me.bstate & BUTTON1_PRESSED) {
    switch (h.kind) {
      case HitTarget::Kind::ColumnHeader: session_.select_column(h.col); break;
      case HitTarget::Kind::RowGutter: session_.select_row(h.row); break;
      case HitTarget::Kind::Corner: session_.select_all(); break;
      case HitTarget::Kind::Cell: {
        if (session_.edit().is_editing(h.row, h.col)) break;
        auto now = std::chrono::steady_clock::now();
        CellPos pos{h.row, h.col};
        if (last_press_ && *last_press_ == pos && now - last_press_at_ < kDoubleClick) {
          session_.begin_edit(h.row, h.col);
          last_press_.reset();
        } else {
          session_.select_cell(h.row, h.col);
          last_press_ = pos;
          last_press_at_ = now;
        }
      } break;
      case HitTarget::Kind::None: break;
    }
    return;
  }
  if (me.bstate & (BUTTON1_RELEASED | REPORT_MOUSE_POSITION)) {
    if (h.kind == HitTarget::Kind::Cell) session_.drag_to(h.row, h.col);
    if (me.bstate & BUTTON1_RELEASED) session_.end_drag();
  }
}

void Editor::set_mouse(bool on) {
  enable_mouse_ = on;
  term_.set_mouse_tracking(on);
}

void Editor::execute_command_line(const std::string& line) {
  std::string s = line;
  if (!s.empty() && s[0] == ':') s.erase(s.begin());
  if (!s.empty() && s[0] == '/') {
    session_.find(s.substr(1));
    report_search();
    return;
  }
  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  if (cmd.empty()) return;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd == "set" && !args.empty()) {
    std::string opt = args[0];
    std::string name = opt;
    std::string value;
    size_t eq = opt.find('=');
    if (eq != std::string::npos) {
      name = opt.substr(0, eq);
      value = opt.substr(eq + 1);
    }
    std::string composite = std::string("set ") + name;
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    if (!registry_.execute(composite, subargs)) { message_ = "unknown command: " + composite; }
    return;
  }
  if (!registry_.execute(cmd, args)) { message_ = "unknown command: " + cmd; }
}

void Editor::load_rc() {
  std::error_code ec;
  const char* home = std::getenv("HOME");
  if (!home) return;
  auto p = std::filesystem::path(home) / MG_RC_NAME;
  if (!std::filesystem::exists(p, ec)) return;
  std::string bytes, msg;
  if (!read_file_bytes(p, bytes, msg)) { message_ = msg; return; }
  for (std::string s : split_records(bytes)) {
    auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
    size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
    size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
    s = (j > i) ? s.substr(i, j - i) : std::string();
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    execute_command_line(s);
  }
}

bool Editor::apply_loaded_bytes(const PendingLoad& load) {
  if (!load.ok) { message_ = load.message; return false; }
  Rows rows;
  std::string msg;
  if (!parse_csv(load.bytes, delimiter_for(load.name, delimiter_), rows, msg)) {
    message_ = msg + ": " + load.name.string();
    return false;
  }
  session_.load_rows(std::move(rows), load.name);
  vp_ = Viewport{};
  message_ = load.message + " (" + std::to_string(session_.grid().row_count()) + " rows)";
  return true;
}

void Editor::open_file_sync(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    session_.mark_saved(path);
    message_ = std::string("new file: ") + path.string();
    return;
  }
  PendingLoad load;
  load.name = path;
  load.ok = read_file_bytes(path, load.bytes, load.message);
  apply_loaded_bytes(load);
}

void Editor::open_file_async(const std::filesystem::path& path, bool force) {
  if (session_.dirty() && !force) { message_ = "unsaved changes, use :e! <path>"; return; }
  if (pending_read_.valid() || mailbox_.pending()) { message_ = "a load is already in progress"; return; }
  message_ = std::string("loading ") + path.string() + " ...";
  pending_read_ = std::async(std::launch::async, [this, path]() {
    PendingLoad load;
    load.name = path;
    load.ok = read_file_bytes(path, load.bytes, load.message);
    return mailbox_.post(std::move(load));
  });
}

bool Editor::poll_mailbox() {
  if (pending_read_.valid() && pending_read_.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
    if (!pending_read_.get()) message_ = "load dropped: another load was pending";
  }
  auto load = mailbox_.take();
  if (!load) return false;
  return apply_loaded_bytes(*load);
}

void Editor::save_to(const std::optional<std::filesystem::path>& path, bool quit_after) {
  std::optional<std::filesystem::path> target = path ? path : session_.file_path();
  if (!target) { message_ = "don't have path, use :w <path>"; return; }
  std::string msg;
  if (!save_csv_file(*target, session_.rows(), delimiter_for(*target, delimiter_), msg)) {
    message_ = msg;
    return;
  }
  session_.mark_saved(*target);
  message_ = msg;
  if (quit_after) close_or_quit(true);
}

bool Editor::close_or_quit(bool force) {
  if (session_.dirty() && !force) {
    message_ = "unsaved changes, use :q! to quit";
    return false;
  }
  should_quit_ = true;
  return true;
}

void Editor::copy_selection() {
  std::string text = session_.copy();
  if (text.empty()) return;
  if (clipboard_.set_text(text)) message_ = "copied " + std::to_string(count_records(text)) + " line(s)";
}

void Editor::cut_selection() {
  if (session_.editing()) return;
  std::string text = session_.cut();
  if (text.empty()) return;
  if (clipboard_.set_text(text)) message_ = "cut " + std::to_string(count_records(text)) + " line(s)";
}

void Editor::paste_clipboard() {
  auto text = clipboard_.get_text();
  if (!text || text->empty()) { message_ = "clipboard empty"; return; }
  session_.paste(*text);
}

void Editor::report_search() {
  const SearchIndex& si = session_.search();
  if (si.query().empty()) { message_ = "pattern empty"; return; }
  int n = static_cast<int>(si.results().size());
  if (n == 0) { message_ = "not found pattern: " + si.query(); return; }
  message_ = "match " + std::to_string(si.current_index() + 1) + " of " + std::to_string(n);
}
