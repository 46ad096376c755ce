#include <ncurses.h>
#include "editor.hpp"
#include "headless_terminal.hpp"
#include "clipboard.hpp"
#include "file_io.hpp"
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

static constexpr int ctrl(char c) { return c & 0x1f; }

static void type(Editor& ed, const std::string& s) {
  for (char c : s) ed.handle_input(static_cast<unsigned char>(c));
}

// true when the finished load replaced the grid
static bool wait_for_load(Editor& ed) {
  bool applied = false;
  for (int i = 0; i < 500 && ed.loading(); ++i) {
    if (ed.poll_mailbox()) applied = true;
    if (ed.loading()) std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  assert(!ed.loading());
  return applied;
}

static void test_keys(const fs::path& dir) {
  HeadlessTerminal term(24, 80);
  RegisterClipboard cb;
  Editor ed(term, cb, dir / "fresh.csv");
  assert(ed.session().file_path() == dir / "fresh.csv");
  assert(!ed.session().dirty());
  // the rc file runs after the file is opened; it turned the frozen header on and narrowed column A
  assert(ed.session().frozen_header());
  assert(ed.session().column_width(0) == 7);
  assert(ed.delimiter() == ';');
  assert(ed.message() == "delimiter ;");

  ed.handle_input(KEY_RIGHT);
  assert(ed.session().selection() == single_cell(0, 1));
  type(ed, "ab");
  assert(ed.mode() == Mode::Edit);
  ed.handle_input(KEY_LEFT);
  ed.handle_input(KEY_BACKSPACE);
  ed.handle_input('\n');
  assert(ed.mode() == Mode::Normal);
  assert(ed.session().grid().cell(0, 1) == "b");
  assert(ed.session().selection() == single_cell(1, 1));

  ed.handle_input(KEY_UP);
  ed.handle_input(ctrl('c'));
  ed.handle_input(KEY_DOWN);
  ed.handle_input(ctrl('v'));
  assert(ed.session().grid().cell(1, 1) == "b");
  ed.handle_input(ctrl('z'));
  assert(ed.session().grid().cell(1, 1).empty());
  ed.handle_input(ctrl('y'));
  assert(ed.session().grid().cell(1, 1) == "b");

  ed.handle_input(KEY_SRIGHT);
  assert(ed.session().selection() == (Selection{CellRange{{1, 1}, {1, 2}}}));
  ed.handle_input(KEY_DC);
  assert(ed.session().grid().cell(1, 1).empty());

  ed.handle_input(ctrl('f'));
  assert(ed.mode() == Mode::Search);
  type(ed, "b\n");
  assert(ed.mode() == Mode::Normal);
  assert(ed.message() == "match 1 of 1");
  assert(ed.session().selection() == single_cell(0, 1));
  ed.handle_input(KEY_F(3));
  assert(ed.message() == "match 1 of 1");

  ed.handle_input(ctrl('k'));
  assert(ed.mode() == Mode::Command);
  type(ed, "nope");
  ed.handle_input(KEY_BACKSPACE);
  type(ed, "e\n");
  assert(ed.message() == "unknown command: nope");
  ed.handle_input(ctrl('k'));
  ed.handle_input(KEY_BACKSPACE);
  assert(ed.mode() == Mode::Normal);

  ed.handle_input(ctrl('a'));
  assert(ed.session().selection() == (Selection{CellRange{{0, 0}, {19, 9}}}));
  ed.handle_input(27);
  assert(ed.session().selection() == Selection{NoSelection{}});

  ed.handle_input(ctrl('q'));
  assert(!ed.quitting());
  ed.handle_input(ctrl('s'));
  assert(!ed.session().dirty());
  assert(fs::exists(dir / "fresh.csv"));
  ed.render();
  assert(term.refresh_count() == 1);
  ed.handle_input(ctrl('q'));
  assert(ed.quitting());
}

static void test_commands(const fs::path& dir) {
  HeadlessTerminal term(24, 80);
  RegisterClipboard cb;
  Editor ed(term, cb, std::nullopt);
  // mouse tracking goes through the terminal backend
  assert(!term.mouse_tracking());
  ed.execute_command_line("set mouse on");
  assert(term.mouse_tracking());
  assert(ed.message() == "mouse on");
  ed.execute_command_line("set mouse");
  assert(!term.mouse_tracking());
  assert(ed.message() == "mouse off");

  ed.execute_command_line("set header off");
  ed.execute_command_line("set delimiter ,");
  assert(ed.delimiter() == ',');
  ed.execute_command_line("w");
  assert(ed.message() == "don't have path, use :w <path>");

  ed.execute_command_line("addrow");
  ed.execute_command_line("addcol");
  assert(ed.session().grid().row_count() == 21);
  assert(ed.session().grid().col_count() == 11);
  ed.execute_command_line("dr 21");
  ed.execute_command_line("dc K");
  assert(ed.session().grid().row_count() == 20);
  assert(ed.session().grid().col_count() == 10);
  ed.execute_command_line("dr 99");
  assert(ed.message() == "dr: row out of range");

  fs::path data = dir / "data.csv";
  std::string msg;
  assert(write_file_atomic(data, "name,n\nb,2\na,10\nc,1\n", msg));
  ed.execute_command_line("e " + data.string());
  assert(ed.message().rfind("unsaved changes", 0) == 0);
  ed.execute_command_line("e! " + data.string());
  assert(wait_for_load(ed));
  assert(ed.session().grid().row_count() == 4);
  assert(!ed.session().dirty());

  ed.execute_command_line("set header on");
  ed.execute_command_line("sort desc B");
  assert(ed.session().grid().cell(0, 0) == "name");
  assert(ed.session().grid().cell(1, 0) == "a");
  assert(ed.session().grid().cell(3, 0) == "c");
  assert(ed.message() == "sorted by B descending");
  ed.execute_command_line("undo");
  assert(ed.session().grid().cell(1, 0) == "b");

  ed.execute_command_line("find A");
  assert(ed.message() == "match 1 of 2");
  ed.execute_command_line("set case on");
  ed.execute_command_line("/A");
  assert(ed.message() == "not found pattern: A");

  ed.execute_command_line("set width 30");
  assert(ed.session().column_width(ed.session().cursor().col) == 30);
  ed.execute_command_line("set width x");
  assert(ed.message() == "set width: width must be a number");

  fs::path bad = dir / "bad.csv";
  assert(write_file_atomic(bad, "x,\"open\n", msg));
  ed.execute_command_line("e! " + bad.string());
  assert(wait_for_load(ed) == false);
  assert(ed.message().rfind("malformed csv", 0) == 0);
  assert(ed.session().grid().row_count() == 4);

  fs::path tsv = dir / "out.tsv";
  ed.execute_command_line("w " + tsv.string());
  std::string bytes;
  assert(read_file_bytes(tsv, bytes, msg));
  assert(bytes.rfind("name\tn\n", 0) == 0);

  ed.execute_command_line("e! " + (dir / "missing.csv").string());
  assert(!wait_for_load(ed));
  assert(ed.message().rfind("can not open file: ", 0) == 0);

  ed.execute_command_line("ir");
  assert(ed.session().grid().row_count() == 5);
  ed.execute_command_line("wq");
  assert(ed.quitting());
}

int main() {
  fs::path dir = fs::temp_directory_path() / ("mgrid_editor_" + std::to_string(::getpid()));
  fs::create_directories(dir);
  std::string msg;
  assert(write_file_atomic(dir / ".mgridrc",
                           "# startup\n\" vim-style comment\n:set header on\n\nset width 7\nset delimiter ;\n", msg));
  setenv("HOME", dir.string().c_str(), 1);

  test_keys(dir);
  test_commands(dir);

  std::error_code ec;
  fs::remove_all(dir, ec);
  return 0;
}
