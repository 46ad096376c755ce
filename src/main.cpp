#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "clipboard.hpp"
#include "editor.hpp"
#include <optional>
#include <filesystem>

int main(int argc, char** argv) {
  std::optional<std::filesystem::path> path;
  if (argc >= 2) path = std::filesystem::path(argv[1]);
  Terminal term;
  NcursesTerminal screen;
  RegisterClipboard clipboard;
  Editor ed(screen, clipboard, path);
  ed.run();
  return 0;
}
