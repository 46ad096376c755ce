#pragma once
/*
 * Editor
 *
 * Purpose: terminal front end. Translates keys, mouse events and command lines
 *          into Session operations, renders through ITerminal, and owns the
 *          status-line message every outcome is reported through.
 * Async: `e <path>` reads on a worker; the loop polls the LoadMailbox each tick.
 */
#include <chrono>
#include <filesystem>
#include <future>
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"
#include "session.hpp"
#include "renderer.hpp"
#include "iterminal.hpp"
#include "clipboard.hpp"
#include "cmd_registry.hpp"
#include "load_mailbox.hpp"

class Editor {
public:
  Editor(ITerminal& term, IClipboard& clipboard, const std::optional<std::filesystem::path>& file);
  void run();

  void handle_input(int ch);
  void execute_command_line(const std::string& line);
  bool poll_mailbox();
  void render();

  const Session& session() const { return session_; }
  Mode mode() const;
  const std::string& message() const { return message_; }
  bool quitting() const { return should_quit_; }
  char delimiter() const { return delimiter_; }
  bool loading() const { return pending_read_.valid() || mailbox_.pending(); }

private:
  Session session_;
  ITerminal& term_;
  IClipboard& clipboard_;
  Renderer renderer_;
  CommandRegistry registry_;
  LoadMailbox mailbox_;
  std::future<bool> pending_read_;
  Viewport vp_;
  std::string message_;
  std::string cmdline_;
  enum class Prompt { None, Command, Search };
  Prompt prompt_ = Prompt::None;
  char delimiter_ = ',';
  bool should_quit_ = false;
  bool enable_mouse_ = true;
  std::optional<CellPos> last_press_;
  std::chrono::steady_clock::time_point last_press_at_{};

  void handle_normal_input(int ch);
  void handle_edit_input(int ch);
  void handle_prompt_input(int ch);
  void handle_mouse();
  void register_commands();
  void load_rc();
  void open_file_sync(const std::filesystem::path& path);
  void open_file_async(const std::filesystem::path& path, bool force);
  bool apply_loaded_bytes(const PendingLoad& load);
  void save_to(const std::optional<std::filesystem::path>& path, bool quit_after);
  bool close_or_quit(bool force);
  void copy_selection();
  void cut_selection();
  void paste_clipboard();
  void set_mouse(bool on);
  void report_search();
};
