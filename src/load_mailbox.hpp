#pragma once
/*
 * LoadMailbox
 *
 * Purpose: single-slot handoff from an async file read to the UI loop.
 * Contract: the slot is empty or holds exactly one (bytes, name) pair;
 *           take() empties it atomically. post() refuses while occupied.
 */
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

struct PendingLoad {
  std::string bytes;
  std::filesystem::path name;
  bool ok = true;       // false when the read itself failed
  std::string message;  // read status or error text
};

class LoadMailbox {
public:
  bool post(PendingLoad load);
  std::optional<PendingLoad> take();
  bool pending() const;

private:
  mutable std::mutex mu_;
  std::optional<PendingLoad> slot_;
};
