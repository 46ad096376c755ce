#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch command-line commands (also used by ~/.mgridrc).
 * Design: map name -> handler (args vector); Editor parses and routes.
 */
#include <functional>
#include <map>
#include <string>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<void(const std::vector<std::string>&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  void register_alias(const std::string& alias, const std::string& name) {
    auto it = map_.find(name);
    if (it != map_.end()) map_[alias] = it->second;
  }
  bool contains(const std::string& name) const { return map_.count(name) != 0; }
  bool execute(const std::string& name, const std::vector<std::string>& args) const {
    auto it = map_.find(name);
    if (it == map_.end()) return false;
    it->second(args);
    return true;
  }
  std::vector<std::string> names() const {
    std::vector<std::string> out;
    out.reserve(map_.size());
    for (const auto& kv : map_) out.push_back(kv.first);
    return out;
  }
private:
  std::map<std::string, Handler> map_;
};
