#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch rc-file commands ("set charlimit", ...).
 * Design: map name -> handler(args, msg); handlers report failure via msg.
 */
#include <functional>
#include <map>
#include <string>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<bool(const std::vector<std::string>&, std::string&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool contains(const std::string& name) const { return map_.count(name) != 0; }
  bool execute(const std::string& name, const std::vector<std::string>& args, std::string& msg) const {
    auto it = map_.find(name);
    if (it == map_.end()) { msg = "unknown command: " + name; return false; }
    return it->second(args, msg);
  }
  std::vector<std::string> names() const {
    std::vector<std::string> out;
    for (const auto& kv : map_) out.push_back(kv.first);
    return out;
  }
private:
  std::map<std::string, Handler> map_;
};
