#include "settings.hpp"
#include "file_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return s.substr(i, j - i);
}

static bool parse_bounded_int(const std::string& s, int lo, int hi, int& out) {
  if (s.empty() || s.size() > 9) return false;
  bool digits = std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
  if (!digits) return false;
  int v = std::stoi(s);
  if (v < lo || v > hi) return false;
  out = v;
  return true;
}

std::string default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home) return std::string();
  return (std::filesystem::path(home) / IEA_RC_NAME).string();
}

std::string usage(const char* prog) {
  std::ostringstream oss;
  oss << "usage: " << (prog ? prog : "ieassist")
      << " [--environment <tag>] [--working-directory <dir>]"
      << " [--log-file <path>] [--log-level debug|info|warning|error|none]"
      << " [--config <rc-path>] [--help]\n";
  return oss.str();
}

bool parse_command_line(int argc, const char* const* argv, CommandLine& out, std::string& msg) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;
    bool has_value = false;
    size_t eq = arg.find('=');
    if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
      value = arg.substr(eq + 1);
      arg = arg.substr(0, eq);
      has_value = true;
    }
    if (arg == "--help" || arg == "-h") { out.show_usage = true; continue; }
    bool known = arg == "--environment" || arg == "--working-directory" || arg == "--log-file" ||
                 arg == "--log-level" || arg == "--config";
    if (!known) { msg = "unknown option: " + arg; return false; }
    if (!has_value) {
      if (i + 1 >= argc) { msg = "missing value for " + arg; return false; }
      value = argv[++i];
    }
    if (arg == "--environment") out.environment = value;
    else if (arg == "--working-directory") out.working_directory = value;
    else if (arg == "--log-file") out.log_file = value;
    else if (arg == "--config") out.rc_path = value;
    else {
      LogLevel lv;
      if (!parse_log_level(value, lv)) { msg = "invalid log level: " + value; return false; }
      out.log_level = lv;
    }
  }
  return true;
}

SettingsLoader::SettingsLoader(Settings& s) : s_(s) {
  register_commands();
}

void SettingsLoader::register_commands() {
  registry_.register_command("set charlimit", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set charlimit: use set charlimit=<n>"; return false; }
    int v = 0;
    if (!parse_bounded_int(args[0], 1, IEA_MAX_CHAR_LIMIT, v)) {
      msg = "set charlimit: must be a number in 1.." + std::to_string(IEA_MAX_CHAR_LIMIT);
      return false;
    }
    s_.char_limit = v;
    msg = "charlimit=" + std::to_string(v);
    return true;
  });
  registry_.register_command("set tick", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set tick: use set tick=<ms>"; return false; }
    int v = 0;
    if (!parse_bounded_int(args[0], IEA_MIN_TICK_MS, IEA_MAX_TICK_MS, v)) {
      msg = "set tick: must be a number in " + std::to_string(IEA_MIN_TICK_MS) + ".." + std::to_string(IEA_MAX_TICK_MS);
      return false;
    }
    s_.tick_ms = v;
    msg = "tick=" + std::to_string(v);
    return true;
  });
  registry_.register_command("set help", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { s_.show_full_help = !s_.show_full_help; msg = s_.show_full_help ? "help on" : "help off"; return true; }
    if (args[0] == "on") { s_.show_full_help = true; msg = "help on"; return true; }
    if (args[0] == "off") { s_.show_full_help = false; msg = "help off"; return true; }
    msg = "set help: use set help on|off";
    return false;
  });
  registry_.register_command("set environment", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set environment: use set environment=<tag>"; return false; }
    s_.environment = args[0];
    msg = "environment=" + args[0];
    return true;
  });
  registry_.register_command("set workdir", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set workdir: use set workdir=<dir>"; return false; }
    s_.working_directory = args[0];
    msg = "workdir=" + args[0];
    return true;
  });
  registry_.register_command("set logfile", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set logfile: use set logfile=<path>"; return false; }
    s_.log_file = args[0];
    msg = "logfile=" + args[0];
    return true;
  });
  registry_.register_command("set loglevel", [this](const std::vector<std::string>& args, std::string& msg){
    LogLevel lv;
    if (args.empty() || !parse_log_level(args[0], lv)) {
      msg = "set loglevel: use set loglevel=debug|info|warning|error|none";
      return false;
    }
    s_.log_level = lv;
    msg = std::string("loglevel=") + log_level_name(lv);
    return true;
  });
}

bool SettingsLoader::execute_line(const std::string& raw, std::string& msg) {
  std::string line = trim(raw);
  if (!line.empty() && line[0] == ':') line.erase(line.begin());
  std::istringstream iss(line);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd == "set" && !args.empty()) {
    std::string name = args[0];
    std::vector<std::string> subargs;
    size_t eq = name.find('=');
    if (eq != std::string::npos) {
      subargs.push_back(name.substr(eq + 1));
      name = name.substr(0, eq);
    }
    subargs.insert(subargs.end(), args.begin() + 1, args.end());
    return registry_.execute("set " + name, subargs, msg);
  }
  return registry_.execute(cmd, args, msg);
}

bool SettingsLoader::load_rc(const std::string& path, std::vector<std::string>& problems, bool required) {
  if (path.empty()) return true;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (!required) return true;
    problems.push_back("config file not found: " + path);
    return false;
  }
  std::vector<std::string> lines; std::string msg;
  if (!read_lines(path, lines, msg)) { problems.push_back(msg); return false; }
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string s = trim(lines[i]);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    std::string m;
    if (!execute_line(s, m)) problems.push_back(path + ":" + std::to_string(i + 1) + ": " + m);
  }
  return true;
}

void SettingsLoader::apply(const CommandLine& cl) {
  if (cl.environment) s_.environment = *cl.environment;
  if (cl.working_directory) s_.working_directory = *cl.working_directory;
  if (cl.log_file) s_.log_file = *cl.log_file;
  if (cl.log_level) s_.log_level = *cl.log_level;
  if (cl.rc_path) s_.rc_path = *cl.rc_path;
}
