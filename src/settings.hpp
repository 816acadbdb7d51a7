#pragma once
/*
 * Settings
 *
 * Purpose: process configuration (environment tag, working dir, limits, logging).
 * Precedence: built-in defaults < rc file (~/.ieassistrc) < command line.
 * Errors: rc problems never abort start-up; they are collected as messages.
 */
#include <optional>
#include <string>
#include <vector>
#include "cmd_registry.hpp"
#include "config.hpp"
#include "logger.hpp"

struct Settings {
  std::string environment = "local";
  std::string working_directory = ".";
  int char_limit = IEA_DEFAULT_CHAR_LIMIT;
  int tick_ms = IEA_DEFAULT_TICK_MS;
  bool show_full_help = false;
  std::string log_file;
  LogLevel log_level = LogLevel::Info;
  std::string rc_path;
};

struct CommandLine {
  std::optional<std::string> environment;
  std::optional<std::string> working_directory;
  std::optional<std::string> log_file;
  std::optional<LogLevel> log_level;
  std::optional<std::string> rc_path;
  bool show_usage = false;
};

bool parse_command_line(int argc, const char* const* argv, CommandLine& out, std::string& msg);
std::string usage(const char* prog);
std::string default_rc_path();

class SettingsLoader {
public:
  explicit SettingsLoader(Settings& s);

  bool execute_line(const std::string& line, std::string& msg);
  // a missing file is fine unless it was asked for explicitly (required)
  bool load_rc(const std::string& path, std::vector<std::string>& problems, bool required = false);
  void apply(const CommandLine& cl);

private:
  void register_commands();

  Settings& s_;
  CommandRegistry registry_;
};
