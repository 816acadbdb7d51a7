#include "settings.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

static void test_command_line() {
  const char* argv[] = {"ieassist", "--environment", "azure", "--working-directory=/tmp", "--log-level", "debug"};
  CommandLine cl; std::string msg;
  assert(parse_command_line(6, argv, cl, msg));
  assert(*cl.environment == "azure");
  assert(*cl.working_directory == "/tmp");
  assert(*cl.log_level == LogLevel::Debug);
  assert(!cl.log_file.has_value());

  const char* bad[] = {"ieassist", "--bogus"};
  CommandLine cl2;
  assert(!parse_command_line(2, bad, cl2, msg));
  assert(msg.find("--bogus") != std::string::npos);

  const char* missing[] = {"ieassist", "--environment"};
  CommandLine cl3;
  assert(!parse_command_line(2, missing, cl3, msg));

  const char* level[] = {"ieassist", "--log-level=loud"};
  CommandLine cl4;
  assert(!parse_command_line(2, level, cl4, msg));

  const char* help[] = {"ieassist", "--help"};
  CommandLine cl5;
  assert(parse_command_line(2, help, cl5, msg));
  assert(cl5.show_usage);
}

static void test_set_commands() {
  Settings s;
  SettingsLoader loader(s);
  std::string msg;
  assert(loader.execute_line("set charlimit=120", msg));
  assert(s.char_limit == 120);
  assert(loader.execute_line(":set tick 250", msg));
  assert(s.tick_ms == 250);
  assert(loader.execute_line("set help on", msg));
  assert(s.show_full_help);
  assert(loader.execute_line("set environment=staging", msg));
  assert(s.environment == "staging");
  assert(loader.execute_line("set loglevel=warning", msg));
  assert(s.log_level == LogLevel::Warning);

  assert(!loader.execute_line("set charlimit=0", msg));
  assert(!loader.execute_line("set charlimit=abc", msg));
  assert(!loader.execute_line("set charlimit=99999999999", msg));
  assert(s.char_limit == 120);
  assert(!loader.execute_line("set tick=1", msg));
  assert(!loader.execute_line("frobnicate", msg));
  assert(msg.find("unknown command") != std::string::npos);
}

static void test_rc_file_and_precedence() {
  auto path = std::filesystem::temp_directory_path() / ("ieassistrc_" + std::to_string(::getpid()));
  {
    std::ofstream out(path);
    out << "# comment\n"
        << "\" vim-style comment\n"
        << "// another\n"
        << "\n"
        << "set charlimit=42\r\n"
        << "set environment=from-rc\n"
        << "set nonsense=1\n";
  }
  Settings s;
  SettingsLoader loader(s);
  std::vector<std::string> problems;
  assert(loader.load_rc(path.string(), problems));
  assert(s.char_limit == 42);
  assert(s.environment == "from-rc");
  assert(problems.size() == 1);
  assert(problems[0].find(":7:") != std::string::npos);

  CommandLine cl;
  cl.environment = "from-cli";
  loader.apply(cl);
  assert(s.environment == "from-cli");
  assert(s.char_limit == 42);

  std::vector<std::string> none;
  assert(loader.load_rc((path.string() + ".missing"), none));
  assert(none.empty());

  std::vector<std::string> explicit_missing;
  assert(!loader.load_rc((path.string() + ".missing"), explicit_missing, true));
  assert(explicit_missing.size() == 1);
  assert(explicit_missing[0].find("config file not found") != std::string::npos);
  std::filesystem::remove(path);
}

int main() {
  test_command_line();
  test_set_commands();
  test_rc_file_and_precedence();
  return 0;
}
