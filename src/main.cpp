#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "session.hpp"
#include "logger.hpp"
#include <exception>
#include <iostream>

int main(int argc, char** argv) try {
  CommandLine cl;
  std::string err;
  if (!parse_command_line(argc, argv, cl, err)) {
    std::cerr << err << "\n" << usage(argv[0]);
    return 2;
  }
  if (cl.show_usage) { std::cout << usage(argv[0]); return 0; }

  Settings settings;
  settings.rc_path = cl.rc_path ? *cl.rc_path : default_rc_path();
  SettingsLoader loader(settings);
  std::vector<std::string> problems;
  loader.load_rc(settings.rc_path, problems, cl.rc_path.has_value());
  loader.apply(cl);

  if (!settings.log_file.empty()) {
    std::string msg;
    if (!Logger::instance().open(settings.log_file, settings.log_level, msg)) problems.push_back(msg);
  }
  for (const auto& p : problems) IEA_LOG_WARN(p);
  IEA_LOG_INFO("environment=" + settings.environment + " workdir=" + settings.working_directory +
               " charlimit=" + std::to_string(settings.char_limit));

  RuleBasedGenerator generator(ResponseCatalog::defaults());
  {
    Terminal term(settings.tick_ms);
    NcursesTerminal screen(settings.tick_ms);
    Session session(screen, Keymap::defaults(), generator, settings);
    if (!problems.empty()) session.set_message(problems.back());
    session.run();
  }
  Logger::instance().close();
  return 0;
} catch (const std::exception& ex) {
  std::cerr << "ieassist: " << ex.what() << "\n";
  return 1;
}
