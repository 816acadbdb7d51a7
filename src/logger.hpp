#pragma once
/*
 * Logger
 *
 * Purpose: leveled log lines to a file ("[time] [LEVEL] [file::func] msg").
 * Note: file sink only; stdout/stderr belong to ncurses while the session runs.
 * Usage: Logger::instance().open(path, level, msg); IEA_LOG_INFO("...");
 */
#include <fstream>
#include <string>

enum class LogLevel { Debug = 0, Info = 1, Warning = 2, Error = 3, None = 4 };

bool parse_log_level(const std::string& s, LogLevel& out);
const char* log_level_name(LogLevel level);

class Logger {
public:
  static Logger& instance();

  bool open(const std::string& path, LogLevel level, std::string& msg);
  void close();
  bool is_open() const { return file_.is_open(); }

  void set_level(LogLevel level) { level_ = level; }
  LogLevel level() const { return level_; }
  bool enabled(LogLevel level) const { return file_.is_open() && level != LogLevel::None && level >= level_; }

  void log(LogLevel level, const char* file, const char* func, const std::string& message);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

private:
  Logger() = default;
  ~Logger();

  std::ofstream file_;
  LogLevel level_ = LogLevel::Info;
};

#define IEA_LOG_DEBUG(msg) Logger::instance().log(LogLevel::Debug, __FILE__, __func__, msg)
#define IEA_LOG_INFO(msg) Logger::instance().log(LogLevel::Info, __FILE__, __func__, msg)
#define IEA_LOG_WARN(msg) Logger::instance().log(LogLevel::Warning, __FILE__, __func__, msg)
#define IEA_LOG_ERROR(msg) Logger::instance().log(LogLevel::Error, __FILE__, __func__, msg)
