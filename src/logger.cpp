#include "logger.hpp"
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

bool parse_log_level(const std::string& s, LogLevel& out) {
  if (s == "debug") { out = LogLevel::Debug; return true; }
  if (s == "info") { out = LogLevel::Info; return true; }
  if (s == "warning" || s == "warn") { out = LogLevel::Warning; return true; }
  if (s == "error") { out = LogLevel::Error; return true; }
  if (s == "none" || s == "off") { out = LogLevel::None; return true; }
  return false;
}

const char* log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error: return "ERROR";
    case LogLevel::None: return "NONE";
  }
  return "UNKNOWN";
}

static std::string timestamp() {
  auto now = std::chrono::system_clock::now();
  auto now_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
  std::tm tm_buf{};
  localtime_r(&now_t, &tm_buf);
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

static const char* basename_of(const char* path) {
  const char* slash = std::strrchr(path, '/');
  return slash ? slash + 1 : path;
}

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

Logger::~Logger() { close(); }

bool Logger::open(const std::string& path, LogLevel level, std::string& msg) {
  close();
  level_ = level;
  file_.open(path, std::ios::out | std::ios::app);
  if (!file_.is_open()) { msg = std::string("can not open log file: ") + path; return false; }
  msg = std::string("logging to: ") + path;
  return true;
}

void Logger::close() {
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

void Logger::log(LogLevel level, const char* file, const char* func, const std::string& message) {
  if (!enabled(level)) return;
  file_ << "[" << timestamp() << "] [" << std::setw(7) << std::left << log_level_name(level) << "] ["
        << basename_of(file) << "::" << func << "] " << message << '\n';
  file_.flush();
}
