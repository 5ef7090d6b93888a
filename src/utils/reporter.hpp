#ifndef REPORTER_HPP
#define REPORTER_HPP

#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

namespace fs = std::filesystem;

enum class LogLevel { Debug, Info, Warning, Error };

std::optional<LogLevel> parse_log_level(const std::string &name);
const char *to_string(LogLevel level);

// Sink for every user-visible message. Components receive one at
// construction and must not assume it is the console.
class Reporter {
public:
  virtual ~Reporter() = default;

  virtual void log(LogLevel level, const std::string &message) = 0;

  void debug(const std::string &message) { log(LogLevel::Debug, message); }
  void info(const std::string &message) { log(LogLevel::Info, message); }
  void warn(const std::string &message) { log(LogLevel::Warning, message); }
  void error(const std::string &message) { log(LogLevel::Error, message); }
};

// Colored terminal output. Safe to call from the server and watcher
// threads at the same time.
class ConsoleReporter : public Reporter {
private:
  LogLevel min_level;
  std::ofstream log_file;
  std::mutex mutex_;

public:
  explicit ConsoleReporter(LogLevel level = LogLevel::Info);

  void set_level(LogLevel level);

  // Mirror every message, whatever the console level, into a plain file.
  bool open_log_file(const fs::path &path);

  void log(LogLevel level, const std::string &message) override;
};

#endif
