#include "reporter.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <termcolor/termcolor.hpp>

static std::string get_timestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tm{};
  localtime_r(&time, &tm);

  std::stringstream ss;
  ss << std::put_time(&tm, "%H:%M:%S");
  ss << "." << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

std::optional<LogLevel> parse_log_level(const std::string &name) {
  if (name == "debug" || name == "DEBUG")
    return LogLevel::Debug;
  if (name == "info" || name == "INFO")
    return LogLevel::Info;
  if (name == "warning" || name == "WARNING" || name == "warn")
    return LogLevel::Warning;
  if (name == "error" || name == "ERROR")
    return LogLevel::Error;
  return std::nullopt;
}

const char *to_string(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARNING";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

ConsoleReporter::ConsoleReporter(LogLevel level) : min_level(level) {}

void ConsoleReporter::set_level(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  min_level = level;
}

bool ConsoleReporter::open_log_file(const fs::path &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  log_file.open(path, std::ios::out | std::ios::trunc);
  return log_file.is_open();
}

void ConsoleReporter::log(LogLevel level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string timestamp = get_timestamp();

  if (log_file.is_open()) {
    log_file << timestamp << " " << std::setw(7) << std::left
             << to_string(level) << " " << message << "\n";
    log_file.flush();
  }

  if (level < min_level) {
    return;
  }

  std::ostream &out = (level >= LogLevel::Warning) ? std::cerr : std::cout;

  out << termcolor::bright_blue << "[" << timestamp << "]" << termcolor::reset
      << " ";

  switch (level) {
  case LogLevel::Debug:
    out << termcolor::white << message << termcolor::reset;
    break;
  case LogLevel::Info:
    out << message;
    break;
  case LogLevel::Warning:
    out << termcolor::yellow << "⚠ Warning: " << termcolor::reset << message;
    break;
  case LogLevel::Error:
    out << termcolor::bright_red << "✗ Error: " << termcolor::reset
        << message;
    break;
  }

  out << std::endl;
}
