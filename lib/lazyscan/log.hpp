#ifndef LOG_HPP
#define LOG_HPP

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

/**
 * @brief Diagnostic messages on stderr
 *
 * Operator-facing diagnostics only. Deletion decisions go to the audit
 * trail (AuditLogger), never through here.
 */
enum class LogLevel { Debug, Info, Warn, Error, Off };

class Log {
public:
  static void setLevel(LogLevel level) { s_level = level; }
  static LogLevel level() { return s_level; }

  /**
   * @brief Parses "debug", "info", "warn"/"warning", "error", "off"
   * @return fallback for unknown or empty values
   */
  static LogLevel levelFromString(std::string value, LogLevel fallback) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (value == "debug")
      return LogLevel::Debug;
    if (value == "info")
      return LogLevel::Info;
    if (value == "warn" || value == "warning")
      return LogLevel::Warn;
    if (value == "error")
      return LogLevel::Error;
    if (value == "off")
      return LogLevel::Off;
    return fallback;
  }

  static void debug(const std::string &message) {
    write(LogLevel::Debug, "debug", message);
  }
  static void info(const std::string &message) {
    write(LogLevel::Info, "info", message);
  }
  static void warn(const std::string &message) {
    write(LogLevel::Warn, "warning", message);
  }
  static void error(const std::string &message) {
    write(LogLevel::Error, "error", message);
  }

private:
  static void write(LogLevel level, const char *tag,
                    const std::string &message) {
    if (level < s_level)
      return;
    std::cerr << "lazyscan: " << tag << ": " << message << std::endl;
  }

  inline static LogLevel s_level = LogLevel::Warn;
};

#endif // LOG_HPP
