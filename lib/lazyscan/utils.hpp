/**
 * @file utils.hpp
 * @brief Small helpers shared by the library and the CLI
 *
 * - formatBytes: human-readable size formatting
 * - toIsoTimestamp / fromIsoTimestamp: UTC timestamps for audit and backup records
 * - isOlderThan: age checks for retention and report windows
 * - generateUuid: random operation and session identifiers
 * - trim: whitespace stripping for typed confirmations
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <chrono>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

/**
 * @brief Formats byte count into human-readable size string
 *
 * Uses binary units (1024 bytes = 1 KB) with one decimal place, up to TB.
 *
 * Example outputs:
 * - formatBytes(0) → "0 B"
 * - formatBytes(1536) → "1.5 KB"
 * - formatBytes(1073741824) → "1.0 GB"
 */
inline std::string formatBytes(unsigned long long bytes) {
  if (bytes == 0)
    return "0 B";

  const char *units[] = {"B", "KB", "MB", "GB", "TB"};
  int unit = 0;
  double size = static_cast<double>(bytes);

  while (size >= 1024.0 && unit < 4) {
    size /= 1024.0;
    unit++;
  }

  char buf[32];
  snprintf(buf, sizeof(buf), "%.1f %s", size, units[unit]);
  return std::string(buf);
}

/**
 * @brief Formats a time point as ISO-8601 UTC ("2026-10-18T09:30:00Z")
 */
inline std::string toIsoTimestamp(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm utc{};
#ifdef _WIN32
  gmtime_s(&utc, &t);
#else
  gmtime_r(&t, &utc);
#endif

  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return std::string(buf);
}

/**
 * @brief Parses a timestamp written by toIsoTimestamp()
 * @return std::nullopt if the string is not in that exact format
 */
inline std::optional<std::chrono::system_clock::time_point>
fromIsoTimestamp(const std::string &value) {
  std::tm utc{};
  int consumed = 0;
  if (std::sscanf(value.c_str(), "%4d-%2d-%2dT%2d:%2d:%2dZ%n", &utc.tm_year,
                  &utc.tm_mon, &utc.tm_mday, &utc.tm_hour, &utc.tm_min,
                  &utc.tm_sec, &consumed) != 6 ||
      static_cast<size_t>(consumed) != value.size()) {
    return std::nullopt;
  }
  utc.tm_year -= 1900;
  utc.tm_mon -= 1;

#ifdef _WIN32
  std::time_t t = _mkgmtime(&utc);
#else
  std::time_t t = timegm(&utc);
#endif
  if (t == static_cast<std::time_t>(-1))
    return std::nullopt;
  return std::chrono::system_clock::from_time_t(t);
}

/**
 * @brief True if @p tp lies more than @p windowSeconds in the past
 *
 * The window is compared in seconds so that very long retention periods
 * cannot overflow a chrono duration.
 */
inline bool isOlderThan(std::chrono::system_clock::time_point tp,
                        long long windowSeconds) {
  auto age = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now() - tp);
  return age.count() > windowSeconds;
}

/**
 * @brief Returns a new random (version 4) UUID in canonical text form
 */
inline std::string generateUuid() {
  static boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

inline std::string trim(const std::string &value) {
  const char *ws = " \t\r\n";
  auto first = value.find_first_not_of(ws);
  if (first == std::string::npos)
    return "";
  auto last = value.find_last_not_of(ws);
  return value.substr(first, last - first + 1);
}

#endif // UTILS_HPP
