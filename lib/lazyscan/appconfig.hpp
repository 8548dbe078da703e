#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <filesystem>
#include <string>

#include "log.hpp"

/**
 * @brief Process-wide locations and switches, resolved from the environment
 *
 * | Variable                   | Default                              |
 * |----------------------------|--------------------------------------|
 * | LAZYSCAN_HOME              | ~/.lazyscan                          |
 * | XDG_CONFIG_HOME            | ~/.config (policy: lazyscan/policy.json) |
 * | XDG_DATA_HOME              | ~/.local/share (Linux trash)         |
 * | LAZYSCAN_DISABLE_DELETIONS | unset (1/true/yes/on engages it)     |
 * | LAZYSCAN_LOG_LEVEL         | warn                                 |
 */
struct AppConfig {
  std::filesystem::path homeDir;
  std::filesystem::path dataDir;
  std::filesystem::path auditLogFile;
  std::filesystem::path backupDir;
  std::filesystem::path policyFile;
  std::filesystem::path trashDataHome;
  bool killSwitchEngaged = false;
  LogLevel logLevel = LogLevel::Warn;
};

AppConfig loadAppConfig();

/** @brief True for "1", "true", "yes", "on" (any case) */
bool isEnabledFlag(const char *value);

/**
 * @brief $HOME, or the password database entry of the current user
 * @throws PathValidationError if neither is available
 */
std::filesystem::path resolveHomeDirectory();

#endif // APPCONFIG_HPP
