#include "appconfig.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#ifndef _WIN32
#include <pwd.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace {

fs::path envPath(const char *name, const fs::path &fallback) {
  const char *value = std::getenv(name);
  if (value && *value && fs::path(value).is_absolute())
    return fs::path(value);
  return fallback;
}

} // namespace

bool isEnabledFlag(const char *value) {
  if (!value)
    return false;
  std::string v = trim(value);
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return v == "1" || v == "true" || v == "yes" || v == "on";
}

fs::path resolveHomeDirectory() {
  const char *home = std::getenv("HOME");
  if (home && *home)
    return fs::path(home);
#ifndef _WIN32
  if (const passwd *pw = getpwuid(getuid())) {
    if (pw->pw_dir && *pw->pw_dir)
      return fs::path(pw->pw_dir);
  }
#else
  if (const char *profile = std::getenv("USERPROFILE"))
    return fs::path(profile);
#endif
  throw PathValidationError("Cannot determine the home directory");
}

AppConfig loadAppConfig() {
  AppConfig config;
  config.homeDir = resolveHomeDirectory();

  config.dataDir = envPath("LAZYSCAN_HOME", config.homeDir / ".lazyscan");
  config.auditLogFile = config.dataDir / "audit.jsonl";
  config.backupDir = config.dataDir / "backups";

  fs::path configHome = envPath("XDG_CONFIG_HOME", config.homeDir / ".config");
  config.policyFile = configHome / "lazyscan" / "policy.json";

  config.trashDataHome =
      envPath("XDG_DATA_HOME", config.homeDir / ".local" / "share");

  config.killSwitchEngaged =
      isEnabledFlag(std::getenv("LAZYSCAN_DISABLE_DELETIONS"));

  const char *level = std::getenv("LAZYSCAN_LOG_LEVEL");
  config.logLevel =
      Log::levelFromString(level ? level : "", LogLevel::Warn);

  return config;
}
