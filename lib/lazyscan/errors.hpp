/**
 * @file errors.hpp
 * @brief Exception hierarchy and process exit codes
 *
 * Exceptions are reserved for conditions the caller cannot treat as a normal
 * outcome: an unloadable policy, a failed backup, an unresolvable path, a
 * missing trash backend. SafeDeleter converts them into a DeletionResult
 * with an ErrorKind before they reach the CLI.
 *
 * @see DeletionResult
 */

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @brief Exit codes reported by the lazyscan executable
 */
enum class ExitCode : int {
  Success = 0,
  GeneralError = 1,
  Usage = 2,
  PathError = 3,
  SecurityError = 5,
  ConfigError = 6,
  UserCancelled = 7,
  PlatformError = 8,
  PartialFailure = 11,
  RecoveryError = 12
};

/**
 * @brief Base class for all lazyscan errors
 *
 * Carries the exit code the CLI should terminate with when the error is
 * not handled closer to its source.
 */
class LazyScanError : public std::runtime_error {
public:
  explicit LazyScanError(const std::string &message,
                         ExitCode code = ExitCode::GeneralError)
      : std::runtime_error(message), m_code(code) {}

  ExitCode exitCode() const { return m_code; }

private:
  ExitCode m_code;
};

/** @brief Path is empty, malformed or cannot be resolved */
class PathValidationError : public LazyScanError {
public:
  explicit PathValidationError(const std::string &message)
      : LazyScanError(message, ExitCode::PathError) {}
};

/** @brief Kill switch, symlink or critical path rejection */
class DeletionSafetyError : public LazyScanError {
public:
  explicit DeletionSafetyError(const std::string &message)
      : LazyScanError(message, ExitCode::SecurityError) {}
};

/** @brief Policy file missing, malformed or invalid. Fatal. */
class SecurityPolicyError : public LazyScanError {
public:
  explicit SecurityPolicyError(const std::string &message)
      : LazyScanError(message, ExitCode::ConfigError) {}
};

/** @brief Backup copy could not be created or verified */
class BackupError : public LazyScanError {
public:
  explicit BackupError(const std::string &message)
      : LazyScanError(message, ExitCode::GeneralError) {}
};

/** @brief Trash primitive unavailable or failed on this platform */
class PlatformError : public LazyScanError {
public:
  explicit PlatformError(const std::string &message)
      : LazyScanError(message, ExitCode::PlatformError) {}
};

/** @brief Restore conflict, missing or corrupt backup */
class RecoveryError : public LazyScanError {
public:
  explicit RecoveryError(const std::string &message)
      : LazyScanError(message, ExitCode::RecoveryError) {}
};

#endif // ERRORS_HPP
