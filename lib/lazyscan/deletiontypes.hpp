/**
 * @file deletiontypes.hpp
 * @brief Value types exchanged between discovery, SafeDeleter and the CLI
 *
 * Discovery collaborators produce CandidatePath records. The CLI wraps each
 * one in a DeletionRequest after user confirmation, and SafeDeleter answers
 * with a DeletionResult.
 *
 * @see SafeDeleter
 */

#ifndef DELETIONTYPES_HPP
#define DELETIONTYPES_HPP

#include <cstdint>
#include <optional>
#include <string>

/**
 * @enum Category
 * @brief Application that owns a candidate path
 *
 * Selects the allow-list of the security policy that applies to the path.
 */
enum class Category { Unity, Unreal, Chrome, System, Other };

/**
 * @brief Policy-file name of a category ("unity", "unreal", ...)
 */
inline std::string categoryName(Category category) {
  switch (category) {
  case Category::Unity:
    return "unity";
  case Category::Unreal:
    return "unreal";
  case Category::Chrome:
    return "chrome";
  case Category::System:
    return "system";
  case Category::Other:
    return "other";
  }
  return "other";
}

inline std::optional<Category> categoryFromString(const std::string &name) {
  if (name == "unity")
    return Category::Unity;
  if (name == "unreal")
    return Category::Unreal;
  if (name == "chrome")
    return Category::Chrome;
  if (name == "system")
    return Category::System;
  if (name == "other")
    return Category::Other;
  return std::nullopt;
}

/**
 * @brief A filesystem location proposed for deletion, not yet validated
 */
struct CandidatePath {
  std::string path;
  Category category = Category::Other;
  std::uintmax_t estimatedSize = 0;
  std::string discoveredBy;
};

enum class DeletionMode { Trash, Permanent };

inline std::string deletionModeName(DeletionMode mode) {
  return mode == DeletionMode::Trash ? "trash" : "permanent";
}

/**
 * @brief One deletion to perform
 *
 * Dry-run is the default; callers must opt out explicitly.
 */
struct DeletionRequest {
  CandidatePath target;
  DeletionMode mode = DeletionMode::Trash;
  bool dryRun = true;
  bool force = false;
};

/**
 * @enum ErrorKind
 * @brief Why a deletion did not happen
 */
enum class ErrorKind {
  DeletionSafety, ///< Kill switch, symlink or critical path
  PathValidation, ///< Unresolvable or malformed path
  SecurityPolicy, ///< Not approved by the loaded policy
  Backup,         ///< Backup creation failed
  Platform,       ///< Trash primitive unavailable or failed
  Cancelled,      ///< Interactive confirmation declined
  Filesystem      ///< Removal itself failed
};

inline std::string errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::DeletionSafety:
    return "DeletionSafetyError";
  case ErrorKind::PathValidation:
    return "PathValidationError";
  case ErrorKind::SecurityPolicy:
    return "SecurityPolicyError";
  case ErrorKind::Backup:
    return "BackupError";
  case ErrorKind::Platform:
    return "PlatformError";
  case ErrorKind::Cancelled:
    return "Cancelled";
  case ErrorKind::Filesystem:
    return "FilesystemError";
  }
  return "Unknown";
}

/**
 * @enum Outcome
 * @brief Terminal state of one request
 */
enum class Outcome { DryRun, Deleted, AlreadyAbsent, Blocked, Failed, Cancelled };

struct DeletionResult {
  bool success = false;
  std::string operationId;
  std::string path;
  std::optional<std::string> backupPath;
  std::optional<ErrorKind> error;
  std::uintmax_t bytesFreed = 0;
  Outcome outcome = Outcome::Failed;

  /** @brief Short reason code, e.g. "critical path", "symlink" */
  std::string reason;

  /** @brief Full human-readable explanation including the path */
  std::string message;
};

#endif // DELETIONTYPES_HPP
