/**
 * @file safedeleter.cpp
 * @brief Implementation of the guarded deletion pipeline
 */

#include "safedeleter.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <algorithm>

namespace fs = std::filesystem;

namespace {

ExitCode exitCodeFor(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::PathValidation:
    return ExitCode::PathError;
  case ErrorKind::DeletionSafety:
  case ErrorKind::SecurityPolicy:
    return ExitCode::SecurityError;
  case ErrorKind::Cancelled:
    return ExitCode::UserCancelled;
  case ErrorKind::Platform:
    return ExitCode::PlatformError;
  case ErrorKind::Backup:
  case ErrorKind::Filesystem:
    return ExitCode::GeneralError;
  }
  return ExitCode::GeneralError;
}

} // namespace

ExitCode BatchSummary::exitCode() const {
  if (failed == 0)
    return ExitCode::Success;
  if (succeeded > 0)
    return ExitCode::PartialFailure;

  for (const auto &result : results) {
    if (!result.success && result.error)
      return exitCodeFor(*result.error);
  }
  return ExitCode::GeneralError;
}

SafeDeleter::SafeDeleter(const SecurityPolicy &policy,
                         const PathCanonicalizer &canonicalizer,
                         AuditLogger &audit, RecoveryManager &recovery,
                         IFileOperations &files, IConfirmationPrompt &prompt,
                         bool killSwitchEngaged)
    : m_policy(policy), m_canonicalizer(canonicalizer), m_audit(audit),
      m_recovery(recovery), m_files(files), m_prompt(prompt),
      m_killSwitch(killSwitchEngaged) {}

void SafeDeleter::audit(const DeletionRequest &request,
                        const DeletionResult &result, AuditDecision decision) {
  AuditRecord record;
  record.operationId = result.operationId;
  record.path = result.path;
  record.decision = decision;
  record.reason = result.reason.empty() ? result.message : result.reason;
  record.category = categoryName(request.target.category);
  record.mode = deletionModeName(request.mode);
  record.dryRun = request.dryRun;
  record.bytes = result.bytesFreed;
  record.policyHash = m_policy.policy().hash;
  m_audit.record(record);
}

DeletionResult SafeDeleter::refuse(const DeletionRequest &request,
                                   DeletionResult result, Outcome outcome,
                                   ErrorKind kind, const std::string &reason,
                                   const std::string &message) {
  result.success = false;
  result.outcome = outcome;
  result.error = kind;
  result.reason = reason;
  result.message = message;
  result.bytesFreed = 0;

  audit(request, result,
        outcome == Outcome::Failed ? AuditDecision::Failed
                                   : AuditDecision::Blocked);
  Log::info(result.message);
  return result;
}

DeletionResult SafeDeleter::deletePath(const DeletionRequest &request) {
  DeletionResult result;
  result.operationId = generateUuid();
  result.path = request.target.path;

  if (m_killSwitch && !request.dryRun) {
    return refuse(request, result, Outcome::Blocked, ErrorKind::DeletionSafety,
                  "kill switch",
                  "kill switch: deletions are disabled by "
                  "LAZYSCAN_DISABLE_DELETIONS, not deleting " +
                      request.target.path);
  }

  CanonicalPath canonical;
  try {
    canonical = m_canonicalizer.canonicalize(request.target.path);
  } catch (const PathValidationError &e) {
    return refuse(request, result, Outcome::Failed, ErrorKind::PathValidation,
                  "invalid path", e.what());
  }
  result.path = canonical.string();

  auto status = m_policy.guard().check(canonical);
  if (status != CriticalPathGuard::GuardStatus::Allowed) {
    return refuse(request, result, Outcome::Blocked, ErrorKind::DeletionSafety,
                  CriticalPathGuard::reasonCode(status),
                  CriticalPathGuard::getStatusMessage(
                      status, canonical.requested.string()));
  }

  PolicyDecision decision = m_policy.approve(request.target, canonical);

  // Only paths inside an allowed root are measured for the size limit
  if (decision.approved && m_policy.policy().maxDeletionSizeMb > 0 &&
      m_files.exists(canonical.resolved)) {
    CandidatePath measured = request.target;
    measured.estimatedSize =
        std::max(measured.estimatedSize, m_files.totalSize(canonical.resolved));
    decision = m_policy.approve(measured, canonical);
  }
  if (decision.approved)
    decision = m_policy.approveMode(request.mode);
  if (!decision.approved) {
    return refuse(request, result, Outcome::Blocked, ErrorKind::SecurityPolicy,
                  "not allowed", decision.reason);
  }

  const fs::path target = canonical.resolved;
  const bool permanent = request.mode == DeletionMode::Permanent;

  if (request.dryRun) {
    result.success = true;
    result.outcome = Outcome::DryRun;
    result.bytesFreed = m_files.exists(target) ? m_files.totalSize(target) : 0;
    result.message = "[DRY RUN] Would " +
                     std::string(permanent ? "permanently delete " : "move ") +
                     target.string() + (permanent ? "" : " to trash") + " (" +
                     formatBytes(result.bytesFreed) + ")";
    audit(request, result, AuditDecision::Allowed);
    return result;
  }

  if (!m_files.exists(target)) {
    result.success = true;
    result.outcome = Outcome::AlreadyAbsent;
    result.reason = "already absent";
    result.message = "Already absent: " + target.string();
    audit(request, result, AuditDecision::Executed);
    return result;
  }

  std::uintmax_t bytes = m_files.totalSize(target);

  if (permanent && !request.force) {
    if (!m_prompt.isInteractive()) {
      return refuse(request, result, Outcome::Blocked,
                    ErrorKind::DeletionSafety, "confirmation required",
                    "confirmation required: permanent deletion of " +
                        target.string() +
                        " needs --force when not run from a terminal");
    }
    std::string answer = trim(m_prompt.ask(target.string(), bytes));
    if (answer != kConfirmationPhrase) {
      return refuse(request, result, Outcome::Cancelled, ErrorKind::Cancelled,
                    "cancelled",
                    "cancelled: permanent deletion of " + target.string() +
                        " was not confirmed");
    }
  }

  result.bytesFreed = bytes;
  audit(request, result, AuditDecision::Allowed);

  if (m_policy.policy().backupBeforeDelete) {
    try {
      BackupEntry entry = m_recovery.createBackup(
          result.operationId, target, request.target.category);
      result.backupPath = entry.backupLocation;
    } catch (const BackupError &e) {
      return refuse(request, result, Outcome::Failed, ErrorKind::Backup,
                    "backup failed", e.what());
    }
  }

  try {
    if (permanent) {
      m_files.removePermanently(target);
      result.message = "Permanently deleted " + target.string();
    } else {
      fs::path location = m_files.moveToTrash(target);
      result.message = "Moved " + target.string() + " to trash";
      if (!location.empty())
        result.message += " (" + location.string() + ")";
    }
  } catch (const DeletionSafetyError &e) {
    return refuse(request, result, Outcome::Blocked, ErrorKind::DeletionSafety,
                  "symlink", e.what());
  } catch (const PlatformError &e) {
    return refuse(request, result, Outcome::Failed, ErrorKind::Platform,
                  "trash unavailable", e.what());
  } catch (const fs::filesystem_error &e) {
    return refuse(request, result, Outcome::Failed, ErrorKind::Filesystem,
                  "delete failed", e.what());
  }

  result.success = true;
  result.outcome = Outcome::Deleted;
  audit(request, result, AuditDecision::Executed);
  Log::info(result.message);
  return result;
}

BatchSummary SafeDeleter::deleteAll(const std::vector<DeletionRequest> &requests) {
  BatchSummary summary;
  for (const auto &request : requests) {
    DeletionResult result = deletePath(request);
    if (result.success) {
      summary.succeeded++;
      summary.bytesFreed += result.bytesFreed;
    } else {
      summary.failed++;
    }
    summary.results.push_back(std::move(result));
  }
  return summary;
}
