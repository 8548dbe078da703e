/**
 * @file safedeleter.hpp
 * @brief The single entry point for every deletion lazyscan performs
 *
 * A request passes through these stages, stopping at the first refusal:
 * @code
 * kill switch -> canonicalize -> guard -> policy -> [confirm] -> [backup]
 *             -> trash / remove -> audit
 * @endcode
 * Expected refusals and failures come back as a DeletionResult; deletePath()
 * does not throw for them.
 */

#ifndef SAFEDELETER_HPP
#define SAFEDELETER_HPP

#include <vector>

#include "auditlogger.hpp"
#include "confirmation.hpp"
#include "deletiontypes.hpp"
#include "errors.hpp"
#include "fileoperations.hpp"
#include "pathcanonicalizer.hpp"
#include "recoverymanager.hpp"
#include "securitypolicy.hpp"

struct BatchSummary {
  std::vector<DeletionResult> results;
  int succeeded = 0;
  int failed = 0;
  std::uintmax_t bytesFreed = 0;

  /**
   * @brief Process exit code for the batch
   *
   * Success when every request succeeded, PartialFailure when some did,
   * otherwise the code of the first failure's kind.
   */
  ExitCode exitCode() const;
};

class SafeDeleter {
public:
  SafeDeleter(const SecurityPolicy &policy,
              const PathCanonicalizer &canonicalizer, AuditLogger &audit,
              RecoveryManager &recovery, IFileOperations &files,
              IConfirmationPrompt &prompt, bool killSwitchEngaged);

  DeletionResult deletePath(const DeletionRequest &request);

  /** @brief Runs requests one after another; no retries */
  BatchSummary deleteAll(const std::vector<DeletionRequest> &requests);

private:
  DeletionResult refuse(const DeletionRequest &request, DeletionResult result,
                        Outcome outcome, ErrorKind kind,
                        const std::string &reason, const std::string &message);
  void audit(const DeletionRequest &request, const DeletionResult &result,
             AuditDecision decision);

  const SecurityPolicy &m_policy;
  const PathCanonicalizer &m_canonicalizer;
  AuditLogger &m_audit;
  RecoveryManager &m_recovery;
  IFileOperations &m_files;
  IConfirmationPrompt &m_prompt;
  bool m_killSwitch;
};

#endif // SAFEDELETER_HPP
