/**
 * @file auditlogger.hpp
 * @brief Append-only JSON Lines audit trail of deletion decisions
 *
 * Every decision point of SafeDeleter produces one AuditRecord. Records
 * describe what was decided about a path, never its contents.
 */

#ifndef AUDITLOGGER_HPP
#define AUDITLOGGER_HPP

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class AuditDecision { Allowed, Blocked, Executed, Failed };

std::string auditDecisionName(AuditDecision decision);
std::optional<AuditDecision> auditDecisionFromString(const std::string &name);

struct AuditRecord {
  std::string operationId;
  std::string timestamp; ///< ISO-8601 UTC, filled in by record() if empty
  std::string path;
  AuditDecision decision = AuditDecision::Allowed;
  std::string reason;
  std::string category;
  std::string mode;
  bool dryRun = true;
  std::uintmax_t bytes = 0;
  std::string policyHash;
  std::string sessionId; ///< filled in by record() if empty
  std::string user;      ///< filled in by record() if empty
};

struct AuditSummary {
  int hours = 24;
  int total = 0;
  std::map<std::string, int> byDecision;
  std::uintmax_t bytesExecuted = 0;
  std::vector<AuditRecord> blocked; ///< most recent last
};

class AuditLogger {
public:
  /**
   * @param logFile JSON Lines file, created with its parent directory on
   *        the first record
   * @param fallback Receives a plain-text line when the file cannot be
   *        written
   */
  explicit AuditLogger(std::filesystem::path logFile,
                       std::ostream &fallback = std::cerr);

  /**
   * @brief Appends one record; never throws
   *
   * The file is opened, appended to and closed for every record so that a
   * crash never loses an already returned decision.
   */
  void record(AuditRecord record) noexcept;

  /**
   * @brief Reads back the records of the last @p hours hours
   *
   * Lines that are not valid records are skipped.
   */
  std::vector<AuditRecord> readRecords(int hours) const;

  AuditSummary summary(int hours) const;

  const std::string &sessionId() const { return m_sessionId; }

private:
  std::filesystem::path m_logFile;
  std::ostream &m_fallback;
  std::string m_sessionId;
  std::string m_user;
};

#endif // AUDITLOGGER_HPP
