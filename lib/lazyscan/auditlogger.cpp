/**
 * @file auditlogger.cpp
 * @brief Implementation of the JSON Lines audit trail
 */

#include "auditlogger.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

#ifndef _WIN32
#include <pwd.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string currentUser() {
  const char *user = std::getenv("USER");
  if (user && *user)
    return user;
#ifndef _WIN32
  if (const passwd *pw = getpwuid(getuid()))
    return pw->pw_name;
#else
  if (const char *name = std::getenv("USERNAME"))
    return name;
#endif
  return "unknown";
}

json toJson(const AuditRecord &r) {
  return json{{"operation_id", r.operationId},
              {"timestamp", r.timestamp},
              {"path", r.path},
              {"decision", auditDecisionName(r.decision)},
              {"reason", r.reason},
              {"category", r.category},
              {"mode", r.mode},
              {"dry_run", r.dryRun},
              {"bytes", r.bytes},
              {"policy_hash", r.policyHash},
              {"session_id", r.sessionId},
              {"user", r.user}};
}

std::optional<AuditRecord> fromJson(const json &j) {
  if (!j.is_object())
    return std::nullopt;

  AuditRecord r;
  try {
    auto decision = auditDecisionFromString(j.value("decision", ""));
    if (!decision)
      return std::nullopt;

    r.operationId = j.value("operation_id", "");
    r.timestamp = j.value("timestamp", "");
    r.path = j.value("path", "");
    r.decision = *decision;
    r.reason = j.value("reason", "");
    r.category = j.value("category", "");
    r.mode = j.value("mode", "");
    r.dryRun = j.value("dry_run", true);
    r.bytes = j.value("bytes", std::uintmax_t{0});
    r.policyHash = j.value("policy_hash", "");
    r.sessionId = j.value("session_id", "");
    r.user = j.value("user", "");
  } catch (const json::type_error &) {
    return std::nullopt;
  }
  return r;
}

} // namespace

std::string auditDecisionName(AuditDecision decision) {
  switch (decision) {
  case AuditDecision::Allowed:
    return "allowed";
  case AuditDecision::Blocked:
    return "blocked";
  case AuditDecision::Executed:
    return "executed";
  case AuditDecision::Failed:
    return "failed";
  }
  return "failed";
}

std::optional<AuditDecision> auditDecisionFromString(const std::string &name) {
  if (name == "allowed")
    return AuditDecision::Allowed;
  if (name == "blocked")
    return AuditDecision::Blocked;
  if (name == "executed")
    return AuditDecision::Executed;
  if (name == "failed")
    return AuditDecision::Failed;
  return std::nullopt;
}

AuditLogger::AuditLogger(fs::path logFile, std::ostream &fallback)
    : m_logFile(std::move(logFile)), m_fallback(fallback),
      m_sessionId(generateUuid()), m_user(currentUser()) {}

void AuditLogger::record(AuditRecord record) noexcept {
  try {
    if (record.timestamp.empty())
      record.timestamp = toIsoTimestamp(std::chrono::system_clock::now());
    if (record.sessionId.empty())
      record.sessionId = m_sessionId;
    if (record.user.empty())
      record.user = m_user;

    std::error_code ec;
    if (m_logFile.has_parent_path())
      fs::create_directories(m_logFile.parent_path(), ec);

    // Invalid UTF-8 in file names must not make the record unwritable
    std::string line =
        toJson(record).dump(-1, ' ', false, json::error_handler_t::replace);

    std::ofstream out(m_logFile, std::ios::app);
    if (out) {
      out << line << '\n';
      out.flush();
    }
    if (!out) {
      m_fallback << "AUDIT-FALLBACK " << line << std::endl;
    }
  } catch (const std::exception &e) {
    try {
      m_fallback << "AUDIT-FALLBACK " << auditDecisionName(record.decision)
                 << " " << record.path << " (" << e.what() << ")" << std::endl;
    } catch (const std::ios_base::failure &) {
      // Nothing left to report to
    }
  }
}

std::vector<AuditRecord> AuditLogger::readRecords(int hours) const {
  std::vector<AuditRecord> records;
  std::ifstream in(m_logFile);
  if (!in)
    return records;

  long long window = static_cast<long long>(hours) * 3600;

  std::string line;
  int lineNo = 0;
  while (std::getline(in, line)) {
    ++lineNo;
    if (trim(line).empty())
      continue;

    json j = json::parse(line, nullptr, false);
    auto record = j.is_discarded() ? std::nullopt : fromJson(j);
    if (!record) {
      Log::debug("Skipping malformed audit line " + std::to_string(lineNo));
      continue;
    }

    auto when = fromIsoTimestamp(record->timestamp);
    if (!when || isOlderThan(*when, window))
      continue;

    records.push_back(*record);
  }
  return records;
}

AuditSummary AuditLogger::summary(int hours) const {
  AuditSummary summary;
  summary.hours = hours;

  for (const auto &r : readRecords(hours)) {
    summary.total++;
    summary.byDecision[auditDecisionName(r.decision)]++;
    if (r.decision == AuditDecision::Executed)
      summary.bytesExecuted += r.bytes;
    if (r.decision == AuditDecision::Blocked)
      summary.blocked.push_back(r);
  }
  return summary;
}
