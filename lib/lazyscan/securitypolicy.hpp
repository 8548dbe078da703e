/**
 * @file securitypolicy.hpp
 * @brief Allow-list policy that every deletion must be approved by
 *
 * The policy is a JSON document loaded once per process. Loading is
 * fail-closed: anything missing or malformed throws SecurityPolicyError and
 * the CLI exits before a single path is touched.
 *
 * Example:
 * @code
 * {
 *   "version": "1",
 *   "allowed_roots": { "chrome": ["~/.cache/google-chrome"] },
 *   "deny_list": ["~/Documents"],
 *   "require_trash_first": true,
 *   "block_symlinks": true
 * }
 * @endcode
 */

#ifndef SECURITYPOLICY_HPP
#define SECURITYPOLICY_HPP

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "criticalpathguard.hpp"
#include "deletiontypes.hpp"
#include "pathcanonicalizer.hpp"

/**
 * @brief Parsed policy document
 *
 * All paths are absolute; "~" and environment variables are already
 * expanded. Root lists hold both the written and the symlink-resolved form
 * of every entry.
 */
struct Policy {
  std::string version;
  std::map<Category, std::vector<std::filesystem::path>> allowedRoots;
  std::vector<std::filesystem::path> genericAllowedRoots;
  std::vector<std::filesystem::path> denyList;
  bool requireTrashFirst = true;
  bool blockSymlinks = true;
  bool backupBeforeDelete = false;
  double maxDeletionSizeMb = 0; ///< 0 means no limit
  int backupRetentionDays = 30;

  /** @brief First 12 hex characters of the SHA-256 of the document */
  std::string hash;
};

struct PolicyDecision {
  bool approved = false;
  std::string reason;
};

class SecurityPolicy {
public:
  SecurityPolicy(Policy policy, const CriticalPathGuard &guard);

  /**
   * @brief Reads and validates a policy file
   *
   * @throws SecurityPolicyError if the file is missing or unreadable, is not
   *         valid JSON, lacks a required key, has a value of the wrong type,
   *         names an unknown category, contains a relative root, or sets
   *         block_symlinks to false
   */
  static Policy load(const std::filesystem::path &file,
                     const PathCanonicalizer &canonicalizer);

  /**
   * @brief Decides whether a canonical path may be deleted
   *
   * Approved only if the guard does not block the path, the resolved path
   * equals or lies below one of the roots allowed for the candidate's
   * category, and the estimated size does not exceed the configured limit.
   */
  PolicyDecision approve(const CandidatePath &candidate,
                         const CanonicalPath &canonical) const;

  /** @brief Refuses permanent mode while require_trash_first is set */
  PolicyDecision approveMode(DeletionMode mode) const;

  const Policy &policy() const { return m_policy; }
  const CriticalPathGuard &guard() const { return m_guard; }

private:
  Policy m_policy;
  const CriticalPathGuard &m_guard;
};

#endif // SECURITYPOLICY_HPP
