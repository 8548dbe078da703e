/**
 * @file securitypolicy.cpp
 * @brief Loading, validation and evaluation of the deletion policy
 */

#include "securitypolicy.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "sha256.hpp"

#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const json &requireKey(const json &doc, const char *key) {
  auto it = doc.find(key);
  if (it == doc.end()) {
    throw SecurityPolicyError(std::string("Policy is missing required key '") +
                              key + "'");
  }
  return *it;
}

bool requireBool(const json &value, const std::string &key) {
  if (!value.is_boolean()) {
    throw SecurityPolicyError("Policy key '" + key + "' must be a boolean");
  }
  return value.get<bool>();
}

/**
 * @brief Expands one root entry and appends its written and resolved forms
 */
void appendRoot(std::vector<fs::path> &out, const json &entry,
                const std::string &key,
                const PathCanonicalizer &canonicalizer) {
  if (!entry.is_string()) {
    throw SecurityPolicyError("Policy key '" + key +
                              "' must contain only strings");
  }

  fs::path root;
  try {
    root = canonicalizer.expand(entry.get<std::string>());
  } catch (const PathValidationError &e) {
    throw SecurityPolicyError("Policy key '" + key + "': " + e.what());
  }

  if (!root.is_absolute()) {
    throw SecurityPolicyError("Policy key '" + key +
                              "' contains a relative path: " + root.string());
  }

  root = PathCanonicalizer::normalize(root);
  out.push_back(root);

  std::error_code ec;
  fs::path resolved = fs::weakly_canonical(root, ec);
  if (!ec) {
    resolved = PathCanonicalizer::normalize(resolved);
    if (!PathCanonicalizer::isSamePath(resolved, root)) {
      out.push_back(resolved);
    }
  }
}

std::vector<fs::path> parseRootList(const json &value, const std::string &key,
                                    const PathCanonicalizer &canonicalizer) {
  if (!value.is_array()) {
    throw SecurityPolicyError("Policy key '" + key + "' must be an array");
  }
  std::vector<fs::path> roots;
  for (const auto &entry : value) {
    appendRoot(roots, entry, key, canonicalizer);
  }
  return roots;
}

bool isUnderAnyRoot(const fs::path &path, const std::vector<fs::path> &roots) {
  for (const auto &root : roots) {
    if (PathCanonicalizer::isWithin(path, root))
      return true;
  }
  return false;
}

} // namespace

SecurityPolicy::SecurityPolicy(Policy policy, const CriticalPathGuard &guard)
    : m_policy(std::move(policy)), m_guard(guard) {}

Policy SecurityPolicy::load(const fs::path &file,
                            const PathCanonicalizer &canonicalizer) {
  std::error_code ec;
  if (!fs::is_regular_file(file, ec)) {
    throw SecurityPolicyError("Policy file not found: " + file.string());
  }

  std::ifstream in(file);
  if (!in) {
    throw SecurityPolicyError("Cannot read policy file: " + file.string());
  }

  json doc;
  try {
    doc = json::parse(in);
  } catch (const json::parse_error &e) {
    throw SecurityPolicyError("Malformed policy file " + file.string() + ": " +
                              e.what());
  }

  if (!doc.is_object()) {
    throw SecurityPolicyError("Policy file must contain a JSON object: " +
                              file.string());
  }

  Policy policy;

  const json &allowed = requireKey(doc, "allowed_roots");
  if (!allowed.is_object()) {
    throw SecurityPolicyError("Policy key 'allowed_roots' must be an object");
  }
  for (auto it = allowed.begin(); it != allowed.end(); ++it) {
    auto category = categoryFromString(it.key());
    if (!category) {
      throw SecurityPolicyError("Unknown category in allowed_roots: " +
                                it.key());
    }
    policy.allowedRoots[*category] = parseRootList(
        it.value(), "allowed_roots." + it.key(), canonicalizer);
  }

  policy.denyList =
      parseRootList(requireKey(doc, "deny_list"), "deny_list", canonicalizer);
  policy.requireTrashFirst =
      requireBool(requireKey(doc, "require_trash_first"), "require_trash_first");
  policy.blockSymlinks =
      requireBool(requireKey(doc, "block_symlinks"), "block_symlinks");

  if (!policy.blockSymlinks) {
    throw SecurityPolicyError(
        "block_symlinks cannot be disabled; symlinks are never deleted");
  }

  if (doc.contains("version")) {
    if (!doc["version"].is_string()) {
      throw SecurityPolicyError("Policy key 'version' must be a string");
    }
    policy.version = doc["version"].get<std::string>();
  }

  if (doc.contains("generic_allowed_roots")) {
    policy.genericAllowedRoots = parseRootList(
        doc["generic_allowed_roots"], "generic_allowed_roots", canonicalizer);
  }

  if (doc.contains("backup_before_delete")) {
    policy.backupBeforeDelete =
        requireBool(doc["backup_before_delete"], "backup_before_delete");
  }

  if (doc.contains("max_deletion_size_mb")) {
    const json &value = doc["max_deletion_size_mb"];
    if (!value.is_number() || value.get<double>() < 0) {
      throw SecurityPolicyError(
          "Policy key 'max_deletion_size_mb' must be a non-negative number");
    }
    policy.maxDeletionSizeMb = value.get<double>();
  }

  if (doc.contains("backup_retention_days")) {
    const json &value = doc["backup_retention_days"];
    if (!value.is_number_integer() || value.get<int>() < 0) {
      throw SecurityPolicyError(
          "Policy key 'backup_retention_days' must be a non-negative integer");
    }
    policy.backupRetentionDays = value.get<int>();
  }

  // Objects keep their keys sorted, so the dump is stable across key order
  policy.hash = Sha256().calculateHashOfString(doc.dump()).substr(0, 12);

  Log::debug("Loaded policy " + file.string() + " (hash " + policy.hash + ")");
  return policy;
}

PolicyDecision SecurityPolicy::approve(const CandidatePath &candidate,
                                       const CanonicalPath &canonical) const {
  auto status = m_guard.check(canonical);
  if (status != CriticalPathGuard::GuardStatus::Allowed) {
    return {false, CriticalPathGuard::getStatusMessage(
                       status, canonical.requested.string())};
  }

  bool allowed = false;
  auto it = m_policy.allowedRoots.find(candidate.category);
  if (it != m_policy.allowedRoots.end()) {
    allowed = isUnderAnyRoot(canonical.resolved, it->second);
  }
  if (!allowed && candidate.category == Category::Other) {
    allowed = isUnderAnyRoot(canonical.resolved, m_policy.genericAllowedRoots);
  }

  if (!allowed) {
    return {false, "not allowed: " + canonical.resolved.string() +
                       " is not within an allowed root for category " +
                       categoryName(candidate.category)};
  }

  if (m_policy.maxDeletionSizeMb > 0) {
    double limit = m_policy.maxDeletionSizeMb * 1024.0 * 1024.0;
    if (static_cast<double>(candidate.estimatedSize) > limit) {
      return {false, "size limit: " + canonical.resolved.string() +
                         " exceeds max_deletion_size_mb"};
    }
  }

  return {true, ""};
}

PolicyDecision SecurityPolicy::approveMode(DeletionMode mode) const {
  if (mode == DeletionMode::Permanent && m_policy.requireTrashFirst) {
    return {false, "trash required: policy requires trash-first deletion"};
  }
  return {true, ""};
}
