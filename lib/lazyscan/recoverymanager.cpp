/**
 * @file recoverymanager.cpp
 * @brief Backup creation, verification, restore and retention
 */

#include "recoverymanager.hpp"
#include "errors.hpp"
#include "filescanner.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json toJson(const BackupEntry &e) {
  return json{{"operation_id", e.operationId},
              {"original_path", e.originalPath},
              {"backup_location", e.backupLocation},
              {"created_at", e.createdAt},
              {"size", e.size},
              {"checksum", e.checksum},
              {"is_directory", e.isDirectory},
              {"category", e.category}};
}

BackupEntry fromJson(const json &j) {
  BackupEntry e;
  e.operationId = j.at("operation_id").get<std::string>();
  e.originalPath = j.at("original_path").get<std::string>();
  e.backupLocation = j.at("backup_location").get<std::string>();
  e.createdAt = j.at("created_at").get<std::string>();
  e.size = j.at("size").get<std::uintmax_t>();
  e.checksum = j.at("checksum").get<std::string>();
  e.isDirectory = j.value("is_directory", false);
  e.category = j.value("category", "other");
  return e;
}

void copyTree(const fs::path &from, const fs::path &to) {
  if (fs::is_directory(fs::symlink_status(from))) {
    fs::copy(from, to,
             fs::copy_options::recursive | fs::copy_options::copy_symlinks);
  } else {
    fs::copy(from, to, fs::copy_options::copy_symlinks);
  }
}

bool isExpired(const BackupEntry &entry, int days) {
  if (days <= 0)
    return false;
  auto created = fromIsoTimestamp(entry.createdAt);
  if (!created)
    return true;
  return isOlderThan(*created, static_cast<long long>(days) * 86400);
}

} // namespace

RecoveryManager::RecoveryManager(fs::path backupDir,
                                 const IHashCalculator &hasher,
                                 int retentionDays)
    : m_backupDir(std::move(backupDir)), m_indexFile(m_backupDir / "index.json"),
      m_hasher(hasher), m_retentionDays(retentionDays) {}

std::vector<BackupEntry> RecoveryManager::loadIndex() const {
  std::vector<BackupEntry> entries;
  std::error_code ec;
  if (!fs::exists(m_indexFile, ec))
    return entries;

  std::ifstream in(m_indexFile);
  if (!in) {
    throw RecoveryError("Cannot read backup index " + m_indexFile.string());
  }

  try {
    json doc = json::parse(in);
    for (const auto &item : doc.at("entries")) {
      entries.push_back(fromJson(item));
    }
  } catch (const json::exception &e) {
    throw RecoveryError("Corrupt backup index " + m_indexFile.string() + ": " +
                        e.what());
  }
  return entries;
}

void RecoveryManager::saveIndex(const std::vector<BackupEntry> &entries) const {
  json doc;
  doc["version"] = 1;
  doc["entries"] = json::array();
  for (const auto &e : entries) {
    doc["entries"].push_back(toJson(e));
  }

  std::error_code ec;
  fs::create_directories(m_backupDir, ec);
  if (ec) {
    throw RecoveryError("Cannot create backup directory " +
                        m_backupDir.string() + ": " + ec.message());
  }

  fs::path tmp = m_indexFile;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    out << doc.dump(2, ' ', false, json::error_handler_t::replace) << '\n';
    out.flush();
    if (!out) {
      fs::remove(tmp, ec);
      throw RecoveryError("Cannot write backup index " + tmp.string());
    }
  }

  fs::rename(tmp, m_indexFile, ec);
  if (ec) {
    std::error_code cleanup;
    fs::remove(tmp, cleanup);
    throw RecoveryError("Cannot replace backup index " + m_indexFile.string() +
                        ": " + ec.message());
  }
}

std::string RecoveryManager::contentChecksum(const fs::path &path) const {
  std::error_code ec;
  fs::file_status status = fs::symlink_status(path, ec);
  if (ec)
    return "";

  if (fs::is_regular_file(status))
    return m_hasher.calculateHash(path.string());

  if (!fs::is_directory(status))
    return "";

  // Manifest: one sorted line per entry, hashed as a whole
  std::vector<std::string> lines;
  fs::recursive_directory_iterator it(path, ec);
  if (ec)
    return "";
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec)
      return "";
    std::string rel = fs::relative(it->path(), path).generic_string();
    std::error_code entry_ec;
    if (it->is_symlink(entry_ec)) {
      lines.push_back("L " + rel + " " +
                      fs::read_symlink(it->path(), entry_ec).string());
    } else if (it->is_directory(entry_ec)) {
      lines.push_back("D " + rel);
    } else if (it->is_regular_file(entry_ec)) {
      std::string digest = m_hasher.calculateHash(it->path().string());
      if (digest.empty())
        return "";
      lines.push_back("F " + rel + " " +
                      std::to_string(it->file_size(entry_ec)) + " " + digest);
    } else {
      // fifos, sockets and devices are listed by name only; opening them can block
      lines.push_back("O " + rel);
    }
  }
  std::sort(lines.begin(), lines.end());

  std::string manifest;
  for (const auto &line : lines) {
    manifest += line;
    manifest += '\n';
  }
  return m_hasher.calculateHashOfString(manifest);
}

BackupEntry RecoveryManager::createBackup(const std::string &operationId,
                                          const fs::path &source,
                                          Category category) {
  fs::path opDir = m_backupDir / operationId;
  std::error_code ec;

  auto discard = [&]() {
    std::error_code cleanup;
    fs::remove_all(opDir, cleanup);
  };

  fs::create_directories(opDir, ec);
  if (ec) {
    throw BackupError("Cannot create backup directory " + opDir.string() +
                      ": " + ec.message());
  }

  fs::path destination = opDir / source.filename();
  try {
    copyTree(source, destination);
  } catch (const fs::filesystem_error &e) {
    discard();
    throw BackupError("Backup of " + source.string() + " failed: " + e.what());
  }

  BackupEntry entry;
  entry.operationId = operationId;
  entry.originalPath = source.string();
  entry.backupLocation = destination.string();
  entry.createdAt = toIsoTimestamp(std::chrono::system_clock::now());
  entry.size = FileScanner::directorySize(source);
  entry.checksum = contentChecksum(source);
  entry.isDirectory = fs::is_directory(fs::symlink_status(source, ec));
  entry.category = categoryName(category);

  if (entry.checksum.empty() || entry.checksum != contentChecksum(destination) ||
      entry.size != FileScanner::directorySize(destination)) {
    discard();
    throw BackupError("Backup of " + source.string() +
                      " does not match the original");
  }

  try {
    auto entries = loadIndex();
    entries.push_back(entry);
    saveIndex(entries);
  } catch (const RecoveryError &e) {
    discard();
    throw BackupError(std::string("Cannot register backup: ") + e.what());
  }

  Log::info("Backed up " + source.string() + " to " + destination.string());
  return entry;
}

RecoveryResult RecoveryManager::restore(const std::string &operationId,
                                        bool overwrite) {
  auto entries = loadIndex();
  auto it = std::find_if(entries.begin(), entries.end(),
                         [&](const BackupEntry &e) {
                           return e.operationId == operationId;
                         });
  if (it == entries.end()) {
    throw RecoveryError("No backup recorded for operation " + operationId);
  }

  const BackupEntry &entry = *it;
  fs::path backup = entry.backupLocation;
  fs::path original = entry.originalPath;
  std::error_code ec;

  if (!fs::exists(fs::symlink_status(backup, ec))) {
    throw RecoveryError("Backup is missing: " + backup.string());
  }

  if (FileScanner::directorySize(backup) != entry.size ||
      contentChecksum(backup) != entry.checksum) {
    throw RecoveryError("Backup is incomplete or corrupt: " + backup.string());
  }

  RecoveryResult result;
  result.operationId = operationId;
  result.restoredPath = original.string();

  if (fs::exists(fs::symlink_status(original, ec))) {
    if (contentChecksum(original) == entry.checksum) {
      result.success = true;
      result.message = "Identical content already present at " + original.string();
      return result;
    }
    if (!overwrite) {
      throw RecoveryError("Restore conflict: " + original.string() +
                          " exists with different content (use --overwrite)");
    }
    fs::remove_all(original, ec);
    if (ec) {
      throw RecoveryError("Cannot replace " + original.string() + ": " +
                          ec.message());
    }
  }

  try {
    if (original.has_parent_path())
      fs::create_directories(original.parent_path());
    copyTree(backup, original);
  } catch (const fs::filesystem_error &e) {
    throw RecoveryError("Restore of " + original.string() + " failed: " +
                        e.what());
  }

  if (contentChecksum(original) != entry.checksum) {
    throw RecoveryError("Restored content of " + original.string() +
                        " does not match the backup");
  }

  result.success = true;
  result.bytesRestored = entry.size;
  result.message = "Restored " + original.string();
  Log::info(result.message + " from operation " + operationId);
  return result;
}

std::vector<BackupEntry> RecoveryManager::listRecoverable(int withinDays) {
  purgeExpired();

  std::vector<BackupEntry> result;
  for (const auto &entry : loadIndex()) {
    if (!isExpired(entry, withinDays))
      result.push_back(entry);
  }

  std::stable_sort(result.begin(), result.end(),
                   [](const BackupEntry &a, const BackupEntry &b) {
                     return a.createdAt > b.createdAt;
                   });
  return result;
}

bool RecoveryManager::purge(const std::string &operationId) {
  auto entries = loadIndex();
  auto it = std::find_if(entries.begin(), entries.end(),
                         [&](const BackupEntry &e) {
                           return e.operationId == operationId;
                         });
  if (it == entries.end())
    return false;

  std::error_code ec;
  fs::remove_all(m_backupDir / operationId, ec);
  if (ec) {
    throw RecoveryError("Cannot remove backup " + operationId + ": " +
                        ec.message());
  }

  entries.erase(it);
  saveIndex(entries);
  return true;
}

int RecoveryManager::purgeExpired() {
  auto entries = loadIndex();
  std::vector<BackupEntry> kept;
  int removed = 0;

  for (const auto &entry : entries) {
    if (!isExpired(entry, m_retentionDays)) {
      kept.push_back(entry);
      continue;
    }
    std::error_code ec;
    fs::remove_all(m_backupDir / entry.operationId, ec);
    if (ec) {
      Log::warn("Cannot remove expired backup " + entry.operationId + ": " +
                ec.message());
      kept.push_back(entry);
      continue;
    }
    ++removed;
  }

  if (removed > 0) {
    saveIndex(kept);
    Log::info("Purged " + std::to_string(removed) + " expired backup(s)");
  }
  return removed;
}
