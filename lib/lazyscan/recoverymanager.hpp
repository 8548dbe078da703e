/**
 * @file recoverymanager.hpp
 * @brief Backup store for deletions made with backup_before_delete
 *
 * Layout of the backup directory:
 * @code
 * <backup_dir>/index.json
 * <backup_dir>/<operation_id>/<original file name>
 * @endcode
 *
 * The index is rewritten atomically (temporary file + rename) on every
 * change. A backup whose size or checksum no longer matches the index is
 * treated as partial and is never restored.
 */

#ifndef RECOVERYMANAGER_HPP
#define RECOVERYMANAGER_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "deletiontypes.hpp"
#include "ihashcalculator.hpp"

struct BackupEntry {
  std::string operationId;
  std::string originalPath;
  std::string backupLocation;
  std::string createdAt; ///< ISO-8601 UTC
  std::uintmax_t size = 0;
  std::string checksum; ///< content digest, see RecoveryManager::contentChecksum()
  bool isDirectory = false;
  std::string category;
};

struct RecoveryResult {
  bool success = false;
  std::string operationId;
  std::string restoredPath;
  std::uintmax_t bytesRestored = 0;
  std::string message;
};

class RecoveryManager {
public:
  /**
   * @param backupDir Root of the backup store, created on first backup
   * @param hasher Digest used for integrity checks
   * @param retentionDays Entries older than this are purged; <= 0 keeps
   *        everything
   */
  RecoveryManager(std::filesystem::path backupDir, const IHashCalculator &hasher,
                  int retentionDays);

  /**
   * @brief Copies a file or directory into the store and indexes it
   *
   * The copy is verified against the source before it is indexed.
   *
   * @throws BackupError if the copy or its verification fails; a partial
   *         copy is removed and the source is never modified
   */
  BackupEntry createBackup(const std::string &operationId,
                           const std::filesystem::path &source,
                           Category category);

  /**
   * @brief Puts a backed-up path back at its original location
   *
   * Succeeds without copying if identical content is already present.
   * The backup itself is kept until it expires or is purged.
   *
   * @throws RecoveryError if the operation id is unknown, the backup is
   *         missing or fails its integrity check, or different content
   *         exists at the original path and @p overwrite is false
   */
  RecoveryResult restore(const std::string &operationId, bool overwrite = false);

  /**
   * @brief Backups created within the last @p withinDays days, newest first
   *
   * Purges expired entries first.
   */
  std::vector<BackupEntry> listRecoverable(int withinDays);

  /**
   * @brief Removes one backup and its index entry
   * @return false if the operation id is unknown
   */
  bool purge(const std::string &operationId);

  /** @return Number of entries removed */
  int purgeExpired();

  /**
   * @brief Digest of a file, or of a directory tree's manifest
   *
   * A directory digest covers every relative path, entry type, size and
   * file digest, so a missing or truncated file changes it.
   */
  std::string contentChecksum(const std::filesystem::path &path) const;


private:
  std::vector<BackupEntry> loadIndex() const;
  void saveIndex(const std::vector<BackupEntry> &entries) const;

  std::filesystem::path m_backupDir;
  std::filesystem::path m_indexFile;
  const IHashCalculator &m_hasher;
  int m_retentionDays;
};

#endif // RECOVERYMANAGER_HPP
