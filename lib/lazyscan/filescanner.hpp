/**
 * @file filescanner.hpp
 * @brief Directory scanning and disk usage collection
 *
 * This header defines the FileScanner class which traverses directories,
 * collects file sizes and reports the largest files of a tree.
 */

#ifndef FILESCANNER_HPP
#define FILESCANNER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

#include "fileinfo.hpp"

/**
 * @class FileScanner
 * @brief Scans directories and collects file information
 *
 * FileScanner traverses filesystem directories (recursively or
 * non-recursively) and builds a collection of FileInfo objects.
 *
 * Key features:
 * - Recursive and non-recursive directory scanning
 * - Symlinks are listed but never followed
 * - Entries that cannot be read (permission denied) are skipped
 * - Progress reporting via callbacks
 *
 * @see FileInfo
 */
class FileScanner {
public:
  /**
   * @brief Callback function type for progress notifications
   *
   * Function signature: void(int count)
   * - count: Number of items processed so far
   */
  using ProgressCallback = std::function<void(int count)>;

  /**
   * @brief Scans a directory and returns file information
   *
   * @param dir_path The filesystem path to scan
   * @param recursive If true, recursively scan all subdirectories
   * @param progress Optional callback for progress updates (default: nullptr)
   *
   * @return std::vector<FileInfo> Directories first, then files, each
   *         alphabetical. Empty if dir_path cannot be opened.
   */
  std::vector<FileInfo> scanDirectory(const std::filesystem::path &dir_path,
                                      bool recursive,
                                      ProgressCallback progress = nullptr);

  /**
   * @brief The n largest regular files, biggest first
   */
  static std::vector<FileInfo> largestFiles(const std::vector<FileInfo> &files,
                                            std::size_t n);

  /**
   * @brief Total size in bytes of a file or directory tree
   *
   * Symlinks count as zero and are not followed. Unreadable entries are
   * skipped. Returns 0 for a path that does not exist.
   */
  static std::uintmax_t directorySize(const std::filesystem::path &path);

private:
  void processEntry(const std::filesystem::directory_entry &entry,
                    std::vector<FileInfo> &results) const;

  void sortEntries(std::vector<FileInfo> &results);
};

#endif // FILESCANNER_HPP
