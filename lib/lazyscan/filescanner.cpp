/**
 * @file filescanner.cpp
 * @brief Implementation of directory scanning and disk usage totals
 */

#include "filescanner.hpp"
#include "log.hpp"

#include <algorithm>
#include <cstddef>
#include <system_error>

namespace fs = std::filesystem;

/**
 * @brief Scans a directory and collects file information
 *
 * Traverses a directory (optionally recursively) and collects FileInfo objects
 * for all entries. Iteration uses the std::error_code overloads so that one
 * unreadable subdirectory does not abort the whole scan.
 *
 * Progress callbacks are invoked periodically during scanning:
 * - Every 100 items in recursive mode
 * - Every 10 items in non-recursive mode
 * - Once at the end with the final count
 *
 * @param dir_path The directory path to scan (e.g., /home/users/foobar)
 * @param recursive If true, recursively scan all subdirectories
 * @param progress Optional callback function for progress updates
 *
 * @return std::vector<FileInfo> Sorted vector of FileInfo objects
 *
 * @note Symlinked directories are not descended into
 * @note Progress callback receives item count, not percentage
 */
std::vector<FileInfo> FileScanner::scanDirectory(const fs::path &dir_path,
                                                 bool recursive,
                                                 ProgressCallback progress) {
  std::vector<FileInfo> results;
  int count = 0;
  std::error_code ec;

  auto tick = [&](int every) {
    ++count;
    if (progress && count % every == 0)
      progress(count);
  };

  if (recursive) {
    fs::recursive_directory_iterator it(
        dir_path, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      Log::warn("Cannot scan " + dir_path.string() + ": " + ec.message());
      return results;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if (ec) {
        Log::debug("Skipping entry under " + dir_path.string() + ": " +
                   ec.message());
        ec.clear();
        continue;
      }
      processEntry(*it, results);
      tick(100);
    }
  } else {
    fs::directory_iterator it(dir_path,
                              fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      Log::warn("Cannot scan " + dir_path.string() + ": " + ec.message());
      return results;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
      if (ec) {
        ec.clear();
        continue;
      }
      processEntry(*it, results);
      tick(10);
    }
  }

  // Final callback
  if (progress) {
    progress(count);
  }

  sortEntries(results);
  return results;
}

void FileScanner::processEntry(const fs::directory_entry &entry,
                               std::vector<FileInfo> &results) const {
  std::error_code ec;
  bool isLink = entry.is_symlink(ec);
  bool isDir = !isLink && entry.is_directory(ec);

  std::uintmax_t size = 0;
  if (!isDir && !isLink && entry.is_regular_file(ec)) {
    size = entry.file_size(ec);
    if (ec)
      size = 0;
  }

  results.emplace_back(entry.path().string(), size, isDir, isLink);
}

/**
 * @brief Sorts entries: directories before files, alphabetical within each
 */
void FileScanner::sortEntries(std::vector<FileInfo> &results) {
  std::sort(results.begin(), results.end(),
            [](const FileInfo &a, const FileInfo &b) {
              if (a.isDirectory() != b.isDirectory()) {
                return a.isDirectory();
              }
              return a.getDisplayName() < b.getDisplayName();
            });
}

std::vector<FileInfo> FileScanner::largestFiles(const std::vector<FileInfo> &files,
                                                std::size_t n) {
  std::vector<FileInfo> regular;
  for (const auto &file : files) {
    if (!file.isDirectory() && !file.isSymlink())
      regular.push_back(file);
  }

  std::stable_sort(regular.begin(), regular.end(),
                   [](const FileInfo &a, const FileInfo &b) {
                     return a.getFileSize() > b.getFileSize();
                   });

  if (regular.size() > n)
    regular.erase(regular.begin() + static_cast<std::ptrdiff_t>(n), regular.end());
  return regular;
}

std::uintmax_t FileScanner::directorySize(const fs::path &path) {
  std::error_code ec;
  fs::file_status status = fs::symlink_status(path, ec);
  if (ec || fs::is_symlink(status))
    return 0;

  if (fs::is_regular_file(status)) {
    std::uintmax_t size = fs::file_size(path, ec);
    return ec ? 0 : size;
  }

  if (!fs::is_directory(status))
    return 0;

  std::uintmax_t total = 0;
  fs::recursive_directory_iterator it(
      path, fs::directory_options::skip_permission_denied, ec);
  if (ec)
    return 0;

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      ec.clear();
      continue;
    }
    std::error_code entry_ec;
    if (it->is_regular_file(entry_ec) && !it->is_symlink(entry_ec)) {
      std::uintmax_t size = it->file_size(entry_ec);
      if (!entry_ec)
        total += size;
    }
  }
  return total;
}
