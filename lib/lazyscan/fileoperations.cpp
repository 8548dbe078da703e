/**
 * @file fileoperations.cpp
 * @brief Filesystem mutations behind IFileOperations
 */

#include "fileoperations.hpp"
#include "errors.hpp"
#include "filescanner.hpp"

#include <system_error>

namespace fs = std::filesystem;

bool FileOperations::exists(const fs::path &path) const {
  std::error_code ec;
  // symlink_status so a dangling link still counts as present
  fs::file_status status = fs::symlink_status(path, ec);
  return status.type() != fs::file_type::not_found &&
         status.type() != fs::file_type::none;
}

std::uintmax_t FileOperations::totalSize(const fs::path &path) const {
  return FileScanner::directorySize(path);
}

fs::path FileOperations::moveToTrash(const fs::path &path) {
  refuseSymlink(path);
  return m_trash.moveToTrash(path);
}

std::uintmax_t FileOperations::removePermanently(const fs::path &path) {
  refuseSymlink(path);
  // Throwing overload: the caller turns filesystem_error into a result
  return fs::remove_all(path);
}

void FileOperations::refuseSymlink(const fs::path &path) const {
  std::error_code ec;
  fs::file_status status = fs::symlink_status(path, ec);
  if (ec && status.type() != fs::file_type::not_found) {
    throw DeletionSafetyError("Cannot read link status of " + path.string() +
                              ": " + ec.message());
  }
  if (fs::is_symlink(status)) {
    throw DeletionSafetyError("symlink: " + path.string() +
                              " became a symbolic link after validation");
  }
}
