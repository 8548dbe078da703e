/**
 * @file fileoperations.hpp
 * @brief The filesystem mutations SafeDeleter is allowed to perform
 *
 * SafeDeleter never touches the filesystem directly for destructive
 * operations; it goes through IFileOperations so that tests can verify
 * that blocked requests never reach a mutation.
 */

#ifndef FILEOPERATIONS_HPP
#define FILEOPERATIONS_HPP

#include <cstdint>
#include <filesystem>

#include "trash.hpp"

class IFileOperations {
public:
  virtual bool exists(const std::filesystem::path &path) const = 0;
  virtual std::uintmax_t totalSize(const std::filesystem::path &path) const = 0;

  /**
   * @return Location inside the trash, if the backend reports one
   * @throws PlatformError if the trash is unavailable or the move failed
   * @throws DeletionSafetyError if the target turned into a symlink
   */
  virtual std::filesystem::path
  moveToTrash(const std::filesystem::path &path) = 0;

  /**
   * @return Number of filesystem entries removed
   * @throws std::filesystem::filesystem_error on removal failure
   * @throws DeletionSafetyError if the target turned into a symlink
   */
  virtual std::uintmax_t removePermanently(const std::filesystem::path &path) = 0;

  virtual ~IFileOperations() = default;
};

/**
 * @brief Real filesystem implementation backed by Trash
 *
 * Re-checks the link status immediately before every mutation so a path
 * swapped for a symlink after validation is refused.
 */
class FileOperations : public IFileOperations {
public:
  explicit FileOperations(const Trash &trash) : m_trash(trash) {}

  bool exists(const std::filesystem::path &path) const override;
  std::uintmax_t totalSize(const std::filesystem::path &path) const override;
  std::filesystem::path moveToTrash(const std::filesystem::path &path) override;
  std::uintmax_t removePermanently(const std::filesystem::path &path) override;

private:
  void refuseSymlink(const std::filesystem::path &path) const;

  const Trash &m_trash;
};

#endif // FILEOPERATIONS_HPP
