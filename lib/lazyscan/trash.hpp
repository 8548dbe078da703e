/**
 * @file trash.hpp
 * @brief Platform trash (recycle bin) primitive
 *
 * Moving to the trash is the only non-permanent deletion lazyscan performs.
 * When no backend is available the move fails with PlatformError; there is
 * never a silent fallback to permanent removal.
 */

#ifndef TRASH_HPP
#define TRASH_HPP

#include <filesystem>
#include <string>

#include "platform.hpp"

enum class TrashBackend { MacOS, Windows, Linux, Unavailable };

std::string trashBackendName(TrashBackend backend);

/**
 * @brief Picks the trash backend for this process
 *
 * Linux needs a writable $XDG_DATA_HOME/Trash, macOS needs ~/.Trash and
 * Windows needs the shell API (only compiled in on Windows).
 */
TrashBackend probeTrashBackend(Platform platform,
                               const std::filesystem::path &home,
                               const std::filesystem::path &dataHome);

class Trash {
public:
  /**
   * @param backend Result of probeTrashBackend()
   * @param home User home directory (macOS ~/.Trash)
   * @param dataHome $XDG_DATA_HOME (Linux trash lives in dataHome/Trash)
   */
  Trash(TrashBackend backend, std::filesystem::path home,
        std::filesystem::path dataHome);

  /**
   * @brief Moves a file or directory to the trash
   *
   * Linux follows the freedesktop.org Trash layout: a .trashinfo
   * file is reserved first, then the entry is renamed into Trash/files.
   * Targets on another filesystem go to that filesystem's .Trash-$UID
   * directory.
   *
   * @return Location of the entry inside the trash (empty on Windows)
   * @throws PlatformError if the backend is unavailable or the move fails
   */
  std::filesystem::path moveToTrash(const std::filesystem::path &target) const;

  TrashBackend backend() const { return m_backend; }

  /** @brief Home trash directory for the active backend */
  std::filesystem::path trashDirectory() const;

private:
  std::filesystem::path moveToFreedesktopTrash(
      const std::filesystem::path &target) const;
  std::filesystem::path moveToMacTrash(const std::filesystem::path &target) const;
  void moveToRecycleBin(const std::filesystem::path &target) const;

  TrashBackend m_backend;
  std::filesystem::path m_home;
  std::filesystem::path m_dataHome;
};

#endif // TRASH_HPP
