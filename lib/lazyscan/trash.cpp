/**
 * @file trash.cpp
 * @brief Trash backends for Linux (freedesktop.org), macOS and Windows
 */

#include "trash.hpp"
#include "criticalpathguard.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#include <shellapi.h>
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace {

std::string candidateName(const std::string &base, int attempt) {
  return attempt == 0 ? base : base + "." + std::to_string(attempt + 1);
}

#ifndef _WIN32
/**
 * @brief Percent-encodes a path for the Path= key of a .trashinfo file
 *
 * Unreserved characters and '/' are kept, everything else becomes %XX.
 */
std::string encodeTrashPath(const std::string &path) {
  static const char *hex = "0123456789ABCDEF";
  std::string out;
  for (unsigned char c : path) {
    if (std::isalnum(c) || c == '/' || c == '-' || c == '_' || c == '.' ||
        c == '~') {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += hex[c >> 4];
      out += hex[c & 0x0f];
    }
  }
  return out;
}

std::string localDeletionDate() {
  std::time_t now =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&now, &local);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &local);
  return buf;
}

/**
 * @brief Atomically reserves <info>/<name>.trashinfo and writes it
 *
 * @return The reserved entry name, or an empty string if no name could be
 *         reserved
 */
std::string reserveTrashInfo(const fs::path &infoDir, const std::string &base,
                             const fs::path &original) {
  for (int attempt = 0; attempt < 1000; ++attempt) {
    std::string name = candidateName(base, attempt);
    fs::path infoFile = infoDir / (name + ".trashinfo");

    // "x" makes fopen fail if the file exists (O_EXCL)
    FILE *fp = std::fopen(infoFile.c_str(), "wx");
    if (!fp) {
      if (errno == EEXIST)
        continue;
      return "";
    }

    std::string content = "[Trash Info]\nPath=" +
                          encodeTrashPath(original.string()) +
                          "\nDeletionDate=" + localDeletionDate() + "\n";
    bool ok = std::fwrite(content.data(), 1, content.size(), fp) ==
              content.size();
    ok = (std::fclose(fp) == 0) && ok;
    if (!ok) {
      std::error_code ec;
      fs::remove(infoFile, ec);
      return "";
    }
    return name;
  }
  return "";
}

/**
 * @brief Longest mount point containing the path, "/" if none is found
 */
fs::path mountPointOf(const fs::path &path) {
  fs::path best = "/";
  for (const auto &mount : CriticalPathGuard::getMountPoints()) {
    if (PathCanonicalizer::isWithin(path, mount.mountpoint) &&
        fs::path(mount.mountpoint).string().size() > best.string().size()) {
      best = mount.mountpoint;
    }
  }
  return best;
}

/**
 * @brief Moves a target into one trash directory (home or top-dir)
 *
 * @return Final location in trash; empty with ec set on failure
 */
fs::path moveIntoTrashDir(const fs::path &trashDir, const fs::path &target,
                          std::error_code &ec) {
  fs::path filesDir = trashDir / "files";
  fs::path infoDir = trashDir / "info";

  fs::create_directories(filesDir, ec);
  if (ec)
    return {};
  fs::create_directories(infoDir, ec);
  if (ec)
    return {};

  std::string name =
      reserveTrashInfo(infoDir, target.filename().string(), target);
  if (name.empty()) {
    ec = std::make_error_code(std::errc::io_error);
    return {};
  }

  fs::path destination = filesDir / name;
  fs::rename(target, destination, ec);
  if (ec) {
    std::error_code cleanup;
    fs::remove(infoDir / (name + ".trashinfo"), cleanup);
    return {};
  }
  return destination;
}
#endif

} // namespace

std::string trashBackendName(TrashBackend backend) {
  switch (backend) {
  case TrashBackend::MacOS:
    return "macos";
  case TrashBackend::Windows:
    return "windows";
  case TrashBackend::Linux:
    return "freedesktop";
  case TrashBackend::Unavailable:
    return "unavailable";
  }
  return "unavailable";
}

TrashBackend probeTrashBackend(Platform platform, const fs::path &home,
                               const fs::path &dataHome) {
  std::error_code ec;
  switch (platform) {
  case Platform::Windows:
#ifdef _WIN32
    return TrashBackend::Windows;
#else
    return TrashBackend::Unavailable;
#endif
  case Platform::MacOS:
    if (home.empty())
      return TrashBackend::Unavailable;
    fs::create_directories(home / ".Trash", ec);
    return ec ? TrashBackend::Unavailable : TrashBackend::MacOS;
  case Platform::Linux:
    if (dataHome.empty())
      return TrashBackend::Unavailable;
    fs::create_directories(dataHome / "Trash" / "files", ec);
    if (!ec)
      fs::create_directories(dataHome / "Trash" / "info", ec);
    if (ec) {
      Log::warn("Trash directory unavailable: " + ec.message());
      return TrashBackend::Unavailable;
    }
    return TrashBackend::Linux;
  }
  return TrashBackend::Unavailable;
}

Trash::Trash(TrashBackend backend, fs::path home, fs::path dataHome)
    : m_backend(backend), m_home(std::move(home)),
      m_dataHome(std::move(dataHome)) {}

fs::path Trash::trashDirectory() const {
  switch (m_backend) {
  case TrashBackend::Linux:
    return m_dataHome / "Trash";
  case TrashBackend::MacOS:
    return m_home / ".Trash";
  default:
    return {};
  }
}

fs::path Trash::moveToTrash(const fs::path &target) const {
  switch (m_backend) {
  case TrashBackend::Linux:
    return moveToFreedesktopTrash(target);
  case TrashBackend::MacOS:
    return moveToMacTrash(target);
  case TrashBackend::Windows:
    moveToRecycleBin(target);
    return {};
  case TrashBackend::Unavailable:
    break;
  }
  throw PlatformError("No trash backend available; refusing to delete " +
                      target.string() + " permanently instead");
}

fs::path Trash::moveToFreedesktopTrash(const fs::path &target) const {
#ifndef _WIN32
  std::error_code ec;
  fs::path destination = moveIntoTrashDir(m_dataHome / "Trash", target, ec);
  if (!ec)
    return destination;

  if (ec != std::errc::cross_device_link) {
    throw PlatformError("Failed to move " + target.string() +
                        " to trash: " + ec.message());
  }

  // Target lives on another filesystem: use its top-directory trash
  fs::path topTrash =
      mountPointOf(target) / (".Trash-" + std::to_string(getuid()));
  Log::debug("Cross-device trash move via " + topTrash.string());

  ec.clear();
  destination = moveIntoTrashDir(topTrash, target, ec);
  if (ec) {
    throw PlatformError("Failed to move " + target.string() + " to trash " +
                        topTrash.string() + ": " + ec.message());
  }
  return destination;
#else
  throw PlatformError("freedesktop trash is not supported on this platform: " +
                      target.string());
#endif
}

fs::path Trash::moveToMacTrash(const fs::path &target) const {
  fs::path trashDir = m_home / ".Trash";
  std::string base = target.filename().string();

  std::error_code ec;
  for (int attempt = 0; attempt < 1000; ++attempt) {
    fs::path destination = trashDir / candidateName(base, attempt);
    if (fs::exists(fs::symlink_status(destination, ec)))
      continue;

    fs::rename(target, destination, ec);
    if (ec) {
      throw PlatformError("Failed to move " + target.string() +
                          " to trash: " + ec.message());
    }
    return destination;
  }
  throw PlatformError("No free name in " + trashDir.string() + " for " +
                      target.string());
}

void Trash::moveToRecycleBin(const fs::path &target) const {
#ifdef _WIN32
  std::wstring from = target.wstring();
  from.push_back(L'\0'); // double null terminated
  from.push_back(L'\0');

  SHFILEOPSTRUCTW op = {};
  op.wFunc = FO_DELETE;
  op.pFrom = from.c_str();
  op.fFlags = FOF_ALLOWUNDO | FOF_NOCONFIRMATION | FOF_NOERRORUI | FOF_SILENT;

  int rc = SHFileOperationW(&op);
  if (rc != 0 || op.fAnyOperationsAborted) {
    throw PlatformError("Failed to move " + target.string() +
                        " to the recycle bin (code " + std::to_string(rc) +
                        ")");
  }
#else
  throw PlatformError("Recycle bin is not available on this platform: " +
                      target.string());
#endif
}
