/**
 * @file criticalpathguard.cpp
 * @brief Implementation of critical-path and symlink checks for deletions
 *
 * This file implements the checks that keep deletion requests away from
 * the operating system, the user's home directory and special filesystems.
 */

#include "criticalpathguard.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#ifdef __linux__
#include <sys/vfs.h>
#endif

namespace fs = std::filesystem;

namespace {

/**
 * @brief Decodes the octal escapes (\040 etc.) used in /proc/mounts
 */
std::string unescapeMountField(const std::string& field) {
    std::string out;
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size() &&
            field[i + 1] >= '0' && field[i + 1] <= '7' &&
            field[i + 2] >= '0' && field[i + 2] <= '7' &&
            field[i + 3] >= '0' && field[i + 3] <= '7') {
            int value = (field[i + 1] - '0') * 64 + (field[i + 2] - '0') * 8 +
                        (field[i + 3] - '0');
            out += static_cast<char>(value);
            i += 3;
        } else {
            out += field[i];
        }
    }
    return out;
}

fs::path resolvedOrSelf(const fs::path& path) {
    if (!path.is_absolute()) {
        return PathCanonicalizer::normalize(path);
    }
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(path, ec);
    return ec ? PathCanonicalizer::normalize(path)
              : PathCanonicalizer::normalize(resolved);
}

} // namespace

CriticalPathGuard::CriticalPathGuard(const fs::path& home,
                                     const std::vector<fs::path>& extra_denied,
                                     Platform platform)
    : m_home(PathCanonicalizer::normalize(home)),
      m_home_resolved(resolvedOrSelf(home)) {
    auto add = [](std::vector<fs::path>& list, const fs::path& denied) {
        list.push_back(PathCanonicalizer::normalize(denied));
        fs::path resolved = resolvedOrSelf(denied);
        if (!PathCanonicalizer::isSamePath(resolved, list.back())) {
            list.push_back(resolved);
        }
    };

    for (const auto& denied : defaultCriticalPaths(platform)) {
        add(m_denied, denied);
    }
    for (const auto& denied : extra_denied) {
        add(m_denied, denied);
        add(m_denied_trees, denied);
    }
}

/**
 * @brief Fixed deny-list of OS and package directories per platform
 *
 * The root of the filesystem is always included. Linux and macOS share the
 * Unix system directories; macOS adds its bundle and volume roots; Windows
 * lists the drive root, the Windows directory and the install roots.
 *
 * @param platform The platform whose list is requested
 * @return std::vector<fs::path> Absolute deny-listed directories
 */
std::vector<fs::path> CriticalPathGuard::defaultCriticalPaths(Platform platform) {
    switch (platform) {
        case Platform::Windows:
            return {"C:\\", "C:\\Windows", "C:\\Program Files",
                    "C:\\Program Files (x86)", "C:\\ProgramData", "C:\\Users"};
        case Platform::MacOS:
            return {"/", "/System", "/usr", "/etc", "/boot", "/var", "/bin",
                    "/sbin", "/Applications", "/Library", "/Users", "/Volumes",
                    "/private"};
        case Platform::Linux:
        default:
            return {"/", "/usr", "/etc", "/boot", "/var", "/bin", "/sbin",
                    "/lib", "/lib64", "/opt", "/home", "/root", "/proc",
                    "/sys", "/dev", "/run", "/srv"};
    }
}

/**
 * @brief Checks whether a canonical path may be handed to the deleter
 *
 * The checks are performed in the following order:
 * 1. Symlink on the requested path (blocked, checked before anything that
 *    looks at the resolved target)
 * 2. User home directory itself (blocked)
 * 3. Deny-listed directories and their ancestors (blocked)
 * 4. Virtual filesystems like /proc, /sys (blocked)
 * 5. Mount points (blocked)
 *
 * @param canonical Output of PathCanonicalizer::canonicalize()
 * @return GuardStatus Allowed or the first check that failed
 */
CriticalPathGuard::GuardStatus CriticalPathGuard::check(const CanonicalPath& canonical) const {
    if (isSymlink(canonical)) {
        return GuardStatus::BlockedSymlink;
    }

    if (PathCanonicalizer::isSamePath(canonical.requested, m_home) ||
        PathCanonicalizer::isSamePath(canonical.resolved, m_home_resolved)) {
        return GuardStatus::BlockedHome;
    }

    if (isCritical(canonical)) {
        return GuardStatus::BlockedCriticalPath;
    }

    if (isProtectedFilesystem(canonical.resolved)) {
        return GuardStatus::BlockedVirtualFS;
    }

    if (isMountPoint(canonical.resolved)) {
        return GuardStatus::BlockedMountPoint;
    }

    return GuardStatus::Allowed;
}

bool CriticalPathGuard::isCritical(const CanonicalPath& canonical) const {
    if (PathCanonicalizer::isSamePath(canonical.requested, m_home) ||
        PathCanonicalizer::isSamePath(canonical.resolved, m_home_resolved)) {
        return true;
    }

    // The path is critical if removing it would remove a denied directory,
    // i.e. it is that directory or one of its ancestors.
    for (const auto& denied : m_denied) {
        if (PathCanonicalizer::isWithin(denied, canonical.resolved) ||
            PathCanonicalizer::isWithin(denied, canonical.requested)) {
            return true;
        }
    }

    for (const auto& tree : m_denied_trees) {
        if (PathCanonicalizer::isWithin(canonical.resolved, tree) ||
            PathCanonicalizer::isWithin(canonical.requested, tree)) {
            return true;
        }
    }

    return false;
}

bool CriticalPathGuard::isSymlink(const CanonicalPath& canonical) {
    std::error_code ec;
    fs::file_status status = fs::symlink_status(canonical.requested, ec);

    if (status.type() == fs::file_type::not_found) {
        return false;
    }
    if (ec) {
        return true;  // On error, assume symlink
    }
    return fs::is_symlink(status);
}

/**
 * @brief Converts a GuardStatus to a human-readable message
 *
 * @param status The GuardStatus to convert to a message
 * @param path The filesystem path being checked (included in the message)
 *
 * @return std::string A message starting with the reason code
 */
std::string CriticalPathGuard::getStatusMessage(GuardStatus status, const std::string& path) {
    switch (status) {
        case GuardStatus::Allowed:
            return "Deletion allowed";
        case GuardStatus::BlockedSymlink:
            return "symlink: refusing to delete symbolic link " + path;
        case GuardStatus::BlockedHome:
            return "critical path: refusing to delete your home directory " + path;
        case GuardStatus::BlockedCriticalPath:
            return "critical path: refusing to delete protected location " + path;
        case GuardStatus::BlockedMountPoint:
            return "critical path: refusing to delete mount point " + path;
        case GuardStatus::BlockedVirtualFS:
            return "critical path: refusing to delete on a virtual filesystem " + path;
        default:
            return "Unknown status";
    }
}

std::string CriticalPathGuard::reasonCode(GuardStatus status) {
    switch (status) {
        case GuardStatus::Allowed:
            return "";
        case GuardStatus::BlockedSymlink:
            return "symlink";
        default:
            return "critical path";
    }
}

bool CriticalPathGuard::isMountPoint(const fs::path& path) {
    auto mounts = getMountPoints();

    for (const auto& mount : mounts) {
        if (PathCanonicalizer::isSamePath(mount.mountpoint, path)) {
            return true;
        }
    }

    return false;
}

/**
 * @brief Checks if a path resides on a protected or virtual filesystem
 *
 * Uses statfs() on the path, or on its nearest existing ancestor when the
 * path itself is already gone, and compares the filesystem magic number
 * against kernel pseudo-filesystems.
 *
 * @param path The filesystem path to check
 *
 * @return true if the path is on a protected filesystem or if statfs() fails,
 *         false if on a regular filesystem
 *
 * @note Uses Linux filesystem magic numbers from /usr/include/linux/magic.h
 * @note Returns true on error (fail-safe behavior)
 * @note tmpfs and ramfs are regular cache locations and are not protected
 *
 * Protected filesystem types checked:
 * - procfs (0x9fa0)
 * - sysfs (0x62656572)
 * - devpts (0x1cd1)
 * - securityfs (0x73636673)
 * - cgroup (0x27e0eb) and cgroup2 (0x63677270)
 * - debugfs (0x64626720)
 */
bool CriticalPathGuard::isProtectedFilesystem(const fs::path& path) {
#ifdef __linux__
    fs::path probe = path;
    std::error_code ec;
    while (!fs::exists(probe, ec) && probe.has_parent_path() &&
           probe != probe.parent_path()) {
        probe = probe.parent_path();
    }

    struct statfs fs_info;
    if (statfs(probe.c_str(), &fs_info) != 0) {
        return true;  // On error, assume protected
    }

    const long PROTECTED_FS[] = {
        0x9fa0,       // PROC_SUPER_MAGIC
        0x62656572,   // SYSFS_MAGIC
        0x1cd1,       // DEVPTS_SUPER_MAGIC
        0x73636673,   // SECURITYFS_MAGIC
        0x27e0eb,     // CGROUP_SUPER_MAGIC
        0x63677270,   // CGROUP2_SUPER_MAGIC
        0x64626720,   // DEBUGFS_MAGIC
    };

    for (auto magic : PROTECTED_FS) {
        if (static_cast<long>(fs_info.f_type) == magic) {
            return true;
        }
    }
#else
    (void)path;
#endif
    return false;
}

/**
 * @brief Retrieves information about all currently mounted filesystems
 *
 * Parses /proc/mounts. Returns an empty vector where /proc/mounts does not
 * exist (macOS, Windows).
 *
 * Mount points are returned with their octal escapes decoded.
 */
std::vector<CriticalPathGuard::MountInfo> CriticalPathGuard::getMountPoints() {
    std::vector<MountInfo> mounts;
    std::ifstream mounts_file("/proc/mounts");

    if (!mounts_file.is_open()) {
        return mounts;
    }

    std::string line;
    while (std::getline(mounts_file, line)) {
        std::istringstream iss(line);
        std::string device, mountpoint;
        if (!(iss >> device >> mountpoint)) {
            continue;
        }
        mounts.push_back(MountInfo{unescapeMountField(mountpoint)});
    }

    return mounts;
}
