#ifndef CRITICALPATHGUARD_HPP
#define CRITICALPATHGUARD_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "pathcanonicalizer.hpp"
#include "platform.hpp"

/**
 * @brief Safety checks that block deletion of system-critical locations
 *
 * A path is blocked when it
 * - is a symlink (always, regardless of its target),
 * - is the user's home directory itself (its children are fine),
 * - equals or is an ancestor of a deny-listed directory,
 * - lies inside a directory of the policy deny_list,
 * - is a mount point or lives on a virtual filesystem (procfs, sysfs, ...).
 */
class CriticalPathGuard {
public:
    enum class GuardStatus {
        Allowed,
        BlockedSymlink,
        BlockedHome,
        BlockedCriticalPath,
        BlockedMountPoint,
        BlockedVirtualFS
    };

    struct MountInfo {
        std::string mountpoint;
    };

    /**
     * @param home The invoking user's home directory
     * @param extra_denied Policy deny_list; unlike the fixed OS list these
     *        also protect everything below them
     * @param platform Selects the fixed OS deny-list
     */
    CriticalPathGuard(const std::filesystem::path& home,
                      const std::vector<std::filesystem::path>& extra_denied,
                      Platform platform = currentPlatform());

    /**
     * @brief Runs all checks in order of severity
     */
    GuardStatus check(const CanonicalPath& canonical) const;

    /**
     * @brief True if the path is the home root, equals or contains a
     *        deny-listed directory, or lies inside a policy deny_list entry
     */
    bool isCritical(const CanonicalPath& canonical) const;

    /**
     * @brief True if the requested path is a symlink
     *
     * An unreadable link status counts as a symlink.
     */
    static bool isSymlink(const CanonicalPath& canonical);

    /**
     * @brief Human-readable message for a status
     */
    static std::string getStatusMessage(GuardStatus status, const std::string& path);

    /**
     * @brief Short reason code: "symlink" or "critical path"
     */
    static std::string reasonCode(GuardStatus status);

    /**
     * @brief Fixed deny-list for a platform
     */
    static std::vector<std::filesystem::path> defaultCriticalPaths(Platform platform);

    static bool isMountPoint(const std::filesystem::path& path);
    static bool isProtectedFilesystem(const std::filesystem::path& path);

    /**
     * @brief Get all mount points from /proc/mounts
     */
    static std::vector<MountInfo> getMountPoints();

private:
    std::filesystem::path m_home;
    std::filesystem::path m_home_resolved;

    /** @brief Deny-listed paths, both as written and symlink-resolved */
    std::vector<std::filesystem::path> m_denied;

    /** @brief Policy deny_list entries whose whole subtree is protected */
    std::vector<std::filesystem::path> m_denied_trees;
};

#endif // CRITICALPATHGUARD_HPP
