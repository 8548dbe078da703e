/**
 * @file pathcanonicalizer.hpp
 * @brief Resolution of user and discovery supplied paths
 *
 * Every path entering the deletion pipeline passes through
 * PathCanonicalizer::canonicalize() first. Comparisons between paths are
 * done on path segments with isWithin(), never on raw string prefixes.
 */

#ifndef PATHCANONICALIZER_HPP
#define PATHCANONICALIZER_HPP

#include <filesystem>
#include <string>

/**
 * @struct CanonicalPath
 * @brief A validated absolute path in two forms
 *
 * - requested: absolute and lexically normalized, symlinks NOT resolved.
 *   This is the path the caller asked for; symlink checks use it.
 * - resolved: symlink-resolved form; policy and critical-path checks use it.
 */
struct CanonicalPath {
  std::filesystem::path requested;
  std::filesystem::path resolved;

  std::string string() const { return resolved.string(); }
};

class PathCanonicalizer {
public:
  /**
   * @param home Home directory used for "~" expansion
   */
  explicit PathCanonicalizer(std::filesystem::path home);

  /**
   * @brief Resolves a path to its canonical form
   *
   * Steps:
   * 1. Reject empty input, control characters, surrounding whitespace and
   *    mixed '/' and '\' separators
   * 2. Expand "~" and environment variables (expand())
   * 3. Make absolute and lexically normalize ("." and "..")
   * 4. Resolve symlinks of the existing part of the path
   *
   * @throws PathValidationError if the path neither exists nor has an
   *         existing parent, or if resolution fails (e.g. permission denied)
   */
  CanonicalPath canonicalize(const std::string &input) const;

  /**
   * @brief Expands a leading "~" and $NAME / ${NAME} references
   * @throws PathValidationError on "~user" or an undefined variable
   */
  std::filesystem::path expand(const std::string &input) const;

  const std::filesystem::path &home() const { return m_home; }

  /**
   * @brief True if root equals path or is one of its ancestors
   *
   * Compares normalized path segments, so "/home/user2" is not within
   * "/home/user".
   */
  static bool isWithin(const std::filesystem::path &path,
                       const std::filesystem::path &root);

  /** @brief Segment-wise equality of two normalized paths */
  static bool isSamePath(const std::filesystem::path &a,
                         const std::filesystem::path &b);

  /** @brief Lexically normal form without a trailing separator */
  static std::filesystem::path normalize(const std::filesystem::path &path);

private:
  std::filesystem::path m_home;
};

#endif // PATHCANONICALIZER_HPP
