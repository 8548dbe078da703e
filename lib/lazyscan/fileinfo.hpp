#ifndef FILE_INFO_HPP
#define FILE_INFO_HPP

#include <cstdint>
#include <filesystem>
#include <string>

#include "utils.hpp"

class FileInfo {
private:
  std::string m_path;
  std::uintmax_t m_size;
  bool m_isDir;
  bool m_isSymlink = false;

public:
  FileInfo(const std::string &p, std::uintmax_t s, bool isDir,
           bool isSymlink = false)
      : m_path(p), m_size(s), m_isDir(isDir), m_isSymlink(isSymlink) {}

  const std::string &getPath() const { return m_path; }
  std::uintmax_t getFileSize() const { return m_size; }
  bool isDirectory() const { return m_isDir; }
  bool isSymlink() const { return m_isSymlink; }

  std::string getDisplayName() const {
    std::filesystem::path p(m_path);
    std::string name = p.filename().string();

    if (name.empty() && m_isDir) {
      // Root or current dir
      return p.string();
    }

    return m_isDir ? name + "/" : name;
  }

  std::string getSizeFormatted() const {
    if (m_isDir)
      return "<DIR>";
    return formatBytes(m_size);
  }
};

#endif // FILE_INFO_HPP
