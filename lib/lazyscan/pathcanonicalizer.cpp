/**
 * @file pathcanonicalizer.cpp
 * @brief Implementation of path expansion, normalization and resolution
 */

#include "pathcanonicalizer.hpp"
#include "errors.hpp"

#include <cctype>
#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;

namespace {

bool isVariableChar(char c, bool first) {
  if (c == '_' || std::isalpha(static_cast<unsigned char>(c)))
    return true;
  return !first && std::isdigit(static_cast<unsigned char>(c));
}

std::string lookupVariable(const std::string &name, const std::string &input) {
  const char *value = std::getenv(name.c_str());
  if (!value) {
    throw PathValidationError("Undefined environment variable $" + name +
                              " in path: " + input);
  }
  return value;
}

} // namespace

PathCanonicalizer::PathCanonicalizer(fs::path home)
    : m_home(normalize(std::move(home))) {}

fs::path PathCanonicalizer::expand(const std::string &input) const {
  std::string rest = input;
  std::string out;

  if (!rest.empty() && rest[0] == '~') {
    if (rest.size() == 1 || rest[1] == '/' || rest[1] == '\\') {
      out = m_home.string();
      rest = rest.substr(1);
    } else {
      throw PathValidationError("Expansion of other users' home directories "
                                "is not supported: " +
                                input);
    }
  }

  for (size_t i = 0; i < rest.size(); ++i) {
    if (rest[i] != '$') {
      out += rest[i];
      continue;
    }

    // ${NAME}
    if (i + 1 < rest.size() && rest[i + 1] == '{') {
      size_t close = rest.find('}', i + 2);
      if (close == std::string::npos || close == i + 2) {
        throw PathValidationError("Malformed variable reference in path: " +
                                  input);
      }
      out += lookupVariable(rest.substr(i + 2, close - i - 2), input);
      i = close;
      continue;
    }

    // $NAME
    size_t end = i + 1;
    while (end < rest.size() && isVariableChar(rest[end], end == i + 1)) {
      ++end;
    }
    if (end == i + 1) {
      out += '$'; // lone '$' is a literal
      continue;
    }
    out += lookupVariable(rest.substr(i + 1, end - i - 1), input);
    i = end - 1;
  }

  return fs::path(out);
}

CanonicalPath PathCanonicalizer::canonicalize(const std::string &input) const {
  if (input.empty()) {
    throw PathValidationError("Path cannot be empty");
  }

  for (char c : input) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (uc < 0x20 || uc == 0x7f) {
      throw PathValidationError("Path contains control characters: " + input);
    }
  }

  if (std::isspace(static_cast<unsigned char>(input.front())) ||
      std::isspace(static_cast<unsigned char>(input.back()))) {
    throw PathValidationError("Path has leading or trailing whitespace: '" +
                              input + "'");
  }

  if (input.find('\\') != std::string::npos &&
      input.find('/') != std::string::npos) {
    throw PathValidationError("Path contains mixed separators: " + input);
  }

  fs::path expanded = expand(input);

  std::error_code ec;
  if (expanded.is_relative()) {
    fs::path cwd = fs::current_path(ec);
    if (ec) {
      throw PathValidationError("Cannot resolve relative path " + input +
                                ": " + ec.message());
    }
    expanded = cwd / expanded;
  }

  CanonicalPath result;
  result.requested = normalize(expanded);

  fs::file_status status = fs::symlink_status(result.requested, ec);
  if (status.type() == fs::file_type::not_found) {
    std::error_code parent_ec;
    fs::path parent = result.requested.parent_path();
    if (!fs::is_directory(parent, parent_ec)) {
      throw PathValidationError("Path does not exist and has no existing "
                                "parent directory: " +
                                result.requested.string());
    }
  } else if (ec) {
    throw PathValidationError("Cannot access " + result.requested.string() +
                              ": " + ec.message());
  }

  result.resolved = normalize(fs::weakly_canonical(result.requested, ec));
  if (ec) {
    throw PathValidationError("Cannot canonicalize " +
                              result.requested.string() + ": " + ec.message());
  }

  return result;
}

fs::path PathCanonicalizer::normalize(const fs::path &path) {
  fs::path normal = path.lexically_normal();
  if (!normal.has_filename() && normal != normal.root_path() &&
      normal.has_parent_path()) {
    normal = normal.parent_path();
  }
  return normal;
}

bool PathCanonicalizer::isWithin(const fs::path &path, const fs::path &root) {
  fs::path p = normalize(path);
  fs::path r = normalize(root);
  if (r.empty())
    return false;

  auto pit = p.begin();
  for (auto rit = r.begin(); rit != r.end(); ++rit, ++pit) {
    if (pit == p.end() || *pit != *rit) {
      return false;
    }
  }
  return true;
}

bool PathCanonicalizer::isSamePath(const fs::path &a, const fs::path &b) {
  return isWithin(a, b) && isWithin(b, a);
}
