#ifndef CONFIRMATION_HPP
#define CONFIRMATION_HPP

#include <cstdint>
#include <string>

#ifndef _WIN32
#include <unistd.h>
#else
#include <cstdio>
#include <io.h>
#endif

/** @brief Literal the user must type to confirm a permanent deletion */
inline const char *const kConfirmationPhrase = "DELETE";

/**
 * @brief Source of the typed confirmation for permanent deletions
 */
class IConfirmationPrompt {
public:
  /** @brief True if a human can answer ask() */
  virtual bool isInteractive() const = 0;

  /**
   * @brief Shows the confirmation request and returns what the user typed
   *
   * Only called when isInteractive() is true.
   */
  virtual std::string ask(const std::string &path, std::uintmax_t bytes) = 0;

  virtual ~IConfirmationPrompt() = default;
};

/**
 * @brief Prompt for scripted callers: never interactive, never asks
 */
class NonInteractivePrompt : public IConfirmationPrompt {
public:
  bool isInteractive() const override { return false; }
  std::string ask(const std::string &, std::uintmax_t) override { return ""; }
};

inline bool stdinIsTerminal() {
#ifndef _WIN32
  return isatty(STDIN_FILENO) != 0;
#else
  return _isatty(_fileno(stdin)) != 0;
#endif
}

#endif // CONFIRMATION_HPP
