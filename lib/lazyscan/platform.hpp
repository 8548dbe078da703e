#ifndef PLATFORM_HPP
#define PLATFORM_HPP

enum class Platform { Linux, MacOS, Windows };

inline Platform currentPlatform() {
#if defined(_WIN32)
  return Platform::Windows;
#elif defined(__APPLE__)
  return Platform::MacOS;
#else
  return Platform::Linux;
#endif
}

#endif // PLATFORM_HPP
