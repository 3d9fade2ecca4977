#pragma once

#include <optional>
#include <string_view>

namespace sysinc {

enum class platform { posix, windows, other };

// The only place where the build target decides anything.  Everything else
// receives a platform value.
constexpr platform host_platform() {
#if defined(_WIN32)
  return platform::windows;
#elif defined(__unix__) || defined(__APPLE__)
  return platform::posix;
#else
  return platform::other;
#endif
}

inline std::string_view to_string(platform p) {
  // clang-format off
  switch (p) {
  case platform::posix:   return "posix";
  case platform::windows: return "windows";
  case platform::other:   return "other";
  }
  // clang-format on
  return "other";
}

inline std::optional<platform> platform_from_string(std::string_view s) {
  if (s == "posix") return platform::posix;
  if (s == "windows") return platform::windows;
  if (s == "other") return platform::other;
  return std::nullopt;
}

}  // namespace sysinc
