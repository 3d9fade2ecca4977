#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

#include "sysinc/platform.hpp"

namespace sysinc {

namespace fs = std::filesystem;

enum class strategy_kind { environment, subprocess };

struct strategy {
  strategy_kind kind;
  fs::path compiler;  // empty for strategy_kind::environment
};

inline std::string_view to_string(strategy_kind k) {
  return k == strategy_kind::environment ? "environment" : "subprocess";
}

// True for cl, cl.exe, clang-cl and clang-cl.exe.  Only the filename
// counts and the match is case-sensitive.
bool is_msvc_like(const fs::path& compiler);

fs::path default_compiler(platform p);

strategy select_strategy(
    const std::optional<fs::path>& compiler, platform p);

}  // namespace sysinc
