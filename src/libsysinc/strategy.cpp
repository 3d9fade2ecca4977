#include "sysinc/strategy.hpp"

#include <re2/re2.h>

#include "sysinc/logger.hpp"

namespace sysinc {

bool is_msvc_like(const fs::path& compiler) {
  static const RE2 msvc_re(R"(cl(?:\.exe)?$)");
  auto name = compiler.filename().string();
  return !name.empty() && RE2::PartialMatch(name, msvc_re);
}

fs::path default_compiler(platform p) {
  return p == platform::posix ? fs::path{"/usr/bin/c++"} : fs::path{"c++"};
}

strategy select_strategy(
    const std::optional<fs::path>& compiler, platform p) {
  if (p == platform::windows && !compiler) {
    LOG_DEBUG("windows, no compiler given: reading INCLUDE");
    return {strategy_kind::environment, {}};
  }

  auto resolved = compiler.value_or(default_compiler(p));

  if (p == platform::windows && is_msvc_like(resolved)) {
    LOG_DEBUG("{} looks like MSVC: reading INCLUDE instead", resolved);
    return {strategy_kind::environment, {}};
  }

  LOG_DEBUG("will ask {} for its search list", resolved);
  return {strategy_kind::subprocess, std::move(resolved)};
}

}  // namespace sysinc
