#include "sysinc/sysinc.hpp"

#include <fmt/std.h>

#include "sysinc/logger.hpp"
#include "utils.hpp"

namespace sysinc {

namespace {

// -v prints the search list, -E stops after preprocessing, -x c++ picks the
// C++ list and "-" reads an (empty) translation unit from stdin.
const std::vector<std::string> verbose_args{"-v", "-E", "-x", "c++", "-"};

}  // namespace

std::vector<std::string> run_strategy(
    const strategy& s, process_runner& runner, const env_lookup& lookup) {
  if (s.kind == strategy_kind::environment) return read_include_env(lookup);

  auto result = runner.run(s.compiler, verbose_args);
  // gcc-like compilers write -v output to stderr, and may well exit non-zero
  // for lack of a real translation unit.
  if (result.exit_code != 0)
    LOG_INFO(
        "{} exited with {}, parsing its output anyway", s.compiler,
        result.exit_code);

  try {
    return parse_include_dirs(utils::to_utf8_lossy(result.err));
  } catch (const no_include_directories_found& e) {
    LOG_DEBUG("{} said:\n{}", s.compiler, e.dribble);
    throw;
  }
}

std::vector<std::string> get_include_dirs(
    const std::optional<fs::path>& compiler, platform p,
    process_runner& runner, const env_lookup& lookup) {
  return run_strategy(select_strategy(compiler, p), runner, lookup);
}

}  // namespace sysinc
