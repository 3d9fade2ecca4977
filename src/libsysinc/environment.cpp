#include "sysinc/environment.hpp"

#include <cstdlib>
#include <string>

#include "sysinc/errors.hpp"
#include "sysinc/logger.hpp"
#include "sysinc/parser.hpp"

namespace sysinc {

std::optional<std::string> process_env(const std::string& name) {
  const char* v = std::getenv(name.c_str());  // NOLINT(concurrency-mt-unsafe)
  if (!v) return std::nullopt;
  return std::string{v};
}

std::vector<std::string> split_include_var(std::string_view value) {
  std::vector<std::string> dirs;
  for (auto rest = value;;) {
    auto semi = rest.find(';');
    auto piece = rest.substr(0, semi);
    if (!piece.empty()) dirs.push_back(normalize_separators(piece));
    if (semi == std::string_view::npos) break;
    rest = rest.substr(semi + 1);
  }
  return dirs;
}

std::vector<std::string> read_include_env(const env_lookup& lookup) {
  std::string name{include_var};
  auto value = lookup(name);
  if (!value) throw environment_variable_missing{name};

  LOG_DEBUG("{}={}", name, *value);
  auto dirs = split_include_var(*value);
  if (dirs.empty()) LOG_WARN("{} is set but lists no directories", name);
  return dirs;
}

}  // namespace sysinc
