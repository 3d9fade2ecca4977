#pragma once

#include <filesystem>
#include <optional>
#include <span>

#include "sysinc/platform.hpp"

namespace fs = std::filesystem;

namespace sysinc {

struct cli_options {
  std::optional<fs::path> compiler{};
  std::optional<platform> platform_override{};
  bool json_output{};
};

// Returns an exit code when the program should stop right away (--help,
// bad command line), std::nullopt otherwise.
std::optional<int> parse_options(
    std::span<char*> args, int& loglevel, cli_options& opts);

}  // namespace sysinc
