#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "sysinc/environment.hpp"
#include "sysinc/errors.hpp"
#include "sysinc/parser.hpp"
#include "sysinc/platform.hpp"
#include "sysinc/runner.hpp"
#include "sysinc/strategy.hpp"

namespace sysinc {

namespace fs = std::filesystem;

std::vector<std::string> run_strategy(
    const strategy& s, process_runner& runner,
    const env_lookup& lookup = process_env);

std::vector<std::string> get_include_dirs(
    const std::optional<fs::path>& compiler, platform p,
    process_runner& runner, const env_lookup& lookup = process_env);

}  // namespace sysinc
