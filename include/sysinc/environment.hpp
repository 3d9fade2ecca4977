#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sysinc {

inline constexpr std::string_view include_var = "INCLUDE";

using env_lookup =
    std::function<std::optional<std::string>(const std::string& name)>;

std::optional<std::string> process_env(const std::string& name);

std::vector<std::string> split_include_var(std::string_view value);

// Reads INCLUDE through `lookup`.  Throws environment_variable_missing when
// unset.  A value made only of separators yields an empty vector.
std::vector<std::string> read_include_env(
    const env_lookup& lookup = process_env);

}  // namespace sysinc
