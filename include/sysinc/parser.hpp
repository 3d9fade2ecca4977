#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sysinc {

inline constexpr std::string_view search_start_marker =
    "#include <...> search starts here:";
inline constexpr std::string_view search_end_marker = "End of search list.";

std::string strip_annotation(std::string_view line);

std::string normalize_separators(std::string_view path);

/** @brief Extract the `#include <...>` search list from `-v` output.
 *
 * Only lines between search_start_marker and search_end_marker count.
 * Trailing annotations such as "(framework directory)" are dropped and
 * backslashes become forward slashes.  Order and duplicates are kept.
 * Throws no_include_directories_found if nothing was collected.
 */
std::vector<std::string> parse_include_dirs(std::string_view diagnostics);

}  // namespace sysinc
