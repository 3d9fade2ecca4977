#include "sysinc/parser.hpp"

#include <re2/re2.h>

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include "sysinc/errors.hpp"
#include "sysinc/logger.hpp"
#include "utils.hpp"

namespace sysinc {

std::string strip_annotation(std::string_view line) {
  // Only the last parenthesized group (one level of nesting allowed), and
  // only at the very end: macOS "(framework directory)" goes,
  // "/opt/foo (x86)/include" stays.
  static const RE2 annotation_re(R"(\s*\((?:[^()]|\([^()]*\))*\)$)");

  std::string res{utils::trim(line)};
  RE2::Replace(&res, annotation_re, "");
  return std::string{utils::trim(res)};
}

std::string normalize_separators(std::string_view path) {
  std::string res{path};
  std::replace(res.begin(), res.end(), '\\', '/');
  return res;
}

std::vector<std::string> parse_include_dirs(std::string_view diagnostics) {
  enum class state { outside, inside } st{state::outside};
  std::vector<std::string> dirs;
  size_t linum{0};

  for (auto rest = diagnostics; !rest.empty();) {
    auto nl = rest.find('\n');
    auto line = utils::trim(rest.substr(0, nl));
    rest = nl == std::string_view::npos ? std::string_view{}
                                        : rest.substr(nl + 1);
    ++linum;

    if (line.find(search_start_marker) != std::string_view::npos) {
      LOG_TRACE("line {}: search list starts", linum);
      st = state::inside;
      continue;
    }
    if (st == state::outside) continue;

    if (line.find(search_end_marker) != std::string_view::npos) {
      LOG_TRACE("line {}: search list ends", linum);
      break;
    }
    if (line.empty()) continue;

    auto path = normalize_separators(strip_annotation(line));
    if (path.empty()) {
      LOG_DEBUG("line {}: nothing left of '{}'", linum, line);
      continue;
    }
    LOG_TRACE("line {}: '{}'", linum, path);
    dirs.push_back(std::move(path));
  }

  if (dirs.empty()) {
    LOG_DEBUG(
        "{} lines scanned, start marker {}", linum,
        st == state::inside ? "seen" : "never seen");
    throw no_include_directories_found{std::string{diagnostics}};
  }
  return dirs;
}

}  // namespace sysinc
