#include <fmt/format.h>

#include <boost/json.hpp>
#include <exception>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <typeinfo>
#include <vector>

#include "../libsysinc/utils.hpp"
#include "options.hpp"
#include "sysinc/logger.hpp"
#include "sysinc/sysinc.hpp"

namespace json = boost::json;

json::object error_to_json(const std::exception& e) {
  json::object res;
  res["name"] = sysinc::utils::demangle_symbol(typeid(e).name());
  res["details"] = e.what();
  return res;
}

int main_nojson(
    const sysinc::cli_options& opts, sysinc::platform plat,
    sysinc::process_runner& runner) {
  try {
    auto dirs = sysinc::get_include_dirs(opts.compiler, plat, runner);
    for (auto&& d : dirs) std::cout << d << "\n";
    return 0;
  } catch (std::exception& e) {
    fmt::print(stderr, "Error: {}\n", e.what());
    return 1;
  }
}

int main_json(
    const sysinc::cli_options& opts, sysinc::platform plat,
    sysinc::process_runner& runner) {
  json::object json_result;
  int retval = 0;
  json_result["platform"] = sysinc::to_string(plat);

  try {
    auto s = sysinc::select_strategy(opts.compiler, plat);
    json_result["strategy"] = sysinc::to_string(s.kind);
    if (s.kind == sysinc::strategy_kind::subprocess)
      json_result["compiler"] = s.compiler.string();
    else
      json_result["compiler"] = nullptr;

    auto dirs = sysinc::run_strategy(s, runner);
    json_result["include_dirs"] = json::array(dirs.begin(), dirs.end());
  } catch (std::exception& e) {
    json_result["error"] = error_to_json(e);
    retval = 1;
  }
  std::cout << json::serialize(json_result) << "\n";
  return retval;
}

int main(int argc, char* argv[]) {
  sysinc::cli_options opts{};
  int loglevel{};

  auto done = sysinc::parse_options(std::span(argv, argc), loglevel, opts);
  if (done) return done.value();

  sysinc::logger::set_level(static_cast<sysinc::logger::level>(loglevel));
  LOG_DEBUG("loglevel={}", loglevel);

  auto plat = opts.platform_override.value_or(sysinc::host_platform());
  LOG_DEBUG(
      "platform={} compiler={}", sysinc::to_string(plat),
      opts.compiler ? opts.compiler->string() : "<default>");

  sysinc::boost_process_runner runner;
  if (!opts.json_output) return main_nojson(opts, plat, runner);
  return main_json(opts, plat, runner);
}
