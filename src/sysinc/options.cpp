#include "options.hpp"

#include <fmt/format.h>

#include <boost/program_options.hpp>
#include <iostream>
#include <string>

#include "sysinc/logger.hpp"

namespace sysinc {

std::optional<int> parse_options(
    std::span<char*> args, int& loglevel, cli_options& opts) {
  namespace po = boost::program_options;
  std::string compiler{};
  std::string platform_name{};

  // clang-format off
  po::options_description desc("Extract system include directories from C++ compiler");
  desc.add_options()
    ("help,h", "show this help")
    ("compiler,c",
        po::value(&compiler),
        "Path to the C++ compiler to query")
    ("platform",
        po::value(&platform_name),
        "Pretend to run on ARG (posix, windows or other)")
    ("json",
        po::bool_switch(&opts.json_output)->default_value(false),
        "Output results in JSON format")
    ("debug,d", po::value<int>(&loglevel)->default_value(
        static_cast<int>(sysinc::logger::level::warning)
        ),
        "Debug log level (default 2==WARNING)")
    ;
  // clang-format on

  po::variables_map vm;
  try {
    po::store(
        po::command_line_parser{static_cast<int>(args.size()), args.data()}
            .options(desc)
            .run(),
        vm);
    po::notify(vm);
  } catch (const po::error& e) {
    fmt::print(stderr, "Error: {}\n", e.what());
    return 1;
  }

  if (vm.count("help")) {
    desc.print(std::cout);
    return 0;
  }

  if (vm.count("compiler")) opts.compiler = fs::path{compiler};

  if (vm.count("platform")) {
    opts.platform_override = platform_from_string(platform_name);
    if (!opts.platform_override) {
      fmt::print(stderr, "Error: unknown platform '{}'\n", platform_name);
      return 1;
    }
  }
  return std::nullopt;
}

}  // namespace sysinc
