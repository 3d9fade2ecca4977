#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace sysinc {

namespace fs = std::filesystem;

struct include_dirs_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct environment_variable_missing : include_dirs_error {
  explicit environment_variable_missing(std::string v)
      : include_dirs_error{v + " environment variable not set"},
        variable{std::move(v)} {}
  std::string variable;
};

struct compiler_launch_failed : include_dirs_error {
  compiler_launch_failed(fs::path c, std::string r)
      : include_dirs_error{"Failed to execute compiler: " + r},
        compiler{std::move(c)},
        reason{std::move(r)} {}
  fs::path compiler;
  std::string reason;
};

struct no_include_directories_found : include_dirs_error {
  explicit no_include_directories_found(std::string s)
      : include_dirs_error{"No include directories found in compiler output"},
        dribble{std::move(s)} {}
  std::string dribble;
};

}  // namespace sysinc
