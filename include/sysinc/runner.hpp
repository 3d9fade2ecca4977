#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace sysinc {

namespace fs = std::filesystem;

struct run_result {
  std::string out;
  std::string err;
  int exit_code{};
};

/**
 * @brief Launches a program and collects everything it writes.
 *
 * Implementations block until the child exits and both of its output
 * streams reach EOF.  A non-zero exit code is not an error.  Failure to
 * start the program at all is reported by throwing compiler_launch_failed.
 */
class process_runner {
 public:
  process_runner() = default;
  process_runner(const process_runner&) = delete;
  process_runner& operator=(const process_runner&) = delete;
  virtual ~process_runner() = default;

  virtual run_result run(
      const fs::path& program, const std::vector<std::string>& args) = 0;
};

/// Boost.Process v2 implementation.  stdin is the null device.
class boost_process_runner : public process_runner {
 public:
  run_result run(
      const fs::path& program, const std::vector<std::string>& args) override;
};

}  // namespace sysinc
