#include "sysinc/runner.hpp"

#include <fmt/std.h>

#define BOOST_PROCESS_USE_STD_FS 1

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/stdio.hpp>
#include <boost/system/system_error.hpp>
#include <filesystem>
#include <string>
#include <vector>

#include "pipes.hpp"
#include "sysinc/errors.hpp"
#include "sysinc/logger.hpp"

namespace sysinc {

namespace p2 = boost::process::v2;
namespace asio = boost::asio;

namespace {

std::string args_to_string(
    std::string res, const std::vector<std::string>& args) {
  for (const auto& a : args) {
    res += " ";
    res += a;
  }
  return res;
}

// Bare names like "c++" go through PATH, anything with a directory part is
// taken as is.
fs::path resolve_program(const fs::path& program) {
  if (program.has_parent_path()) return program;

  auto found = p2::environment::find_executable(program);
  if (found.empty())
    throw compiler_launch_failed{
      program, fmt::format("{} not found in PATH", program.string())};
  LOG_DEBUG("{} resolved to {}", program, found);
  return found;
}

}  // namespace

run_result boost_process_runner::run(
    const fs::path& program, const std::vector<std::string>& args) {
  auto exe = resolve_program(program);
  LOG_INFO("Running {}", args_to_string(exe.string(), args));

  asio::io_context ctx;
  asio::readable_pipe rp_out{ctx};
  asio::readable_pipe rp_err{ctx};
  run_result res{};

  auto proc = [&] {
    try {
      return p2::process{
        ctx, exe, args,
        p2::process_stdio{.in = nullptr, .out = rp_out, .err = rp_err}};
    } catch (const boost::system::system_error& e) {
      throw compiler_launch_failed{program, e.code().message()};
    }
  }();

  // Drain both pipes together, a chatty stdout must not stall stderr.
  boost::system::error_code ec_out, ec_err;
  asio::async_read(
      rp_out, asio::dynamic_buffer(res.out),
      [&](const boost::system::error_code& ec, std::size_t) { ec_out = ec; });
  asio::async_read(
      rp_err, asio::dynamic_buffer(res.err),
      [&](const boost::system::error_code& ec, std::size_t) { ec_err = ec; });
  ctx.run();

  res.exit_code = proc.wait();
  LOG_DEBUG(
      "{} exited with {} ({} bytes stdout, {} bytes stderr)", exe,
      res.exit_code, res.out.size(), res.err.size());

  pipes::check_drained(program, "stdout", ec_out);
  pipes::check_drained(program, "stderr", ec_err);
  return res;
}

}  // namespace sysinc
