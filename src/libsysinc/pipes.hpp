#pragma once

#include <fmt/format.h>

#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>
#include <filesystem>
#include <string_view>

#include "sysinc/errors.hpp"

namespace sysinc::pipes {

// A pipe is fully drained only when the read stopped at EOF.  Anything else
// means the captured text is partial and must not be parsed.
inline void check_drained(
    const std::filesystem::path& program, std::string_view stream,
    const boost::system::error_code& ec) {
  if (!ec || ec == boost::asio::error::eof) return;
  throw compiler_launch_failed{
    program, fmt::format("reading {}: {}", stream, ec.message())};
}

}  // namespace sysinc::pipes
