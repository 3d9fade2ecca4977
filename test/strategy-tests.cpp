#include <doctest/doctest.h>

#include <filesystem>
#include <optional>

#include "sysinc/strategy.hpp"

namespace fs = std::filesystem;
using sysinc::platform;
using sysinc::strategy_kind;

TEST_CASE("strategy-posix-default") {
  auto s = sysinc::select_strategy(std::nullopt, platform::posix);
  CHECK(s.kind == strategy_kind::subprocess);
  CHECK(s.compiler == fs::path{"/usr/bin/c++"});
}

TEST_CASE("strategy-other-default") {
  auto s = sysinc::select_strategy(std::nullopt, platform::other);
  CHECK(s.kind == strategy_kind::subprocess);
  CHECK(s.compiler == fs::path{"c++"});
}

TEST_CASE("strategy-windows-default-reads-environment") {
  auto s = sysinc::select_strategy(std::nullopt, platform::windows);
  CHECK(s.kind == strategy_kind::environment);
  CHECK(s.compiler.empty());
}

TEST_CASE("strategy-explicit-compiler") {
  for (auto p : {platform::posix, platform::windows, platform::other}) {
    CAPTURE(sysinc::to_string(p));
    auto s = sysinc::select_strategy(fs::path{"/opt/gcc/bin/g++"}, p);
    CHECK(s.kind == strategy_kind::subprocess);
    CHECK(s.compiler == fs::path{"/opt/gcc/bin/g++"});
  }
}

TEST_CASE("strategy-msvc-on-windows-reads-environment") {
  for (const char* c : {"cl", "cl.exe", "clang-cl", "clang-cl.exe"}) {
    CAPTURE(c);
    auto s = sysinc::select_strategy(fs::path{c}, platform::windows);
    CHECK(s.kind == strategy_kind::environment);
  }
}

TEST_CASE("strategy-msvc-elsewhere-is-a-subprocess") {
  auto s = sysinc::select_strategy(fs::path{"clang-cl"}, platform::posix);
  CHECK(s.kind == strategy_kind::subprocess);
  CHECK(s.compiler == fs::path{"clang-cl"});
}

TEST_CASE("msvc-pattern") {
  CHECK(sysinc::is_msvc_like("cl"));
  CHECK(sysinc::is_msvc_like("cl.exe"));
  CHECK(sysinc::is_msvc_like("clang-cl.exe"));
  CHECK(sysinc::is_msvc_like(fs::path{"bin"} / "cl.exe"));

  CHECK_FALSE(sysinc::is_msvc_like("CL.EXE"));
  CHECK_FALSE(sysinc::is_msvc_like("clang"));
  CHECK_FALSE(sysinc::is_msvc_like("g++"));
  CHECK_FALSE(sysinc::is_msvc_like("cl.exe.bak"));
  CHECK_FALSE(sysinc::is_msvc_like(fs::path{"cl"} / "g++"));
}

TEST_CASE("platform-names") {
  for (auto p : {platform::posix, platform::windows, platform::other})
    CHECK(sysinc::platform_from_string(sysinc::to_string(p)) == p);
  CHECK_FALSE(sysinc::platform_from_string("beos").has_value());
}
