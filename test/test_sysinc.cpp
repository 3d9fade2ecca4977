#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "sysinc/errors.hpp"
#include "sysinc/parser.hpp"
#include "test_config.h"

namespace fs = std::filesystem;

struct TestFixture {
  fs::path fixture_dir{TEST_FIXTURE_DIR};

  // Captured `-v -E -x c++ -` stderr
  std::string load_capture(const std::string& name) {
    std::ifstream file(fixture_dir / name, std::ios::binary);
    REQUIRE(file.is_open());
    return std::string{
      std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>()};
  }

  void test_capture_against_expectation(
      const std::string& name, const std::vector<std::string>& expected) {
    auto dirs = sysinc::parse_include_dirs(load_capture(name));
    REQUIRE(dirs.size() == expected.size());
    for (size_t i = 0; i < dirs.size(); ++i) CHECK(dirs[i] == expected[i]);
  }
};

TestFixture fixture;

TEST_CASE("capture-gcc-linux") {
  fixture.test_capture_against_expectation(
      "gcc-linux.txt",
      {"/usr/include/c++/11", "/usr/include/x86_64-linux-gnu/c++/11",
       "/usr/include/c++/11/backward",
       "/usr/lib/gcc/x86_64-linux-gnu/11/include", "/usr/local/include",
       "/usr/include/x86_64-linux-gnu", "/usr/include"});
}

TEST_CASE("capture-clang-macos-framework-directory") {
  fixture.test_capture_against_expectation(
      "clang-macos.txt",
      {"/Library/Developer/CommandLineTools/SDKs/MacOSX.sdk/usr/include/c++/v1",
       "/Library/Developer/CommandLineTools/usr/lib/clang/15.0.0/include",
       "/Library/Developer/CommandLineTools/SDKs/MacOSX.sdk/usr/include",
       "/Library/Developer/CommandLineTools/usr/include",
       "/Library/Developer/CommandLineTools/SDKs/MacOSX.sdk/System/Library/"
       "Frameworks"});
}

TEST_CASE("capture-mingw-crlf-backslashes") {
  fixture.test_capture_against_expectation(
      "mingw-windows.txt",
      {"C:/msys64/mingw64/include/c++/13.2.0",
       "C:/msys64/mingw64/include/c++/13.2.0/x86_64-w64-mingw32",
       "C:/msys64/mingw64/lib/gcc/x86_64-w64-mingw32/13.2.0/include",
       "C:/msys64/mingw64/include"});
}

TEST_CASE("capture-without-banner") {
  auto text = fixture.load_capture("no-banner.txt");
  CHECK_THROWS_AS(
      sysinc::parse_include_dirs(text), sysinc::no_include_directories_found);
}
