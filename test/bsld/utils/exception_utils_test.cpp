#include "bsld/utils/exception_utils.hpp"

#include <exception>
#include <stdexcept>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using bsld::utils::DescribeException;

TEST_CASE(
    "DescribeException reports standard exceptions", "[exception_utils]") {
  auto error = std::make_exception_ptr(std::runtime_error("disk on fire"));
  CHECK(DescribeException(error) == "disk on fire");
}

TEST_CASE(
    "DescribeException reports exceptions of any type", "[exception_utils]") {
  CHECK(DescribeException(std::make_exception_ptr(42)) == "unknown error");

  struct NotAnException {};
  CHECK(
      DescribeException(std::make_exception_ptr(NotAnException{})) ==
      "unknown error");
}

TEST_CASE("DescribeException accepts an empty pointer", "[exception_utils]") {
  CHECK(DescribeException(nullptr) == "no error");
}
