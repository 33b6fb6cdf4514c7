#include "bsld/utils/stage_timer.hpp"

#include <chrono>
#include <memory>
#include <sstream>
#include <string>

#include <catch2/catch_all.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using bsld::utils::StageTimer;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using std::chrono::milliseconds;

TEST_CASE("StageTimer formats durations", "[stage_timer]") {
  CHECK(StageTimer::FormatDuration(milliseconds(0)) == "0ms");
  CHECK(StageTimer::FormatDuration(milliseconds(999)) == "999ms");
  CHECK(StageTimer::FormatDuration(milliseconds(1000)) == "1.0s");
  CHECK(StageTimer::FormatDuration(milliseconds(1500)) == "1.5s");
  CHECK(StageTimer::FormatDuration(milliseconds(61000)) == "61.0s");
}

TEST_CASE("StageTimer records stages in order", "[stage_timer]") {
  StageTimer timer("Workspace indexing", nullptr);
  CHECK(timer.GetStages().empty());
  CHECK_THAT(timer.Summary(), StartsWith("Workspace indexing completed in "));
  CHECK_FALSE(timer.Summary().ends_with(")"));

  timer.Mark("discovery");
  timer.Mark("analysis");

  const auto& stages = timer.GetStages();
  REQUIRE(stages.size() == 2);
  CHECK(stages[0].first == "discovery");
  CHECK(stages[1].first == "analysis");
  CHECK(stages[0].second + stages[1].second <= timer.GetElapsed());

  auto summary = timer.Summary();
  CHECK_THAT(summary, ContainsSubstring("(discovery "));
  CHECK_THAT(summary, ContainsSubstring(", analysis "));
  CHECK(summary.ends_with(")"));
}

TEST_CASE("StageTimer logs its summary when destroyed", "[stage_timer]") {
  std::ostringstream output;
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(output);
  auto logger = std::make_shared<spdlog::logger>("stage_timer", sink);
  logger->set_pattern("%v");
  logger->set_level(spdlog::level::info);

  {
    StageTimer timer("Reindex", logger);
    timer.Mark("scan");
  }
  logger->flush();

  auto logged = output.str();
  CHECK_THAT(logged, StartsWith("Reindex completed in "));
  CHECK_THAT(logged, ContainsSubstring("(scan "));
}
