#include "bsld/utils/stage_timer.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace bsld::utils {

namespace {

auto ToMilliseconds(StageTimer::Clock::duration duration)
    -> std::chrono::milliseconds {
  return std::chrono::duration_cast<std::chrono::milliseconds>(duration);
}

}  // namespace

StageTimer::StageTimer(
    std::string operation_name, std::shared_ptr<spdlog::logger> logger)
    : start_(Clock::now()),
      last_mark_(start_),
      operation_name_(std::move(operation_name)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

StageTimer::~StageTimer() {
  logger_->info("{}", Summary());
}

auto StageTimer::Mark(std::string stage_name) -> void {
  auto now = Clock::now();
  stages_.emplace_back(std::move(stage_name), ToMilliseconds(now - last_mark_));
  last_mark_ = now;
  logger_->debug(
      "{}: {} done ({})", operation_name_, stages_.back().first,
      FormatDuration(stages_.back().second));
}

auto StageTimer::GetElapsed() const -> std::chrono::milliseconds {
  return ToMilliseconds(Clock::now() - start_);
}

auto StageTimer::Summary() const -> std::string {
  auto summary = fmt::format(
      "{} completed in {}", operation_name_, FormatDuration(GetElapsed()));
  if (stages_.empty()) {
    return summary;
  }

  std::vector<std::string> parts;
  parts.reserve(stages_.size());
  for (const auto& [name, duration] : stages_) {
    parts.push_back(fmt::format("{} {}", name, FormatDuration(duration)));
  }
  return fmt::format("{} ({})", summary, fmt::join(parts, ", "));
}

auto StageTimer::FormatDuration(std::chrono::milliseconds duration)
    -> std::string {
  auto count = duration.count();
  if (count >= 1000) {
    return fmt::format("{:.1f}s", static_cast<double>(count) / 1000.0);
  }
  return fmt::format("{}ms", count);
}

}  // namespace bsld::utils
