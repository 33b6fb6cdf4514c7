#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace bsld::utils {

// Times a multi-stage operation such as workspace indexing. Each Mark() closes
// the stage that started at the previous mark. The destructor logs Summary()
// at info level.
class StageTimer {
 public:
  using Clock = std::chrono::steady_clock;
  using Stage = std::pair<std::string, std::chrono::milliseconds>;

  StageTimer(const StageTimer&) = delete;
  StageTimer(StageTimer&&) = delete;
  auto operator=(const StageTimer&) -> StageTimer& = delete;
  auto operator=(StageTimer&&) -> StageTimer& = delete;
  StageTimer(
      std::string operation_name, std::shared_ptr<spdlog::logger> logger);
  ~StageTimer();

  auto Mark(std::string stage_name) -> void;

  [[nodiscard]] auto GetElapsed() const -> std::chrono::milliseconds;

  [[nodiscard]] auto GetStages() const -> const std::vector<Stage>& {
    return stages_;
  }

  // "Workspace indexing completed in 1.2s (discovery 15ms, analysis 1.1s)"
  [[nodiscard]] auto Summary() const -> std::string;

  // "123ms" below one second, "1.2s" above
  static auto FormatDuration(std::chrono::milliseconds duration) -> std::string;

 private:
  Clock::time_point start_;
  Clock::time_point last_mark_;
  std::string operation_name_;
  std::vector<Stage> stages_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace bsld::utils
