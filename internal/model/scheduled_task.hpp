#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace jobprobe::model {

enum class TaskState : std::uint8_t {
  kUnknown  = 0,
  kDisabled = 1,
  kQueued   = 2,
  kReady    = 3,
  kRunning  = 4,
};

struct ScheduledTaskMetadata {
  std::string identity;
  std::string display_name;

  std::chrono::system_clock::time_point                last_run_time{};
  std::optional<std::chrono::system_clock::time_point> next_run_time;

  std::int64_t last_result_code = 0;
  TaskState    state            = TaskState::kUnknown;
};

constexpr bool IsEnabled(TaskState state) {
  return state != TaskState::kDisabled;
}

}  // namespace jobprobe::model
