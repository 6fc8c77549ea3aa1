#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace jobprobe::model {

inline constexpr std::int32_t kStartEventId = 200;
inline constexpr std::int32_t kEndEventId   = 201;

/*
  One entry of a job event log. Created once while parsing, never mutated.
*/
struct EventRecord {
  std::int64_t record_id = 0;
  std::int32_t event_id  = 0;
  std::string  source;
  std::string  correlation_id;
  std::string  timestamp;

  std::optional<std::int64_t> error_code;
  std::optional<std::string>  message;
  std::optional<std::string>  data_object;
};

}  // namespace jobprobe::model
