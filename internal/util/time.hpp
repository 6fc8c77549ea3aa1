#pragma once

#include <chrono>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace jobprobe::util {

/*
  Wall-clock helpers. The probe reads the clock once per run and passes the
  time point down, so tests can pin it.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// UTC, second precision: 2024-01-15T10:30:00Z
std::string FormatIso8601(TimePoint tp);

// Elapsed hours for the "Hours Since Last Run" channel: two decimals below one
// hour, whole hours from one hour on. Negative spans clamp to zero.
std::string FormatElapsedHours(TimePoint since, TimePoint now);

} // namespace jobprobe::util
