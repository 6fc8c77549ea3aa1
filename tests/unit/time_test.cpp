#include "internal/util/time.hpp"

#include <cassert>
#include <iostream>

namespace {

using namespace std::chrono_literals;
using jobprobe::util::Clock;
using jobprobe::util::FormatElapsedHours;
using jobprobe::util::FormatIso8601;

const auto kRunTime = Clock::from_time_t(1705314600); // 2024-01-15T10:30:00Z

void TestIso8601() {
  assert(FormatIso8601(kRunTime) == "2024-01-15T10:30:00Z");
  assert(FormatIso8601(kRunTime + 59s + 999ms) == "2024-01-15T10:30:59Z");
}

void TestElapsedHoursBelowOneHour() {
  assert(FormatElapsedHours(kRunTime, kRunTime) == "0.00");
  assert(FormatElapsedHours(kRunTime, kRunTime + 30min) == "0.50");
  assert(FormatElapsedHours(kRunTime, kRunTime + 45min) == "0.75");
}

void TestElapsedHoursRoundsToWholeHours() {
  assert(FormatElapsedHours(kRunTime, kRunTime + 1h) == "1");
  assert(FormatElapsedHours(kRunTime, kRunTime + 2h + 29min) == "2");
  assert(FormatElapsedHours(kRunTime, kRunTime + 2h + 31min) == "3");
  assert(FormatElapsedHours(kRunTime, kRunTime + 72h) == "72");
}

void TestElapsedHoursJustBelowOneHour() {
  assert(FormatElapsedHours(kRunTime, kRunTime + 3581s) == "0.99");
  assert(FormatElapsedHours(kRunTime, kRunTime + 3590s) == "1");
  assert(FormatElapsedHours(kRunTime, kRunTime + 3599s) == "1");
}

void TestElapsedHoursClampsClockSkew() {
  assert(FormatElapsedHours(kRunTime, kRunTime - 5min) == "0.00");
}

void TestProtoRoundTrip() {
  const auto ts = jobprobe::util::ToProto(kRunTime + 250ms);
  assert(ts.seconds() == 1705314600);
  assert(ts.nanos() == 250000000);
  assert(jobprobe::util::FromProto(ts) == kRunTime + 250ms);
}

} // namespace

int main() {
  TestIso8601();
  TestElapsedHoursBelowOneHour();
  TestElapsedHoursRoundsToWholeHours();
  TestElapsedHoursJustBelowOneHour();
  TestElapsedHoursClampsClockSkew();
  TestProtoRoundTrip();

  std::cout << "job_probe_unit_time: pass\n";
  return 0;
}
