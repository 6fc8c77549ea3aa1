#include "time.hpp"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace jobprobe::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

std::string FormatIso8601(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           utc{};
  gmtime_r(&t, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::string FormatElapsedHours(TimePoint since, TimePoint now) {
  const auto   elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - since);
  const double hours   = elapsed.count() > 0 ? static_cast<double>(elapsed.count()) / 3600.0 : 0.0;

  // Format follows the rounded value: 0.997 h reads "1", never "1.00".
  const double hundredths = std::round(hours * 100.0) / 100.0;

  std::ostringstream out;
  if (hundredths < 1.0) {
    out << std::fixed << std::setprecision(2) << hundredths;
  } else {
    out << static_cast<long long>(std::llround(hours));
  }
  return out.str();
}

} // namespace jobprobe::util
