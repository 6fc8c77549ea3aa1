#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/model/scheduled_task.hpp"
#include "internal/sensor/metric_channel.hpp"

namespace jobprobe::correlation {
class LogCorrelator;
}

namespace jobprobe::sensor {

enum class SensorKind : std::uint8_t {
  kGeneric,
  kScheduledJobWithLog,
};

inline constexpr std::string_view kHoursSinceLastRunChannel = "Hours Since Last Run";
inline constexpr std::string_view kLastTaskResultChannel    = "Last Task Result";
inline constexpr std::string_view kTaskEnabledChannel       = "Task Enabled";
inline constexpr std::string_view kLastJobResultChannel     = "Last Job Result";

constexpr std::size_t ChannelCapacity(SensorKind kind) {
  return kind == SensorKind::kScheduledJobWithLog ? 4 : 3;
}

// Channel names reserved by a kind, in slot order.
std::vector<std::string_view> ChannelTemplate(SensorKind kind);

std::optional<SensorKind> ParseSensorKind(std::string_view value);
std::string_view          ToString(SensorKind kind);

/*
  Sensor

  Fixed set of result channels for one scheduled task. Slots are filled once
  each, in order; re-adding a name returns the existing channel.

  MergeTaskAndLogData() populates the template channels from the scheduler
  metadata and, for kScheduledJobWithLog, from the attached correlator.
*/
class Sensor {
 public:
  Sensor(std::string name, SensorKind kind);
  ~Sensor();

  Sensor(const Sensor&)            = delete;
  Sensor& operator=(const Sensor&) = delete;

  const std::string& Name() const {
    return name_;
  }

  SensorKind Kind() const {
    return kind_;
  }

  // Throws ResourceExhausted once every slot is taken.
  MetricChannel& AddChannel(const std::string& name);

  MetricChannel*       FindChannel(std::string_view name);
  const MetricChannel* FindChannel(std::string_view name) const;

  std::size_t PopulatedChannelCount() const {
    return filled_;
  }

  void AttachCorrelator(std::unique_ptr<correlation::LogCorrelator> correlator);

  correlation::LogCorrelator* Correlator() {
    return correlator_.get();
  }

  void MergeTaskAndLogData(const model::ScheduledTaskMetadata& task, std::chrono::system_clock::time_point now);

  // Attribute overrides keyed by channel name. Channels outside this kind's
  // template are rejected; template channels not added yet are added.
  void ApplyChannelOverrides(const std::map<std::string, std::map<std::string, std::string>>& overrides);

  std::string RenderPrtgXml();

 private:
  void        ApplyTemplateDefaults(MetricChannel& channel) const;
  bool        ReportsSuccess() const;
  std::string SummaryText();

  std::string name_;
  SensorKind  kind_;

  std::vector<std::optional<MetricChannel>>    slots_;
  std::unordered_map<std::string, std::size_t> index_;
  std::size_t                                  filled_ = 0;

  std::unique_ptr<correlation::LogCorrelator> correlator_;
  std::optional<model::ScheduledTaskMetadata> task_;
};

} // namespace jobprobe::sensor
