#include "sensor.hpp"

#include <algorithm>
#include <sstream>

#include "internal/correlation/log_correlator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/sensor/prtg_document.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace jobprobe::sensor {

using jobprobe::observability::IntField;
using jobprobe::observability::StringField;

namespace {

constexpr std::string_view kEnabledLookup = "prtg.standardlookups.yesno.stateyesok";

} // namespace

std::vector<std::string_view> ChannelTemplate(SensorKind kind) {
  std::vector<std::string_view> names = {kHoursSinceLastRunChannel, kLastTaskResultChannel, kTaskEnabledChannel};
  if (kind == SensorKind::kScheduledJobWithLog) {
    names.push_back(kLastJobResultChannel);
  }
  return names;
}

std::optional<SensorKind> ParseSensorKind(std::string_view value) {
  if (value == "generic") {
    return SensorKind::kGeneric;
  }
  if (value == "scheduled_job_with_log") {
    return SensorKind::kScheduledJobWithLog;
  }
  return std::nullopt;
}

std::string_view ToString(SensorKind kind) {
  return kind == SensorKind::kScheduledJobWithLog ? "scheduled_job_with_log" : "generic";
}

Sensor::Sensor(std::string name, SensorKind kind) : name_(std::move(name)), kind_(kind), slots_(ChannelCapacity(kind)) {
  if (name_.empty()) {
    throw util::InputValidationError("sensor name is empty");
  }
  index_.reserve(slots_.size());
}

Sensor::~Sensor() = default;

// ------------------------------------------------------------
// Channels
// ------------------------------------------------------------

MetricChannel& Sensor::AddChannel(const std::string& name) {
  if (auto it = index_.find(name); it != index_.end()) {
    return *slots_[it->second];
  }
  if (filled_ == slots_.size()) {
    throw util::ResourceExhausted("sensor '" + name_ + "': all " + std::to_string(slots_.size()) + " channel slots are in use, cannot add '" + name + "'");
  }

  auto& slot = slots_[filled_];
  slot.emplace(name);
  index_.emplace(name, filled_);
  ++filled_;

  ApplyTemplateDefaults(*slot);
  return *slot;
}

MetricChannel* Sensor::FindChannel(std::string_view name) {
  auto it = index_.find(std::string(name));
  return it == index_.end() ? nullptr : &*slots_[it->second];
}

const MetricChannel* Sensor::FindChannel(std::string_view name) const {
  auto it = index_.find(std::string(name));
  return it == index_.end() ? nullptr : &*slots_[it->second];
}

void Sensor::ApplyTemplateDefaults(MetricChannel& channel) const {
  const auto& name = channel.Name();
  if (name == kHoursSinceLastRunChannel) {
    channel.SetAttribute(ChannelAttribute::kUnit, std::string(kCustomUnit));
    channel.SetAttribute(ChannelAttribute::kCustomUnit, "h");
    channel.SetAttribute(ChannelAttribute::kFloat, "1");
    channel.SetAttribute(ChannelAttribute::kDecimalMode, "Auto");
  } else if (name == kTaskEnabledChannel) {
    channel.SetLookup(std::string(kEnabledLookup));
  } else if (name == kLastJobResultChannel) {
    // Anything but 0 is an error once the verdict is final.
    channel.SetAttribute(ChannelAttribute::kLimitMode, "1");
    channel.SetAttribute(ChannelAttribute::kLimitMaxError, "0");
    channel.SetAttribute(ChannelAttribute::kLimitMinError, "0");
  }
}

void Sensor::ApplyChannelOverrides(const std::map<std::string, std::map<std::string, std::string>>& overrides) {
  const auto names = ChannelTemplate(kind_);
  for (const auto& [channel_name, attributes] : overrides) {
    if (std::find(names.begin(), names.end(), channel_name) == names.end()) {
      throw util::InputValidationError("sensor kind " + std::string(ToString(kind_)) + " has no channel '" + channel_name + "'");
    }
    AddChannel(channel_name).SetAttributes(attributes);
  }
}

// ------------------------------------------------------------
// Data merge
// ------------------------------------------------------------

void Sensor::AttachCorrelator(std::unique_ptr<correlation::LogCorrelator> correlator) {
  correlator_ = std::move(correlator);
}

void Sensor::MergeTaskAndLogData(const model::ScheduledTaskMetadata& task, std::chrono::system_clock::time_point now) {
  if (kind_ == SensorKind::kScheduledJobWithLog && !correlator_) {
    throw util::PreconditionFailed("sensor '" + name_ + "' needs an event log correlator before merging");
  }

  AddChannel(std::string(kHoursSinceLastRunChannel)).SetValue(util::FormatElapsedHours(task.last_run_time, now));
  AddChannel(std::string(kLastTaskResultChannel)).SetValue(std::to_string(task.last_result_code));
  AddChannel(std::string(kTaskEnabledChannel)).SetValue(model::IsEnabled(task.state) ? "1" : "0");

  if (kind_ == SensorKind::kScheduledJobWithLog) {
    const auto result = correlator_->GetLastRunResult();
    AddChannel(std::string(kLastJobResultChannel)).SetValue(std::to_string(result));
    JOBPROBE_LOG_INFO("Merged job result", {StringField("sensor", name_), IntField("last_job_result", result),
                                            StringField("verdict", model::ToString(correlator_->verdict()))});
  }

  task_ = task;
}

// ------------------------------------------------------------
// Rendering
// ------------------------------------------------------------

bool Sensor::ReportsSuccess() const {
  if (kind_ == SensorKind::kGeneric) {
    return true;
  }
  return correlator_ && correlator_->verdict() == model::Verdict::kConfirmedSuccess;
}

std::string Sensor::SummaryText() {
  const std::string task_name = task_ && !task_->display_name.empty() ? task_->display_name : name_;

  std::ostringstream out;
  if (ReportsSuccess()) {
    out << "Task '" << task_name << "'";
    if (task_) {
      out << " last ran " << util::FormatIso8601(task_->last_run_time) << " with result " << task_->last_result_code << "; next run "
          << (task_->next_run_time ? util::FormatIso8601(*task_->next_run_time) : std::string("not scheduled"));
    } else {
      out << " is healthy";
    }
    return out.str();
  }

  out << "Task '" << task_name << "' failed";
  if (!correlator_) {
    return out.str();
  }

  out << " with code " << correlator_->GetLastRunResult();

  const auto& message     = correlator_->inner_exception_message();
  const auto& stack_trace = correlator_->inner_exception_stack_trace();
  if (message || stack_trace) {
    out << ": ";
    if (message) {
      out << *message;
    }
    if (message && stack_trace) {
      out << " -- ";
    }
    if (stack_trace) {
      out << *stack_trace;
    }
  }
  if (const auto& filename = correlator_->inner_exception_filename()) {
    out << " (inner exception log " << *filename << ")";
  }
  return out.str();
}

std::string Sensor::RenderPrtgXml() {
  if (filled_ == 0) {
    return RenderOkDocument();
  }

  PrtgDocumentWriter writer;
  for (const auto& slot : slots_) {
    if (slot) {
      writer.WriteChannel(*slot);
    }
  }
  writer.WriteText(SummaryText());
  return writer.Finish();
}

} // namespace jobprobe::sensor
