#include "probe_runner.hpp"

#include "internal/correlation/log_correlator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/sensor/prtg_document.hpp"
#include "internal/sensor/sensor.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace jobprobe::probe {

using jobprobe::observability::IntField;
using jobprobe::observability::StringField;

namespace {

std::string JoinLines(const std::vector<std::string>& lines) {
  std::string out;
  for (const auto& line : lines) {
    out.append(line).push_back('\n');
  }
  return out;
}

// Directory part of a local or UNC/Windows path.
std::string DirectoryOf(const std::string& path) {
  const auto pos = path.find_last_of("/\\");
  return pos == std::string::npos ? std::string() : path.substr(0, pos);
}

} // namespace

ProbeRunner::ProbeRunner(jobprobe::runtime::config::RuntimeConfig config, ProbeContext ctx) : config_(std::move(config)), ctx_(std::move(ctx)) {
}

RunOutcome ProbeRunner::Run(util::TimePoint now) {
  RunOutcome  outcome;
  std::string failure;
  try {
    outcome.document  = Collect(now);
    outcome.succeeded = true;
  } catch (const std::exception& e) {
    const auto category = ErrorCategory(e);
    JOBPROBE_LOG_ERROR("Probe run failed", {StringField("sensor", config_.sensor().name()), StringField("category", category),
                                            StringField("error", e.what())});
    failure = std::string(category) + ": " + e.what();
  }

  // Sessions are released before the error document is rendered, which may itself throw.
  CloseSessions();

  if (!outcome.succeeded) {
    outcome.document = sensor::RenderErrorDocument(failure);
  }
  return outcome;
}

std::string ProbeRunner::Collect(util::TimePoint now) {
  if (!ctx_.tasks || !ctx_.files) {
    throw util::InputValidationError("probe collaborators are not configured");
  }

  const auto kind = sensor::ParseSensorKind(config_.sensor().kind().empty() ? "generic" : config_.sensor().kind());
  if (!kind) {
    throw util::InputValidationError("unknown sensor kind '" + config_.sensor().kind() + "'");
  }

  const auto task = collector::ResolveSingleTask(*ctx_.tasks, config_.sensor().task_identity());
  JOBPROBE_LOG_INFO("Resolved scheduled task", {StringField("identity", task.identity), IntField("last_result_code", task.last_result_code)});

  sensor::Sensor sensor(config_.sensor().name(), *kind);
  if (*kind == sensor::SensorKind::kScheduledJobWithLog) {
    sensor.AttachCorrelator(CorrelateJobLog());
  }

  sensor.MergeTaskAndLogData(task, now);
  sensor.ApplyChannelOverrides(ChannelOverrides(config_));
  return sensor.RenderPrtgXml();
}

// ------------------------------------------------------------
// Event log correlation
// ------------------------------------------------------------

std::unique_ptr<correlation::LogCorrelator> ProbeRunner::CorrelateJobLog() {
  const auto& log_config   = config_.event_log();
  const auto& primary_path = log_config.primary_log_path();

  auto primary = ctx_.files->FetchFileLines(primary_path);
  if (!primary) {
    throw util::MandatoryEvidenceMissingError("primary event log " + primary_path + " not found");
  }

  auto correlator = std::make_unique<correlation::LogCorrelator>(log_config.job_namespace(), JoinLines(*primary));
  correlator->Evaluate();
  JOBPROBE_LOG_INFO("Correlated last run", {StringField("namespace", correlator->job_namespace()),
                                            StringField("correlation_id", correlator->last_correlation_id().value_or("")),
                                            StringField("verdict", model::ToString(correlator->verdict()))});

  if (!correlator->InnerExceptionRequired()) {
    return correlator;
  }

  const auto directory  = log_config.inner_exception_directory().empty() ? DirectoryOf(primary_path) : log_config.inner_exception_directory();
  const auto inner_path = util::JoinPath(directory, correlator->GetInnerExceptionLogFilename());

  auto inner = ctx_.files->FetchFileLines(inner_path);
  if (inner) {
    correlator->ImportInnerException(*inner);
    return correlator;
  }

  if (correlator->verdict() == model::Verdict::kPreliminaryFailure) {
    throw util::MandatoryEvidenceMissingError("last run of " + correlator->job_namespace() + " did not finish and inner exception log " + inner_path +
                                              " is missing");
  }

  JOBPROBE_LOG_INFO("No inner exception log, confirming success", {StringField("path", inner_path)});
  correlator->ConfirmLastRunResult();
  return correlator;
}

void ProbeRunner::CloseSessions() {
  for (const auto& session : ctx_.sessions) {
    if (!session) {
      continue;
    }
    try {
      session->Close();
    } catch (const std::exception& e) {
      JOBPROBE_LOG_WARN("Closing remote session failed", {StringField("error", e.what())});
    }
  }
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------

std::string_view ErrorCategory(const std::exception& e) {
  using namespace jobprobe::util;

  if (dynamic_cast<const InputValidationError*>(&e)) {
    return "InputValidationError";
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return "NotFound";
  }
  if (dynamic_cast<const MultipleMatchError*>(&e)) {
    return "MultipleMatchError";
  }
  if (dynamic_cast<const MandatoryEvidenceMissingError*>(&e)) {
    return "MandatoryEvidenceMissingError";
  }
  if (dynamic_cast<const MalformedLogError*>(&e)) {
    return "MalformedLogError";
  }
  if (dynamic_cast<const TransportError*>(&e)) {
    return "TransportError";
  }
  if (dynamic_cast<const PreconditionFailed*>(&e)) {
    return "PreconditionFailed";
  }
  if (dynamic_cast<const ResourceExhausted*>(&e)) {
    return "ResourceExhausted";
  }
  return "InternalError";
}

std::map<std::string, std::map<std::string, std::string>> ChannelOverrides(const jobprobe::runtime::config::RuntimeConfig& config) {
  std::map<std::string, std::map<std::string, std::string>> overrides;
  for (const auto& [channel, channel_config] : config.channels()) {
    auto& attributes = overrides[channel];
    for (const auto& [name, value] : channel_config.attributes()) {
      attributes.emplace(name, value);
    }
  }
  return overrides;
}

} // namespace jobprobe::probe
