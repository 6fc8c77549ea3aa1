#include "log_correlator.hpp"

#include <algorithm>

#include "internal/correlation/exception_importer.hpp"
#include "internal/eventlog/event_log_parser.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace jobprobe::correlation {

using jobprobe::model::EventRecord;
using jobprobe::model::Verdict;
using jobprobe::observability::IntField;
using jobprobe::observability::StringField;

namespace {

constexpr std::size_t      kTimestampTokenLength = 12;
constexpr std::string_view kStackTraceSeparator  = " -- ";

std::optional<std::string> JoinPresent(const std::optional<std::string>& first, const std::optional<std::string>& second) {
  if (first && second) {
    return *first + std::string(kStackTraceSeparator) + *second;
  }
  if (first) {
    return first;
  }
  return second;
}

} // namespace

LogCorrelator::LogCorrelator(std::string job_namespace, std::string_view primary_log) : namespace_(std::move(job_namespace)) {
  if (util::TrimView(namespace_).empty()) {
    throw util::InputValidationError("job namespace is empty");
  }
  if (util::TrimView(primary_log).empty()) {
    throw util::InputValidationError("primary event log is empty");
  }

  const auto dot = namespace_.rfind('.');
  if (dot == std::string::npos) {
    leaf_ = namespace_;
  } else {
    parent_ = namespace_.substr(0, dot);
    leaf_   = namespace_.substr(dot + 1);
  }
  if (leaf_.empty()) {
    throw util::InputValidationError("job namespace '" + namespace_ + "' has an empty last segment");
  }

  primary_events_ = eventlog::ParseEventLog(primary_log);
}

// ------------------------------------------------------------
// Evaluation
// ------------------------------------------------------------

const EventRecord& LogCorrelator::LatestStartEvent() const {
  const EventRecord* latest = nullptr;
  for (const auto& record : primary_events_) {
    if (record.event_id != model::kStartEventId || record.source != leaf_) {
      continue;
    }
    if (latest == nullptr || record.record_id > latest->record_id) {
      latest = &record;
    }
  }
  if (latest == nullptr) {
    throw util::PreconditionFailed("no start event from source '" + leaf_ + "' to correlate");
  }
  return *latest;
}

bool LogCorrelator::HasEndEvent(const std::string& correlation_id) const {
  return std::any_of(primary_events_.begin(), primary_events_.end(), [&](const EventRecord& record) {
    return record.event_id == model::kEndEventId && record.correlation_id == correlation_id;
  });
}

void LogCorrelator::Evaluate() {
  if (model::IsTerminal(verdict_)) {
    return;
  }

  if (!last_correlation_id_) {
    last_correlation_id_ = LatestStartEvent().correlation_id;
  }

  const bool end_event_found = HasEndEvent(*last_correlation_id_);
  const auto next            = model::NextVerdict(verdict_, end_event_found, secondary_events_.has_value());
  if (next == verdict_) {
    return;
  }

  if (next == Verdict::kFailure) {
    InferFailure();
  }

  JOBPROBE_LOG_DEBUG("Run verdict changed", {StringField("namespace", namespace_), StringField("correlation_id", *last_correlation_id_),
                                             StringField("from", model::ToString(verdict_)), StringField("to", model::ToString(next))});
  verdict_ = next;
}

void LogCorrelator::InferFailure() {
  auto ordered = *secondary_events_;
  std::sort(ordered.begin(), ordered.end(), [](const EventRecord& a, const EventRecord& b) { return a.record_id > b.record_id; });

  if (ordered.empty()) {
    throw util::MalformedLogError("inner exception log contains no Event records");
  }

  // The newest record is the outer wrapper; the one before it carries the cause.
  const EventRecord& cause = ordered.size() == 1 ? ordered[0] : ordered[1];
  inferred_code_           = cause.error_code;
  inferred_message_        = cause.message;
  if (ordered.size() >= 2) {
    inferred_stack_trace_ = JoinPresent(ordered[0].data_object, ordered[0].message);
  }
  secondary_filename_ = GetInnerExceptionLogFilename();
}

// ------------------------------------------------------------
// Inner exception evidence
// ------------------------------------------------------------

bool LogCorrelator::InnerExceptionRequired() const {
  return model::IsPreliminary(verdict_) && !secondary_events_;
}

void LogCorrelator::ConfirmLastRunResult() {
  if (verdict_ != Verdict::kPreliminarySuccess) {
    return;
  }
  verdict_ = Verdict::kConfirmedSuccess;
  JOBPROBE_LOG_DEBUG("Run verdict confirmed", {StringField("namespace", namespace_)});
}

void LogCorrelator::ImportInnerException(const std::vector<std::string>& lines) {
  if (secondary_events_) {
    throw util::PreconditionFailed("inner exception log already imported");
  }
  if (verdict_ == Verdict::kUninitialized) {
    Evaluate();
  }
  if (model::IsTerminal(verdict_)) {
    throw util::PreconditionFailed("run verdict is already final");
  }

  secondary_events_ = eventlog::ParseEventLog(ReassembleExceptionLog(lines));
  JOBPROBE_LOG_DEBUG("Imported inner exception log", {StringField("namespace", namespace_),
                                                      IntField("records", static_cast<std::int64_t>(secondary_events_->size()))});
  Evaluate();
}

// ------------------------------------------------------------
// Results
// ------------------------------------------------------------

std::int64_t LogCorrelator::GetLastRunResult() {
  if (verdict_ == Verdict::kUninitialized) {
    Evaluate();
  }

  switch (verdict_) {
    case Verdict::kUninitialized:
      return model::kResultNeverEvaluated;
    case Verdict::kPreliminarySuccess:
      return model::kResultPreliminarySuccess;
    case Verdict::kPreliminaryFailure:
      return model::kResultPreliminaryFailure;
    case Verdict::kConfirmedSuccess:
      return model::kResultConfirmedSuccess;
    case Verdict::kFailure:
      return inferred_code_.value_or(model::kResultUnspecifiedFailure);
  }
  return model::kResultNeverEvaluated;
}

std::string LogCorrelator::GetInnerExceptionLogFilename() const {
  if (!last_correlation_id_) {
    throw util::PreconditionFailed("no correlation id yet; evaluate the event log first");
  }

  const auto fields = util::Split(*last_correlation_id_, '-');
  if (fields.size() < 2 || fields[1].size() < kTimestampTokenLength) {
    throw util::MalformedLogError("correlation id '" + *last_correlation_id_ + "' has no timestamp token");
  }

  const auto& token = fields[1];
  return namespace_ + "." + token.substr(0, 8) + "_" + token.substr(8, 4) + ".xml";
}

} // namespace jobprobe::correlation
