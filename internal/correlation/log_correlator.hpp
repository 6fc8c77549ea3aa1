#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/event_record.hpp"
#include "internal/model/verdict.hpp"

namespace jobprobe::correlation {

/*
  LogCorrelator

  Derives the result of the most recent run of one job from its event log.

  The primary log yields a preliminary verdict: the newest start event (id 200)
  written by the namespace leaf is matched by correlation id against an end
  event (id 201). Whether the run really succeeded, or why it failed, is only
  known from the inner exception log, a second file named after the
  correlation id that the caller fetches on demand and hands to
  ImportInnerException().

  One instance per invocation; not thread-safe.
*/
class LogCorrelator {
 public:
  LogCorrelator(std::string job_namespace, std::string_view primary_log);

  // Runs the transition function. Re-running after a terminal verdict is a
  // no-op. Throws PreconditionFailed when the log holds no start event.
  void Evaluate();

  // True while the verdict is preliminary and no inner exception log has been
  // imported. A preliminary success still asks for one: sub-processes may log
  // an exception without breaking the start/end pair.
  bool InnerExceptionRequired() const;

  // Preliminary success -> confirmed success, for when the inner exception log
  // is known to be absent. No-op in every other state.
  void ConfirmLastRunResult();

  // Folds the raw inner exception log lines into the evidence and re-evaluates.
  void ImportInnerException(const std::vector<std::string>& lines);

  // 0 for confirmed success, the failure code for a failure, otherwise one of
  // the kResult* sentinels. Evaluates lazily.
  std::int64_t GetLastRunResult();

  // {namespace}.{yyyyMMdd}_{HHmm}.xml from the timestamp token of the last
  // correlation id.
  std::string GetInnerExceptionLogFilename() const;

  model::Verdict verdict() const {
    return verdict_;
  }

  const std::string& job_namespace() const {
    return namespace_;
  }

  const std::string& leaf() const {
    return leaf_;
  }

  const std::string& parent() const {
    return parent_;
  }

  const std::optional<std::string>& last_correlation_id() const {
    return last_correlation_id_;
  }

  bool has_inner_exception() const {
    return secondary_events_.has_value();
  }

  const std::optional<std::int64_t>& inner_exception_code() const {
    return inferred_code_;
  }

  const std::optional<std::string>& inner_exception_message() const {
    return inferred_message_;
  }

  const std::optional<std::string>& inner_exception_stack_trace() const {
    return inferred_stack_trace_;
  }

  const std::optional<std::string>& inner_exception_filename() const {
    return secondary_filename_;
  }

 private:
  const model::EventRecord& LatestStartEvent() const;
  bool                      HasEndEvent(const std::string& correlation_id) const;
  void                      InferFailure();

  std::string namespace_;
  std::string leaf_;
  std::string parent_;

  std::vector<model::EventRecord>                primary_events_;
  std::optional<std::vector<model::EventRecord>> secondary_events_;

  model::Verdict             verdict_ = model::Verdict::kUninitialized;
  std::optional<std::string> last_correlation_id_;

  std::optional<std::int64_t> inferred_code_;
  std::optional<std::string>  inferred_message_;
  std::optional<std::string>  inferred_stack_trace_;
  std::optional<std::string>  secondary_filename_;
};

} // namespace jobprobe::correlation
