#pragma once

#include <cstdint>
#include <string_view>

namespace jobprobe::model {

enum class Verdict : std::uint8_t {
  kUninitialized      = 0,
  kPreliminarySuccess = 1,
  kPreliminaryFailure = 2,
  kConfirmedSuccess   = 3,
  kFailure            = 4,
};

// Numeric results reported for the "Last Job Result" channel. Zero is a
// confirmed success; a failure reports the code taken from the inner
// exception log, which may be any value.
inline constexpr std::int64_t kResultConfirmedSuccess   = 0;
inline constexpr std::int64_t kResultNeverEvaluated     = -1;
inline constexpr std::int64_t kResultPreliminarySuccess = -2;
inline constexpr std::int64_t kResultPreliminaryFailure = -3;
inline constexpr std::int64_t kResultUnspecifiedFailure = -4;

constexpr bool IsTerminal(Verdict verdict) {
  return verdict == Verdict::kConfirmedSuccess || verdict == Verdict::kFailure;
}

constexpr bool IsPreliminary(Verdict verdict) {
  return verdict == Verdict::kPreliminarySuccess || verdict == Verdict::kPreliminaryFailure;
}

/*
  Transition function of the run-result state machine.

    kUninitialized --end event--> kPreliminarySuccess
    kUninitialized --no end-----> kPreliminaryFailure
    preliminary    --evidence---> kFailure
    kPreliminarySuccess --ConfirmLastRunResult--> kConfirmedSuccess (not modelled here)

  Terminal verdicts never change.
*/
constexpr Verdict NextVerdict(Verdict current, bool end_event_found, bool secondary_imported) {
  if (IsTerminal(current)) {
    return current;
  }
  if (current == Verdict::kUninitialized && end_event_found) {
    return Verdict::kPreliminarySuccess;
  }
  if (!secondary_imported) {
    return current == Verdict::kUninitialized ? Verdict::kPreliminaryFailure : current;
  }
  return Verdict::kFailure;
}

constexpr std::string_view ToString(Verdict verdict) {
  switch (verdict) {
    case Verdict::kUninitialized:
      return "uninitialized";
    case Verdict::kPreliminarySuccess:
      return "preliminary_success";
    case Verdict::kPreliminaryFailure:
      return "preliminary_failure";
    case Verdict::kConfirmedSuccess:
      return "confirmed_success";
    case Verdict::kFailure:
      return "failure";
  }
  return "unknown";
}

}  // namespace jobprobe::model
