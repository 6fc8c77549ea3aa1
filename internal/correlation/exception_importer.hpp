#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace jobprobe::correlation {

inline constexpr std::size_t kMaxMergedMessageLength = 250;

/*
  Reassembles the raw lines of an inner exception log.

  The job writes multi-line exception text into <Message> without escaping,
  so one logical line arrives as several physical ones. Lines are folded into
  the current logical line unless they open a new one (blank, XML declaration,
  or starting with '<'). A line starting with </Message> closes the field: the
  logical line is cut to at most kMaxMergedMessageLength bytes (on a UTF-8
  character boundary), normalized
  (&apos; -> ', & -> ., NUL dropped) and suffixed with "..." before the
  closing tag is appended.

  Throws InputValidationError when no lines are given.
*/
std::string ReassembleExceptionLog(const std::vector<std::string>& lines);

} // namespace jobprobe::correlation
