#pragma once

#include <string_view>
#include <vector>

#include "internal/model/event_record.hpp"

namespace jobprobe::eventlog {

/*
  Parses job event log content into records.

  Accepts a complete XML document or an append-only fragment of sibling
  <Event> elements, with or without a leading XML declaration. Every <Event>
  element at any depth becomes one record, in document order.

  Throws InputValidationError on empty content and MalformedLogError when the
  content is not well-formed, holds no <Event>, or a required field
  (RecordId, EventId) is missing or not an integer.
*/
std::vector<model::EventRecord> ParseEventLog(std::string_view content);

} // namespace jobprobe::eventlog
