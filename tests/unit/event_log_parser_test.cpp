#include "internal/eventlog/event_log_parser.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/support/event_log_builder.hpp"

namespace {

using jobprobe::eventlog::ParseEventLog;
using jobprobe::testing::EventLog;
using jobprobe::util::InputValidationError;
using jobprobe::util::MalformedLogError;

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestParsesFragmentWithDeclaration() {
  const auto records = ParseEventLog(EventLog({
      {.record_id = 1, .event_id = 200, .source = "job", .correlation_id = "a-202401151030-x"},
      {.record_id = 2, .event_id = 201, .source = "job", .correlation_id = "a-202401151030-x", .message = "done"},
  }));

  assert(records.size() == 2);
  assert(records[0].record_id == 1);
  assert(records[0].event_id == 200);
  assert(records[0].source == "job");
  assert(records[0].correlation_id == "a-202401151030-x");
  assert(records[0].timestamp == "2024-01-15T10:30:00Z");
  assert(!records[0].error_code.has_value());
  assert(!records[0].message.has_value());
  assert(!records[0].data_object.has_value());
  assert(records[1].message == std::optional<std::string>("done"));
}

void TestParsesCompleteDocumentWithNestedEvents() {
  const std::string xml = R"(<?xml version="1.0"?>
<Events>
  <Batch>
    <Event><RecordId>7</RecordId><EventId>500</EventId><ErrorCode>42</ErrorCode><DataObject>obj</DataObject></Event>
  </Batch>
</Events>)";

  const auto records = ParseEventLog(xml);
  assert(records.size() == 1);
  assert(records[0].record_id == 7);
  assert(records[0].error_code == std::optional<std::int64_t>(42));
  assert(records[0].data_object == std::optional<std::string>("obj"));
  assert(records[0].source.empty());
  assert(records[0].correlation_id.empty());
}

void TestDecodesEntitiesInMessage() {
  const auto records = ParseEventLog("<Event><RecordId>1</RecordId><EventId>1</EventId><Message>a &amp; b &lt;c&gt;</Message></Event>");
  assert(records.size() == 1);
  assert(records[0].message == std::optional<std::string>("a & b <c>"));
}

void TestEmptyOptionalElementsAreAbsent() {
  const auto records = ParseEventLog("<Event><RecordId>1</RecordId><EventId>1</EventId><Message>  </Message><ErrorCode/></Event>");
  assert(!records[0].message.has_value());
  assert(!records[0].error_code.has_value());
}

void TestRejectsEmptyContent() {
  assert(Throws<InputValidationError>([] { ParseEventLog("   \n "); }));
}

void TestRejectsMalformedXml() {
  assert(Throws<MalformedLogError>([] { ParseEventLog("<Event><RecordId>1</RecordId>"); }));
  assert(Throws<MalformedLogError>([] { ParseEventLog("not xml at all"); }));
}

void TestRejectsLogWithoutEvents() {
  assert(Throws<MalformedLogError>([] { ParseEventLog("<Other>text</Other>"); }));
}

void TestRejectsMissingOrInvalidRequiredFields() {
  assert(Throws<MalformedLogError>([] { ParseEventLog("<Event><EventId>200</EventId></Event>"); }));
  assert(Throws<MalformedLogError>([] { ParseEventLog("<Event><RecordId>x1</RecordId><EventId>200</EventId></Event>"); }));
  assert(Throws<MalformedLogError>([] { ParseEventLog("<Event><RecordId>1</RecordId><EventId>200</EventId><ErrorCode>E42</ErrorCode></Event>"); }));
}

} // namespace

int main() {
  TestParsesFragmentWithDeclaration();
  TestParsesCompleteDocumentWithNestedEvents();
  TestDecodesEntitiesInMessage();
  TestEmptyOptionalElementsAreAbsent();
  TestRejectsEmptyContent();
  TestRejectsMalformedXml();
  TestRejectsLogWithoutEvents();
  TestRejectsMissingOrInvalidRequiredFields();

  std::cout << "job_probe_unit_event_log_parser: pass\n";
  return 0;
}
