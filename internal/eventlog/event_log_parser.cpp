#include "event_log_parser.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <charconv>
#include <climits>
#include <cstring>
#include <memory>
#include <optional>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace jobprobe::eventlog {

using jobprobe::model::EventRecord;
using jobprobe::util::MalformedLogError;

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

struct XmlDocDeleter {
  void operator()(xmlDoc* doc) const {
    xmlFreeDoc(doc);
  }
};

struct XmlCharDeleter {
  void operator()(xmlChar* text) const {
    xmlFree(text);
  }
};

using XmlDocPtr  = std::unique_ptr<xmlDoc, XmlDocDeleter>;
using XmlCharPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

std::string_view StripDeclaration(std::string_view content) {
  content = util::TrimView(content);
  if (util::StartsWith(content, kUtf8Bom)) {
    content.remove_prefix(kUtf8Bom.size());
    content = util::TrimView(content);
  }
  if (util::StartsWith(content, "<?xml")) {
    const auto end = content.find("?>");
    if (end == std::string_view::npos) {
      throw MalformedLogError("event log: unterminated XML declaration");
    }
    content.remove_prefix(end + 2);
  }
  return content;
}

bool IsElement(const xmlNode* node, const char* name) {
  return node->type == XML_ELEMENT_NODE && std::strcmp(reinterpret_cast<const char*>(node->name), name) == 0;
}

std::optional<std::string> ChildText(const xmlNode* event, const char* name) {
  for (const xmlNode* child = event->children; child != nullptr; child = child->next) {
    if (!IsElement(child, name)) {
      continue;
    }
    XmlCharPtr content(xmlNodeGetContent(child));
    if (!content) {
      return std::nullopt;
    }
    const auto text = util::TrimView(reinterpret_cast<const char*>(content.get()));
    if (text.empty()) {
      return std::nullopt;
    }
    return std::string(text);
  }
  return std::nullopt;
}

template <typename Int>
Int ParseInteger(const std::string& text, const char* field) {
  Int        value{};
  const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
    throw MalformedLogError(std::string("event log: ") + field + " is not an integer: '" + text + "'");
  }
  return value;
}

template <typename Int>
Int RequiredInteger(const xmlNode* event, const char* field) {
  auto text = ChildText(event, field);
  if (!text) {
    throw MalformedLogError(std::string("event log: Event without ") + field);
  }
  return ParseInteger<Int>(*text, field);
}

EventRecord ParseRecord(const xmlNode* event) {
  EventRecord record;
  record.record_id      = RequiredInteger<std::int64_t>(event, "RecordId");
  record.event_id       = RequiredInteger<std::int32_t>(event, "EventId");
  record.source         = ChildText(event, "Source").value_or("");
  record.correlation_id = ChildText(event, "CorrelationId").value_or("");
  record.timestamp      = ChildText(event, "Timestamp").value_or("");

  if (auto code = ChildText(event, "ErrorCode")) {
    record.error_code = ParseInteger<std::int64_t>(*code, "ErrorCode");
  }
  record.message     = ChildText(event, "Message");
  record.data_object = ChildText(event, "DataObject");
  return record;
}

void CollectEvents(const xmlNode* node, std::vector<EventRecord>& out) {
  for (const xmlNode* child = node; child != nullptr; child = child->next) {
    if (IsElement(child, "Event")) {
      out.push_back(ParseRecord(child));
      continue;
    }
    if (child->type == XML_ELEMENT_NODE) {
      CollectEvents(child->children, out);
    }
  }
}

} // namespace

std::vector<EventRecord> ParseEventLog(std::string_view content) {
  if (util::TrimView(content).empty()) {
    throw util::InputValidationError("event log content is empty");
  }

  // Append-only logs are fragments without a single root; wrap them in one.
  std::string wrapped;
  const auto  body = StripDeclaration(content);
  wrapped.reserve(body.size() + 32);
  wrapped.append("<EventLog>").append(body).append("</EventLog>");

  if (wrapped.size() > static_cast<std::size_t>(INT_MAX)) {
    throw util::InputValidationError("event log content is too large");
  }

  XmlDocPtr doc(xmlReadMemory(wrapped.data(), static_cast<int>(wrapped.size()), "event-log.xml", "UTF-8",
                              XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
  if (!doc) {
    const xmlError* error = xmlGetLastError();
    std::string     detail = (error != nullptr && error->message != nullptr) ? error->message : "unknown parser error";
    throw MalformedLogError("event log is not well-formed XML: " + std::string(util::TrimView(detail)));
  }

  std::vector<EventRecord> records;
  CollectEvents(xmlDocGetRootElement(doc.get()), records);

  if (records.empty()) {
    throw MalformedLogError("event log contains no Event records");
  }
  return records;
}

} // namespace jobprobe::eventlog
