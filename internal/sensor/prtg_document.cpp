#include "prtg_document.hpp"

#include <stdexcept>

#include "internal/util/strings.hpp"

namespace jobprobe::sensor {

namespace {

constexpr std::string_view kLineSeparator = " -- ";

const xmlChar* Xml(const char* text) {
  return reinterpret_cast<const xmlChar*>(text);
}

void Check(int rc, const char* what) {
  if (rc < 0) {
    throw std::runtime_error(std::string("PRTG document: ") + what + " failed");
  }
}

} // namespace

PrtgDocumentWriter::PrtgDocumentWriter() : buffer_(xmlBufferCreate()) {
  if (!buffer_) {
    throw std::runtime_error("PRTG document: xmlBufferCreate failed");
  }
  writer_.reset(xmlNewTextWriterMemory(buffer_.get(), 0));
  if (!writer_) {
    throw std::runtime_error("PRTG document: xmlNewTextWriterMemory failed");
  }

  Check(xmlTextWriterSetIndent(writer_.get(), 1), "set indent");
  Check(xmlTextWriterSetIndentString(writer_.get(), Xml("  ")), "set indent string");
  Check(xmlTextWriterStartDocument(writer_.get(), nullptr, "UTF-8", nullptr), "start document");
  Check(xmlTextWriterStartElement(writer_.get(), Xml("prtg")), "start <prtg>");
}

PrtgDocumentWriter::~PrtgDocumentWriter() = default;

void PrtgDocumentWriter::WriteElement(const char* name, std::string_view content) {
  const std::string text(content);
  Check(xmlTextWriterWriteElement(writer_.get(), Xml(name), Xml(text.c_str())), name);
}

void PrtgDocumentWriter::WriteChannel(const MetricChannel& channel) {
  Check(xmlTextWriterStartElement(writer_.get(), Xml("result")), "start <result>");
  WriteElement("channel", channel.Name());
  WriteElement("value", channel.GetValue().value_or(""));

  const auto& attributes = channel.Attributes();
  for (std::size_t i = 0; i < attributes.size(); ++i) {
    if (!attributes[i] || attributes[i]->empty()) {
      continue;
    }
    const std::string name(kChannelAttributeNames[i]);
    WriteElement(name.c_str(), *attributes[i]);
  }
  Check(xmlTextWriterEndElement(writer_.get()), "end <result>");
}

void PrtgDocumentWriter::WriteError(int severity) {
  WriteElement("error", std::to_string(severity));
}

void PrtgDocumentWriter::WriteText(std::string_view text) {
  WriteElement("text", SanitizeText(text));
}

std::string PrtgDocumentWriter::Finish() {
  Check(xmlTextWriterEndDocument(writer_.get()), "end document");
  Check(xmlTextWriterFlush(writer_.get()), "flush");

  std::string document(reinterpret_cast<const char*>(xmlBufferContent(buffer_.get())), static_cast<std::size_t>(xmlBufferLength(buffer_.get())));
  writer_.reset();
  return document;
}

// ------------------------------------------------------------
// Canned documents
// ------------------------------------------------------------

std::string SanitizeText(std::string_view text) {
  std::string out(text);
  out = util::ReplaceAll(std::move(out), "\r\n", kLineSeparator);
  out = util::ReplaceAll(std::move(out), "\n", kLineSeparator);
  out = util::ReplaceAll(std::move(out), "\r", kLineSeparator);
  for (auto& c : out) {
    if (c == '<') {
      c = '[';
    } else if (c == '>') {
      c = ']';
    }
  }
  return out;
}

std::string RenderOkDocument() {
  PrtgDocumentWriter writer;
  writer.WriteError(0);
  writer.WriteText("OK");
  return writer.Finish();
}

std::string RenderErrorDocument(std::string_view message) {
  PrtgDocumentWriter writer;
  writer.WriteError(1);
  writer.WriteText(message);
  return writer.Finish();
}

} // namespace jobprobe::sensor
