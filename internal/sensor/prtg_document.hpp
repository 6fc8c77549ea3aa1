#pragma once

#include <libxml/xmlwriter.h>

#include <memory>
#include <string>
#include <string_view>

#include "internal/sensor/metric_channel.hpp"

namespace jobprobe::sensor {

/*
  Writes a PRTG advanced sensor document:

    <prtg>
      <result><channel>..</channel><value>..</value>[attributes]</result>
      ...
      <text>..</text>
    </prtg>

  Free text is passed through SanitizeText() before it is written.
*/
class PrtgDocumentWriter {
 public:
  PrtgDocumentWriter();
  ~PrtgDocumentWriter();

  PrtgDocumentWriter(const PrtgDocumentWriter&)            = delete;
  PrtgDocumentWriter& operator=(const PrtgDocumentWriter&) = delete;

  void WriteChannel(const MetricChannel& channel);
  void WriteError(int severity);
  void WriteText(std::string_view text);

  // Closes the document and returns it. The writer is unusable afterwards.
  std::string Finish();

 private:
  void WriteElement(const char* name, std::string_view content);

  struct BufferDeleter {
    void operator()(xmlBuffer* buffer) const {
      xmlBufferFree(buffer);
    }
  };
  struct WriterDeleter {
    void operator()(xmlTextWriter* writer) const {
      xmlFreeTextWriter(writer);
    }
  };

  std::unique_ptr<xmlBuffer, BufferDeleter>     buffer_;
  std::unique_ptr<xmlTextWriter, WriterDeleter> writer_;
};

// Line breaks become " -- ", angle brackets become square brackets.
std::string SanitizeText(std::string_view text);

// <prtg><error>0</error><text>OK</text></prtg>
std::string RenderOkDocument();

// <prtg><error>1</error><text>message</text></prtg>
std::string RenderErrorDocument(std::string_view message);

} // namespace jobprobe::sensor
