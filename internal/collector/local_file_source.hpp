#pragma once

#include <string_view>

#include "internal/collector/sources.hpp"

namespace jobprobe::collector {

/*
  Reads event logs through Arrow's filesystem layer: a local or mounted path
  (e.g. a CIFS share of the job host), or a URI such as file:///var/log/x.xml.
*/
class LocalFileSource final : public FileSource {
 public:
  std::optional<std::vector<std::string>> FetchFileLines(const std::string& path) override;
};

// Physical lines of a file body; a trailing newline does not start a new line.
std::vector<std::string> SplitLines(std::string_view content);

} // namespace jobprobe::collector
