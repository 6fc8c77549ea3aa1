#include "exception_importer.hpp"

#include <algorithm>
#include <string_view>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace jobprobe::correlation {

namespace {

constexpr std::string_view kMessageClose = "</Message>";

bool StartsLogicalLine(std::string_view trimmed) {
  return trimmed.empty() || util::StartsWith(trimmed, "<?xml") || util::StartsWith(trimmed, "<");
}

std::string NormalizeMessage(std::string text) {
  if (text.size() > kMaxMergedMessageLength) {
    // Never split a UTF-8 sequence; cut before its lead byte instead.
    std::size_t cut = kMaxMergedMessageLength;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
      --cut;
    }
    text.resize(cut);
  }
  text = util::ReplaceAll(std::move(text), "&apos;", "'");
  std::replace(text.begin(), text.end(), '&', '.');
  text.erase(std::remove(text.begin(), text.end(), '\0'), text.end());
  return text;
}

} // namespace

std::string ReassembleExceptionLog(const std::vector<std::string>& lines) {
  if (lines.empty()) {
    throw util::InputValidationError("inner exception log has no content");
  }

  std::vector<std::string> logical;
  std::string              current;
  bool                     open = false;

  for (const auto& raw : lines) {
    std::string_view line(raw);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    const auto trimmed = util::TrimView(line);

    if (util::StartsWith(trimmed, kMessageClose)) {
      current = NormalizeMessage(std::move(current));
      current.append("...");
      current.append(line);
      open = true;
      continue;
    }

    if (StartsLogicalLine(trimmed)) {
      if (open) {
        logical.push_back(std::move(current));
      }
      current.assign(line);
      open = true;
      continue;
    }

    current.append(line);
    open = true;
  }

  if (open) {
    logical.push_back(std::move(current));
  }

  std::string out;
  for (std::size_t i = 0; i < logical.size(); ++i) {
    if (i > 0) {
      out.push_back('\n');
    }
    out.append(logical[i]);
  }
  return out;
}

} // namespace jobprobe::correlation
