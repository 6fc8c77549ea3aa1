#include "strings.hpp"

namespace jobprobe::util {

namespace {

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

} // namespace

std::string_view TrimView(std::string_view value) {
  while (!value.empty() && IsSpace(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && IsSpace(value.back())) {
    value.remove_suffix(1);
  }
  return value;
}

bool StartsWith(std::string_view value, std::string_view prefix) {
  return value.substr(0, prefix.size()) == prefix;
}

std::vector<std::string> Split(std::string_view value, char delimiter) {
  std::vector<std::string> parts;
  std::size_t              start = 0;
  while (true) {
    const auto pos = value.find(delimiter, start);
    if (pos == std::string_view::npos) {
      parts.emplace_back(value.substr(start));
      break;
    }
    parts.emplace_back(value.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

std::string ReplaceAll(std::string value, std::string_view from, std::string_view to) {
  if (from.empty()) {
    return value;
  }
  std::size_t pos = 0;
  while ((pos = value.find(from, pos)) != std::string::npos) {
    value.replace(pos, from.size(), to);
    pos += to.size();
  }
  return value;
}

std::string JoinPath(std::string_view directory, std::string_view filename) {
  if (directory.empty()) {
    return std::string(filename);
  }
  std::string path(directory);
  if (path.back() != '/' && path.back() != '\\') {
    path.push_back('/');
  }
  path.append(filename);
  return path;
}

} // namespace jobprobe::util
