#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace jobprobe::util {

std::string_view TrimView(std::string_view value);

bool StartsWith(std::string_view value, std::string_view prefix);

std::vector<std::string> Split(std::string_view value, char delimiter);

std::string ReplaceAll(std::string value, std::string_view from, std::string_view to);

// Joins a directory and a file name with '/' unless the directory already ends
// in a separator ('/' or '\').
std::string JoinPath(std::string_view directory, std::string_view filename);

} // namespace jobprobe::util
