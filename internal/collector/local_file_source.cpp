#include "local_file_source.hpp"

#include <arrow/filesystem/localfs.h>

#include <filesystem>
#include <string_view>

#include "internal/collector/arrow_utils.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace jobprobe::collector {

using jobprobe::observability::IntField;
using jobprobe::observability::StringField;

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& path) {
  if (path.find("://") == std::string::npos) {
    // LocalFileSystem wants absolute paths; relative ones are taken from the working directory.
    std::error_code ec;
    const auto      absolute = std::filesystem::absolute(path, ec);
    if (ec) {
      return arrow::Status::IOError("cannot resolve ", path, ": ", ec.message());
    }
    return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::make_shared<arrow::fs::LocalFileSystem>()), absolute.string());
  }

  std::string resolved_path;
  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(path, &resolved_path));
  return std::make_pair(std::move(fs), resolved_path);
}

std::vector<std::string> SplitLines(std::string_view content) {
  std::vector<std::string> lines;
  while (!content.empty()) {
    const auto newline = content.find('\n');
    if (newline == std::string_view::npos) {
      lines.emplace_back(content);
      break;
    }
    lines.emplace_back(content.substr(0, newline));
    content.remove_prefix(newline + 1);
  }
  return lines;
}

std::optional<std::vector<std::string>> LocalFileSource::FetchFileLines(const std::string& path) {
  auto [fs, resolved] = Unwrap(ResolveFileSystem(path), path);

  const auto info = Unwrap(fs->GetFileInfo(resolved), path);
  if (info.type() == arrow::fs::FileType::NotFound) {
    JOBPROBE_LOG_DEBUG("File not found", {StringField("path", path)});
    return std::nullopt;
  }
  if (info.type() != arrow::fs::FileType::File) {
    throw util::TransportError(path + ": not a regular file");
  }

  auto       file   = Unwrap(fs->OpenInputFile(resolved), path);
  const auto buffer = ReadAll(file, path);
  Unwrap(file->Close(), path);

  auto lines = SplitLines(std::string_view(reinterpret_cast<const char*>(buffer->data()), static_cast<std::size_t>(buffer->size())));
  JOBPROBE_LOG_DEBUG("Read file", {StringField("path", path), IntField("lines", static_cast<std::int64_t>(lines.size()))});
  return lines;
}

} // namespace jobprobe::collector
