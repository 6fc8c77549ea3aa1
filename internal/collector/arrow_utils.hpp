#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <memory>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace jobprobe::collector {

/*
  Helper: unwrap Arrow Result<T> or throw TransportError naming the path
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result, const std::string& path) {
  if (!result.ok()) throw util::TransportError(path + ": " + result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status, const std::string& path) {
  if (!status.ok()) throw util::TransportError(path + ": " + status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file, const std::string& path) {
  auto size = Unwrap(file->GetSize(), path);
  return Unwrap(file->Read(size), path);
}

// Filesystem for a plain local path or any URI Arrow understands (file://,
// s3://, hdfs://, ...), plus the path to use on it.
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& path);

} // namespace jobprobe::collector
