#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/scheduled_task.hpp"

namespace jobprobe::collector {

/*
  Seams to the systems the probe reads from.

  Implementations own retries and timeouts. The core only tells "not there"
  (nullopt / empty match list) apart from "could not ask" (TransportError).
*/

class RemoteSession {
 public:
  virtual ~RemoteSession() = default;

  // Releases whatever the session holds. Safe to call more than once.
  virtual void Close() = 0;
};

class TaskSource {
 public:
  virtual ~TaskSource() = default;

  virtual std::vector<model::ScheduledTaskMetadata> FindScheduledTasks(const std::string& identity) = 0;
};

class FileSource {
 public:
  virtual ~FileSource() = default;

  // nullopt when the file does not exist.
  virtual std::optional<std::vector<std::string>> FetchFileLines(const std::string& path) = 0;
};

// Exactly one match or NotFound / MultipleMatchError.
model::ScheduledTaskMetadata ResolveSingleTask(TaskSource& source, const std::string& identity);

} // namespace jobprobe::collector
