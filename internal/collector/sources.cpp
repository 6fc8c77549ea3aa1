#include "sources.hpp"

#include "internal/util/errors.hpp"

namespace jobprobe::collector {

model::ScheduledTaskMetadata ResolveSingleTask(TaskSource& source, const std::string& identity) {
  if (identity.empty()) {
    throw util::InputValidationError("scheduled task identity is empty");
  }

  auto matches = source.FindScheduledTasks(identity);
  if (matches.empty()) {
    throw util::NotFound("no scheduled task matches '" + identity + "'");
  }
  if (matches.size() > 1) {
    throw util::MultipleMatchError(std::to_string(matches.size()) + " scheduled tasks match '" + identity + "'");
  }
  return std::move(matches.front());
}

} // namespace jobprobe::collector
