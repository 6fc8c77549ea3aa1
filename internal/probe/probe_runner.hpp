#pragma once

#include <exception>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.pb.h"
#include "internal/collector/sources.hpp"
#include "internal/util/time.hpp"

namespace jobprobe::correlation {
class LogCorrelator;
}

namespace jobprobe::probe {

/*
  Collaborators for one run. Sessions are closed when the run ends, whatever
  the outcome.
*/
struct ProbeContext {
  std::shared_ptr<collector::TaskSource>                 tasks;
  std::shared_ptr<collector::FileSource>                 files;
  std::vector<std::shared_ptr<collector::RemoteSession>> sessions;
};

struct RunOutcome {
  std::string document;
  bool        succeeded = false;
};

/*
  ProbeRunner

  One invocation: resolve the scheduled task, correlate the job's event log
  (fetching the inner exception log when the verdict is still preliminary),
  merge everything into the sensor and render it. Any error yields the error
  document instead; the two never mix.
*/
class ProbeRunner {
 public:
  ProbeRunner(jobprobe::runtime::config::RuntimeConfig config, ProbeContext ctx);

  RunOutcome Run(util::TimePoint now);

 private:
  std::string                                 Collect(util::TimePoint now);
  std::unique_ptr<correlation::LogCorrelator> CorrelateJobLog();
  void                                        CloseSessions();

  jobprobe::runtime::config::RuntimeConfig config_;
  ProbeContext                             ctx_;
};

// Error class name shown in front of the message in the error document.
std::string_view ErrorCategory(const std::exception& e);

std::map<std::string, std::map<std::string, std::string>> ChannelOverrides(const jobprobe::runtime::config::RuntimeConfig& config);

} // namespace jobprobe::probe
