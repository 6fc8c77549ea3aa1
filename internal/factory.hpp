#pragma once

#include "config/config.pb.h"

#include "internal/probe/probe_runner.hpp"

namespace jobprobe::factory {

/*
  Build

  Composition root: turns the runtime config into the collaborators of one
  probe run. The remote agent always supplies the scheduler metadata; event
  logs come from the agent or, with event_log.source = local, from a local or
  mounted path.
*/
probe::ProbeContext Build(const jobprobe::runtime::config::RuntimeConfig& config);

} // namespace jobprobe::factory
