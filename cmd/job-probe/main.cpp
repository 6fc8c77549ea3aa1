#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/probe/probe_runner.hpp"
#include "internal/sensor/prtg_document.hpp"
#include "internal/util/time.hpp"

using jobprobe::observability::StringField;

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: job-probe <config.yaml> OR job-probe --config <config.yaml>" << std::endl;
    return 1;
  }

  // stderr logging until the config says otherwise; stdout is the sensor document
  jobprobe::observability::InitializeLogging(jobprobe::runtime::config::RuntimeConfig{});

  // ------------------------------------------------------------
  // Load configuration
  // ------------------------------------------------------------
  jobprobe::runtime::config::RuntimeConfig config;
  try {
    config = jobprobe::config::ConfigLoader::LoadFromYaml(config_path);
  } catch (const std::exception& e) {
    JOBPROBE_LOG_ERROR("Cannot load configuration", {StringField("path", config_path), StringField("error", e.what())});
    std::cout << jobprobe::sensor::RenderErrorDocument(std::string("Configuration: ") + e.what());
    jobprobe::observability::ShutdownLogging();
    return 2;
  }

  jobprobe::observability::InitializeLogging(config);

  try {
    // ------------------------------------------------------------
    // Build collaborators and run
    // ------------------------------------------------------------
    jobprobe::probe::ProbeRunner runner(config, jobprobe::factory::Build(config));
    const auto outcome = runner.Run(jobprobe::util::Now());

    std::cout << outcome.document;
    JOBPROBE_LOG_INFO("Probe finished", {StringField("sensor", config.sensor().name()),
                                         jobprobe::observability::BoolField("succeeded", outcome.succeeded)});
  } catch (const std::exception& e) {
    JOBPROBE_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    std::cout << jobprobe::sensor::RenderErrorDocument(std::string(jobprobe::probe::ErrorCategory(e)) + ": " + e.what());
  }

  std::cout.flush();
  jobprobe::observability::ShutdownLogging();
  return 0;
}
