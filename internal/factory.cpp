#include "factory.hpp"

#include <chrono>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>

#include "internal/agent/remote_agent_client.hpp"
#include "internal/collector/local_file_source.hpp"
#include "internal/util/errors.hpp"

namespace jobprobe::factory {

namespace {

std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::InputValidationError("cannot read " + path);
  }
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

agent::RemoteAgentOptions AgentOptions(const jobprobe::runtime::config::AgentConfig& config) {
  agent::RemoteAgentOptions options;
  options.address = config.address();
  options.use_tls = config.use_tls();
  if (options.use_tls && !config.root_cert_path().empty()) {
    options.root_cert_pem = ReadFile(config.root_cert_path());
  }
  if (config.has_timeout()) {
    options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(config.timeout().seconds()) +
                                                                            std::chrono::nanoseconds(config.timeout().nanos()));
  }
  return options;
}

} // namespace

probe::ProbeContext Build(const jobprobe::runtime::config::RuntimeConfig& config) {
  std::shared_ptr<agent::RemoteAgentClient> agent_client = agent::RemoteAgentClient::Connect(AgentOptions(config.agent()));

  probe::ProbeContext ctx;
  ctx.tasks = agent_client;
  ctx.sessions.push_back(agent_client);

  if (config.event_log().source() == "local") {
    ctx.files = std::make_shared<collector::LocalFileSource>();
  } else {
    ctx.files = agent_client;
  }
  return ctx;
}

} // namespace jobprobe::factory
