#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <memory>
#include <string>

#include "internal/collector/sources.hpp"
#include "jobprobe/agent/v1.hpp"

namespace jobprobe::agent {

struct RemoteAgentOptions {
  std::string               address;
  bool                      use_tls = false;
  std::string               root_cert_pem;
  std::chrono::milliseconds timeout{30'000};
};

/*
  Client side of the remote agent protocol. One session per invocation; every
  call carries the configured deadline.
*/
class RemoteAgentClient final : public collector::TaskSource, public collector::FileSource, public collector::RemoteSession {
 public:
  RemoteAgentClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds timeout);

  static std::unique_ptr<RemoteAgentClient> Connect(const RemoteAgentOptions& options);

  std::vector<model::ScheduledTaskMetadata> FindScheduledTasks(const std::string& identity) override;

  std::optional<std::vector<std::string>> FetchFileLines(const std::string& path) override;

  void Close() override;

 private:
  v1::RemoteAgentService::Stub& Stub();
  void                          PrepareContext(::grpc::ClientContext& ctx) const;

  std::shared_ptr<::grpc::Channel>               channel_;
  std::unique_ptr<v1::RemoteAgentService::Stub> stub_;
  std::chrono::milliseconds                      timeout_;
};

model::ScheduledTaskMetadata FromProto(const v1::ScheduledTask& task);

} // namespace jobprobe::agent
