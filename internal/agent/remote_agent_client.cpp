#include "remote_agent_client.hpp"

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include "internal/agent/grpc_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace jobprobe::agent {

using jobprobe::observability::IntField;
using jobprobe::observability::StringField;

namespace {

model::TaskState ToTaskState(v1::TaskState state) {
  switch (state) {
    case v1::TASK_STATE_DISABLED:
      return model::TaskState::kDisabled;
    case v1::TASK_STATE_QUEUED:
      return model::TaskState::kQueued;
    case v1::TASK_STATE_READY:
      return model::TaskState::kReady;
    case v1::TASK_STATE_RUNNING:
      return model::TaskState::kRunning;
    default:
      return model::TaskState::kUnknown;
  }
}

} // namespace

model::ScheduledTaskMetadata FromProto(const v1::ScheduledTask& task) {
  model::ScheduledTaskMetadata out;
  out.identity         = task.identity();
  out.display_name     = task.display_name();
  out.last_run_time    = util::FromProto(task.last_run_time());
  out.last_result_code = task.last_result_code();
  out.state            = ToTaskState(task.state());
  if (task.has_next_run_time()) {
    out.next_run_time = util::FromProto(task.next_run_time());
  }
  return out;
}

RemoteAgentClient::RemoteAgentClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds timeout)
    : channel_(std::move(channel)), stub_(v1::RemoteAgentService::NewStub(channel_)), timeout_(timeout) {
}

std::unique_ptr<RemoteAgentClient> RemoteAgentClient::Connect(const RemoteAgentOptions& options) {
  if (options.address.empty()) {
    throw util::InputValidationError("remote agent address is empty");
  }

  std::shared_ptr<::grpc::ChannelCredentials> credentials;
  if (options.use_tls) {
    ::grpc::SslCredentialsOptions ssl;
    ssl.pem_root_certs = options.root_cert_pem;
    credentials        = ::grpc::SslCredentials(ssl);
  } else {
    credentials = ::grpc::InsecureChannelCredentials();
  }

  JOBPROBE_LOG_INFO("Connecting to remote agent", {StringField("address", options.address), observability::BoolField("tls", options.use_tls)});
  return std::make_unique<RemoteAgentClient>(::grpc::CreateChannel(options.address, credentials), options.timeout);
}

v1::RemoteAgentService::Stub& RemoteAgentClient::Stub() {
  if (!stub_) {
    throw util::TransportError("remote agent session is closed");
  }
  return *stub_;
}

void RemoteAgentClient::PrepareContext(::grpc::ClientContext& ctx) const {
  ctx.set_deadline(std::chrono::system_clock::now() + timeout_);
}

// ------------------------------------------------------------
// TaskSource
// ------------------------------------------------------------

std::vector<model::ScheduledTaskMetadata> RemoteAgentClient::FindScheduledTasks(const std::string& identity) {
  v1::FindScheduledTasksRequest req;
  req.set_identity(identity);
  v1::FindScheduledTasksResponse resp;

  ::grpc::ClientContext ctx;
  PrepareContext(ctx);
  ThrowIfFailed(Stub().FindScheduledTasks(&ctx, req, &resp), "FindScheduledTasks");

  std::vector<model::ScheduledTaskMetadata> tasks;
  tasks.reserve(resp.tasks_size());
  for (const auto& task : resp.tasks()) {
    tasks.push_back(FromProto(task));
  }
  JOBPROBE_LOG_DEBUG("Scheduled task lookup", {StringField("identity", identity), IntField("matches", resp.tasks_size())});
  return tasks;
}

// ------------------------------------------------------------
// FileSource
// ------------------------------------------------------------

std::optional<std::vector<std::string>> RemoteAgentClient::FetchFileLines(const std::string& path) {
  v1::ReadFileLinesRequest req;
  req.set_path(path);
  v1::ReadFileLinesResponse resp;

  ::grpc::ClientContext ctx;
  PrepareContext(ctx);
  const auto status = Stub().ReadFileLines(&ctx, req, &resp);
  if (status.error_code() == ::grpc::StatusCode::NOT_FOUND) {
    JOBPROBE_LOG_DEBUG("Remote file not found", {StringField("path", path)});
    return std::nullopt;
  }
  ThrowIfFailed(status, "ReadFileLines " + path);

  return std::vector<std::string>(resp.lines().begin(), resp.lines().end());
}

// ------------------------------------------------------------
// RemoteSession
// ------------------------------------------------------------

void RemoteAgentClient::Close() {
  if (!stub_) {
    return;
  }
  stub_.reset();
  channel_.reset();
  JOBPROBE_LOG_DEBUG("Remote agent session closed");
}

} // namespace jobprobe::agent
