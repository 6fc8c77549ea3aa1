#include "internal/probe/probe_runner.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/support/event_log_builder.hpp"

namespace {

using namespace std::chrono_literals;
using jobprobe::model::ScheduledTaskMetadata;
using jobprobe::model::TaskState;
using jobprobe::probe::ProbeContext;
using jobprobe::probe::ProbeRunner;
using jobprobe::runtime::config::RuntimeConfig;
using jobprobe::testing::EventLogLines;

namespace util = jobprobe::util;

const auto kNow = std::chrono::system_clock::from_time_t(1705314600); // 2024-01-15T10:30:00Z

constexpr const char* kPrimaryLog = "/logs/com.example.job.xml";
constexpr const char* kInnerLog   = "/logs/com.example.job.20240115_1030.xml";

class FakeTaskSource final : public jobprobe::collector::TaskSource {
 public:
  std::vector<ScheduledTaskMetadata> FindScheduledTasks(const std::string& identity) override {
    requested.push_back(identity);
    if (fail) {
      throw util::TransportError("agent unreachable");
    }
    return tasks;
  }

  std::vector<ScheduledTaskMetadata> tasks;
  std::vector<std::string>           requested;
  bool                               fail = false;
};

class FakeFileSource final : public jobprobe::collector::FileSource {
 public:
  std::optional<std::vector<std::string>> FetchFileLines(const std::string& path) override {
    requested.push_back(path);
    if (failing.count(path) != 0) {
      throw util::TransportError("ReadFileLines " + path + " failed: UNAVAILABLE: share offline");
    }
    auto it = files.find(path);
    if (it == files.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::map<std::string, std::vector<std::string>> files;
  std::set<std::string>                           failing;
  std::vector<std::string>                        requested;
};

class FakeSession final : public jobprobe::collector::RemoteSession {
 public:
  void Close() override {
    ++closes;
    if (fail_on_close) {
      throw util::TransportError("close failed");
    }
  }

  int  closes        = 0;
  bool fail_on_close = false;
};

struct Harness {
  std::shared_ptr<FakeTaskSource> tasks   = std::make_shared<FakeTaskSource>();
  std::shared_ptr<FakeFileSource> files   = std::make_shared<FakeFileSource>();
  std::shared_ptr<FakeSession>    session = std::make_shared<FakeSession>();

  ProbeContext Context() const {
    ProbeContext ctx;
    ctx.tasks    = tasks;
    ctx.files    = files;
    ctx.sessions = {session};
    return ctx;
  }
};

ScheduledTaskMetadata NightlyTask() {
  ScheduledTaskMetadata task;
  task.identity         = "Nightly";
  task.display_name     = "Nightly";
  task.last_run_time    = kNow - 3h;
  task.next_run_time    = kNow + 21h;
  task.last_result_code = 0;
  task.state            = TaskState::kReady;
  return task;
}

RuntimeConfig GenericConfig() {
  RuntimeConfig config;
  config.mutable_sensor()->set_name("backup");
  config.mutable_sensor()->set_kind("generic");
  config.mutable_sensor()->set_task_identity("Nightly");
  config.mutable_agent()->set_address("localhost:7443");
  return config;
}

RuntimeConfig JobLogConfig() {
  auto config = GenericConfig();
  config.mutable_sensor()->set_kind("scheduled_job_with_log");
  config.mutable_event_log()->set_job_namespace("com.example.job");
  config.mutable_event_log()->set_primary_log_path(kPrimaryLog);
  return config;
}

std::vector<std::string> StartOnlyLog() {
  return EventLogLines({{.record_id = 1, .event_id = 200, .source = "job", .correlation_id = "abc-202401151030-xyz"}});
}

std::vector<std::string> StartEndLog() {
  return EventLogLines({
      {.record_id = 1, .event_id = 200, .source = "job", .correlation_id = "abc-202401151030-xyz"},
      {.record_id = 2, .event_id = 201, .source = "job", .correlation_id = "abc-202401151030-xyz"},
  });
}

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void TestGenericSensorReport() {
  Harness h;
  h.tasks->tasks = {NightlyTask()};

  ProbeRunner runner(GenericConfig(), h.Context());
  const auto  outcome = runner.Run(kNow);

  assert(outcome.succeeded);
  assert(h.tasks->requested == std::vector<std::string>{"Nightly"});
  assert(h.files->requested.empty());
  assert(Contains(outcome.document, "<channel>Hours Since Last Run</channel>"));
  assert(Contains(outcome.document, "<text>Task 'Nightly' last ran 2024-01-15T07:30:00Z with result 0; next run 2024-01-16T07:30:00Z</text>"));
  assert(!Contains(outcome.document, "<error>"));
  assert(h.session->closes == 1);
}

void TestMissingInnerLogConfirmsPreliminarySuccess() {
  Harness h;
  h.tasks->tasks             = {NightlyTask()};
  h.files->files[kPrimaryLog] = StartEndLog();

  ProbeRunner runner(JobLogConfig(), h.Context());
  const auto  outcome = runner.Run(kNow);

  assert(outcome.succeeded);
  assert((h.files->requested == std::vector<std::string>{kPrimaryLog, kInnerLog}));
  assert(Contains(outcome.document, "<channel>Last Job Result</channel>"));
  assert(Contains(outcome.document, "<value>0</value>"));
  assert(Contains(outcome.document, "<text>Task 'Nightly' last ran"));
}

void TestInnerLogTurnsRunIntoFailure() {
  Harness h;
  h.tasks->tasks = {NightlyTask()};

  auto config = JobLogConfig();
  config.mutable_event_log()->set_inner_exception_directory("/logs/exceptions");

  h.files->files[kPrimaryLog] = StartOnlyLog();
  h.files->files["/logs/exceptions/com.example.job.20240115_1030.xml"] = EventLogLines({
      {.record_id = 4, .event_id = 500, .error_code = 7, .message = "disk full"},
      {.record_id = 5, .event_id = 500, .message = "copy aborted", .data_object = "Worker.Copy"},
  });

  ProbeRunner runner(config, h.Context());
  const auto  outcome = runner.Run(kNow);

  assert(outcome.succeeded);
  assert(Contains(outcome.document, "<value>7</value>"));
  assert(Contains(outcome.document,
                  "<text>Task 'Nightly' failed with code 7: disk full -- Worker.Copy -- copy aborted "
                  "(inner exception log com.example.job.20240115_1030.xml)</text>"));
}

void TestUnfinishedRunWithoutInnerLogIsAnError() {
  Harness h;
  h.tasks->tasks             = {NightlyTask()};
  h.files->files[kPrimaryLog] = StartOnlyLog();

  ProbeRunner runner(JobLogConfig(), h.Context());
  const auto  outcome = runner.Run(kNow);

  assert(!outcome.succeeded);
  assert(Contains(outcome.document, "<error>1</error>"));
  assert(Contains(outcome.document, "<text>MandatoryEvidenceMissingError: "));
  assert(Contains(outcome.document, kInnerLog));
  assert(!Contains(outcome.document, "<result>"));
  assert(h.session->closes == 1);
}

void TestInnerLogTransportFailureIsNeverAbsence() {
  Harness h;
  h.tasks->tasks             = {NightlyTask()};
  h.files->files[kPrimaryLog] = StartEndLog();
  h.files->failing.insert(kInnerLog);

  ProbeRunner runner(JobLogConfig(), h.Context());
  const auto  outcome = runner.Run(kNow);

  assert(!outcome.succeeded);
  assert(Contains(outcome.document, "<error>1</error>"));
  assert(Contains(outcome.document, "<text>TransportError: ReadFileLines " + std::string(kInnerLog)));
  assert(!Contains(outcome.document, "<result>"));
  assert(!Contains(outcome.document, "last ran"));
  assert(h.session->closes == 1);
}

void TestEverySessionClosedBeforeErrorDocument() {
  Harness h;
  h.tasks->fail = true;

  auto failing_session           = std::make_shared<FakeSession>();
  failing_session->fail_on_close = true;

  auto ctx = h.Context();
  ctx.sessions.insert(ctx.sessions.begin(), failing_session);

  ProbeRunner runner(GenericConfig(), ctx);
  const auto  outcome = runner.Run(kNow);

  assert(!outcome.succeeded);
  assert(Contains(outcome.document, "<text>TransportError: agent unreachable</text>"));
  assert(failing_session->closes == 1);
  assert(h.session->closes == 1);
}

void TestMissingPrimaryLogIsAnError() {
  Harness h;
  h.tasks->tasks = {NightlyTask()};

  ProbeRunner runner(JobLogConfig(), h.Context());
  const auto  outcome = runner.Run(kNow);

  assert(!outcome.succeeded);
  assert(Contains(outcome.document, "<text>MandatoryEvidenceMissingError: primary event log /logs/com.example.job.xml not found</text>"));
}

void TestTaskLookupErrors() {
  {
    Harness h;
    h.tasks->fail = true;
    h.session->fail_on_close = true;

    ProbeRunner runner(GenericConfig(), h.Context());
    const auto  outcome = runner.Run(kNow);
    assert(!outcome.succeeded);
    assert(Contains(outcome.document, "<text>TransportError: agent unreachable</text>"));
    assert(h.session->closes == 1);
  }
  {
    Harness h;
    ProbeRunner runner(GenericConfig(), h.Context());
    assert(Contains(runner.Run(kNow).document, "<text>NotFound: no scheduled task matches 'Nightly'</text>"));
  }
  {
    Harness h;
    h.tasks->tasks = {NightlyTask(), NightlyTask()};
    ProbeRunner runner(GenericConfig(), h.Context());
    assert(Contains(runner.Run(kNow).document, "<text>MultipleMatchError: 2 scheduled tasks match 'Nightly'</text>"));
  }
}

void TestChannelOverridesFromConfig() {
  Harness h;
  h.tasks->tasks = {NightlyTask()};

  auto config = GenericConfig();
  (*(*config.mutable_channels())["Hours Since Last Run"].mutable_attributes())["LimitMaxWarning"] = "26";

  const auto overrides = jobprobe::probe::ChannelOverrides(config);
  assert(overrides.at("Hours Since Last Run").at("LimitMaxWarning") == "26");

  ProbeRunner runner(config, h.Context());
  assert(Contains(runner.Run(kNow).document, "<LimitMaxWarning>26</LimitMaxWarning>"));
}

void TestErrorCategory() {
  assert(jobprobe::probe::ErrorCategory(util::MalformedLogError("x")) == "MalformedLogError");
  assert(jobprobe::probe::ErrorCategory(util::ResourceExhausted("x")) == "ResourceExhausted");
  assert(jobprobe::probe::ErrorCategory(std::runtime_error("x")) == "InternalError");
}

} // namespace

int main() {
  TestGenericSensorReport();
  TestMissingInnerLogConfirmsPreliminarySuccess();
  TestInnerLogTurnsRunIntoFailure();
  TestUnfinishedRunWithoutInnerLogIsAnError();
  TestInnerLogTransportFailureIsNeverAbsence();
  TestEverySessionClosedBeforeErrorDocument();
  TestMissingPrimaryLogIsAnError();
  TestTaskLookupErrors();
  TestChannelOverridesFromConfig();
  TestErrorCategory();

  std::cout << "job_probe_unit_probe_runner: pass\n";
  return 0;
}
