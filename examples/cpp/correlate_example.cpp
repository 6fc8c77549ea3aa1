#include <iostream>
#include <string>

#include "internal/collector/local_file_source.hpp"
#include "internal/correlation/log_correlator.hpp"
#include "internal/util/strings.hpp"

namespace {

std::string Join(const std::vector<std::string>& lines) {
  std::string out;
  for (const auto& line : lines) {
    out.append(line).push_back('\n');
  }
  return out;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "Usage: correlate_example <job.namespace> <primary-log.xml> [inner-exception-dir]\n";
    return 1;
  }

  const std::string job_namespace = argv[1];
  const std::string primary_path  = argv[2];

  jobprobe::collector::LocalFileSource files;

  try {
    auto primary = files.FetchFileLines(primary_path);
    if (!primary) {
      std::cerr << primary_path << ": no such file\n";
      return 1;
    }

    jobprobe::correlation::LogCorrelator correlator(job_namespace, Join(*primary));
    correlator.Evaluate();
    std::cout << "correlation id: " << correlator.last_correlation_id().value_or("-") << '\n';
    std::cout << "preliminary:    " << jobprobe::model::ToString(correlator.verdict()) << '\n';

    if (correlator.InnerExceptionRequired()) {
      // Without a directory argument, look next to the primary log.
      std::string directory = argc > 3 ? argv[3] : primary_path.substr(0, primary_path.find_last_of('/') + 1);
      if (directory.empty()) {
        directory = ".";
      }
      const auto inner_path = jobprobe::util::JoinPath(directory, correlator.GetInnerExceptionLogFilename());

      if (auto inner = files.FetchFileLines(inner_path)) {
        correlator.ImportInnerException(*inner);
      } else {
        std::cout << "inner log:      " << inner_path << " (absent)\n";
        correlator.ConfirmLastRunResult();
      }
    }

    std::cout << "verdict:        " << jobprobe::model::ToString(correlator.verdict()) << '\n';
    std::cout << "result:         " << correlator.GetLastRunResult() << '\n';
    if (const auto& message = correlator.inner_exception_message()) {
      std::cout << "message:        " << *message << '\n';
    }
    if (const auto& trace = correlator.inner_exception_stack_trace()) {
      std::cout << "stack trace:    " << *trace << '\n';
    }
  } catch (const std::exception& e) {
    std::cerr << "correlation failed: " << e.what() << '\n';
    return 1;
  }

  return 0;
}
