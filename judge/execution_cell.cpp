#include "judge/execution_cell.hpp"

#include <chrono>
#include <exception>
#include <memory>
#include <system_error>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "judge/comparator.hpp"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"

namespace {

// Larger outputs are truncated by the file size limit, and never match.
static const constexpr int64_t kMaxOutputSizeKb = 64 * 1024;
static const constexpr size_t kMaxDetailSize = 1024;

std::string Truncate(const std::string& text) {
  if (text.size() <= kMaxDetailSize) return text;
  return absl::StrCat(text.substr(0, kMaxDetailSize), "...");
}

// Reads at most kMaxDetailSize bytes of a file, or an empty string.
std::string ReadBounded(const std::string& path) {
  try {
    return Truncate(util::File::Read(path, kMaxDetailSize + 1));
  } catch (const std::system_error& exc) {
    VLOG(2) << "Cannot read " << path << ": " << exc.what();
    return "";
  }
}

proto::ExecutionOutcome MakeOutcome(const proto::TestCase& test,
                                    proto::ExecutionOutcome::Status status) {
  proto::ExecutionOutcome outcome;
  outcome.set_test_name(test.name());
  outcome.set_status(status);
  return outcome;
}

}  // namespace

namespace judge {

proto::ExecutionOutcome ExecutionCell::Run(const CompiledArtifact& artifact,
                                           const proto::TestCase& test,
                                           int64_t time_limit_millis,
                                           int64_t memory_limit_bytes,
                                           const std::atomic<bool>* stop) {
  proto::ExecutionOutcome outcome;
  try {
    outcome = DoRun(artifact, test, time_limit_millis, stop);
  } catch (const std::exception& exc) {
    LOG(WARNING) << "Running " << artifact.Owner() << " on " << test.name()
                 << " failed: " << exc.what();
    outcome = MakeOutcome(test, proto::ExecutionOutcome::LAUNCH_FAILURE);
    outcome.set_detail(exc.what());
  }
  if (outcome.status() == proto::ExecutionOutcome::PASSED &&
      static_cast<int64_t>(outcome.memory_bytes()) > memory_limit_bytes) {
    VLOG(1) << artifact.Owner() << " used " << outcome.memory_bytes()
            << " bytes on " << test.name() << ", more than the limit";
  }
  return outcome;
}

proto::ExecutionOutcome ExecutionCell::DoRun(const CompiledArtifact& artifact,
                                             const proto::TestCase& test,
                                             int64_t time_limit_millis,
                                             const std::atomic<bool>* stop) {
  util::TempDir cell(artifact.Directory(), "run_");
  if (config_.keep_sandboxes) cell.Keep();
  std::string stdout_file = util::File::JoinPath(cell.Path(), "stdout");
  std::string stderr_file = util::File::JoinPath(cell.Path(), "stderr");

  sandbox::ExecutionOptions options(cell.Path(), artifact.Executable());
  options.stdin_file = test.input_path();
  options.stdout_file = stdout_file;
  options.stderr_file = stderr_file;
  options.wall_limit_millis = time_limit_millis;
  options.max_file_size_kb = kMaxOutputSizeKb;
  options.stop = stop;

  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) {
    proto::ExecutionOutcome outcome =
        MakeOutcome(test, proto::ExecutionOutcome::LAUNCH_FAILURE);
    outcome.set_detail("no sandbox available");
    return outcome;
  }

  sandbox::ExecutionInfo info;
  std::string error_msg;
  auto start = std::chrono::steady_clock::now();
  bool started = sb->Execute(options, &info, &error_msg);
  auto wall_time = std::chrono::duration_cast<std::chrono::nanoseconds>(
                       std::chrono::steady_clock::now() - start)
                       .count();

  if (!started) {
    proto::ExecutionOutcome outcome =
        MakeOutcome(test, proto::ExecutionOutcome::LAUNCH_FAILURE);
    outcome.set_detail(error_msg);
    return outcome;
  }
  if (info.killed) {
    VLOG(1) << artifact.Owner() << " on " << test.name() << ": "
            << info.message;
    return MakeOutcome(test, proto::ExecutionOutcome::TIMED_OUT);
  }

  proto::ExecutionOutcome outcome;
  outcome.set_test_name(test.name());
  outcome.set_wall_time_nanos(wall_time);
  outcome.set_memory_bytes(info.memory_usage_kb * 1024);
  if (info.signal != 0 || info.status_code != 0) {
    outcome.set_status(proto::ExecutionOutcome::NON_ZERO_EXIT);
    std::string stderr_content = ReadBounded(stderr_file);
    outcome.set_detail(stderr_content.empty()
                           ? info.message
                           : absl::StrCat(info.message, ": ", stderr_content));
    return outcome;
  }
  if (Comparator::Equal(stdout_file, test.expected_output_path())) {
    outcome.set_status(proto::ExecutionOutcome::PASSED);
  } else {
    outcome.set_status(proto::ExecutionOutcome::WRONG_OUTPUT);
    outcome.set_detail(absl::StrCat(
        "expected: ",
        Truncate(Comparator::Normalize(
            util::File::Read(test.expected_output_path(), kMaxDetailSize + 1))),
        "\ngot: ",
        Truncate(Comparator::Normalize(ReadBounded(stdout_file)))));
  }
  VLOG(2) << artifact.Owner() << " on " << test.name() << ": "
          << proto::ExecutionOutcome::Status_Name(outcome.status()) << " in "
          << wall_time << "ns (cpu " << info.cpu_time_millis << "ms, sys "
          << info.sys_time_millis << "ms), " << info.memory_usage_kb << "KB";
  return outcome;
}

}  // namespace judge
