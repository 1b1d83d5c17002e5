#include "judge/evaluator.hpp"

#include <algorithm>
#include <exception>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"

namespace {
bool IsStopped(const std::atomic<bool>* stop) {
  return stop != nullptr && stop->load();
}
}  // namespace

namespace judge {

const char* Evaluator::StateName(State state) {
  switch (state) {
    case State::DISCOVERED:
      return "DISCOVERED";
    case State::COMPILING:
      return "COMPILING";
    case State::COMPILE_ERROR:
      return "COMPILE_ERROR";
    case State::RUNNING:
      return "RUNNING";
    case State::AGGREGATING:
      return "AGGREGATING";
    case State::TERMINAL:
      return "TERMINAL";
  }
  return "UNKNOWN";
}

proto::EvaluationRecord Evaluator::Evaluate(
    const proto::Submission& submission, const std::atomic<bool>* stop) {
  proto::EvaluationRecord record;
  *record.mutable_submission() = submission;
  State state = State::DISCOVERED;
  try {
    DoEvaluate(submission, stop, &state, &record);
  } catch (const std::exception& exc) {
    LOG(ERROR) << "Evaluation of " << submission.owner() << "/"
               << submission.task_id() << " failed while "
               << StateName(state) << ": " << exc.what();
    record.set_classification(proto::RUNTIME_ERROR);
    record.set_reason(exc.what());
    record.set_representative_time_nanos(0);
    record.set_peak_memory_bytes(0);
  }
  return record;
}

void Evaluator::DoEvaluate(const proto::Submission& submission,
                           const std::atomic<bool>* stop, State* state,
                           proto::EvaluationRecord* record) {
  auto transition = [&submission, state](State next) {
    VLOG(1) << submission.owner() << "/" << submission.task_id() << ": "
            << StateName(*state) << " -> " << StateName(next);
    *state = next;
  };

  transition(State::COMPILING);
  std::string error_msg;
  std::unique_ptr<CompiledArtifact> artifact =
      compiler_->Compile(submission, stop, &error_msg);
  if (!artifact) {
    transition(State::COMPILE_ERROR);
    LOG(WARNING) << "Compilation of " << submission.owner() << "/"
                 << submission.task_id() << " failed";
    record->set_compiled(false);
    record->set_classification(proto::COMPILE_ERROR);
    record->set_reason(error_msg);
    for (absl::string_view line :
         absl::StrSplit(error_msg, '\n', absl::SkipEmpty())) {
      record->add_diagnostics(std::string(line));
    }
    transition(State::TERMINAL);
    return;
  }
  record->set_compiled(true);
  for (const std::string& line : artifact->Diagnostics())
    record->add_diagnostics(line);

  transition(State::RUNNING);
  std::vector<proto::TestCase> tests =
      catalog_->Resolve(submission.task_id(), config_.test_search_locations);
  std::vector<proto::ExecutionOutcome> outcomes;
  for (const proto::TestCase& test : tests) {
    if (IsStopped(stop)) break;
    outcomes.push_back(cell_->Run(*artifact, test,
                                  config_.execution_timeout_millis,
                                  config_.memory_limit_bytes, stop));
    *record->add_outcomes() = outcomes.back();
  }

  transition(State::AGGREGATING);
  if (tests.empty()) {
    record->set_classification(proto::FAILED);
    record->set_reason("no test cases");
  } else if (IsStopped(stop)) {
    record->set_classification(proto::TIMED_OUT);
    record->set_reason("submission time limit exceeded");
  } else {
    Aggregate(outcomes, config_.memory_limit_bytes, record);
  }
  transition(State::TERMINAL);
}

void Evaluator::Aggregate(const std::vector<proto::ExecutionOutcome>& outcomes,
                          int64_t memory_limit_bytes,
                          proto::EvaluationRecord* record) {
  record->set_representative_time_nanos(0);
  record->set_peak_memory_bytes(0);
  for (const proto::ExecutionOutcome& outcome : outcomes) {
    const std::string& test = outcome.test_name();
    switch (outcome.status()) {
      case proto::ExecutionOutcome::PASSED:
        continue;
      case proto::ExecutionOutcome::TIMED_OUT:
        record->set_classification(proto::TIMED_OUT);
        record->set_reason(absl::StrCat("time limit exceeded on ", test));
        return;
      case proto::ExecutionOutcome::NON_ZERO_EXIT:
        record->set_classification(proto::RUNTIME_ERROR);
        record->set_reason(
            absl::StrCat("runtime error on ", test, ": ", outcome.detail()));
        return;
      case proto::ExecutionOutcome::WRONG_OUTPUT:
        record->set_classification(proto::FAILED);
        record->set_reason(absl::StrCat("wrong output on ", test));
        return;
      case proto::ExecutionOutcome::LAUNCH_FAILURE:
        record->set_classification(proto::FAILED);
        record->set_reason(
            absl::StrCat("launch failure on ", test, ": ", outcome.detail()));
        return;
      default:
        record->set_classification(proto::FAILED);
        record->set_reason(absl::StrCat(
            "invalid outcome on ", test, ": ",
            proto::ExecutionOutcome::Status_Name(outcome.status())));
        return;
    }
  }
  if (outcomes.empty()) {
    record->set_classification(proto::FAILED);
    record->set_reason("no test cases");
    return;
  }
  uint64_t total_time = 0;
  uint64_t peak_memory = 0;
  for (const proto::ExecutionOutcome& outcome : outcomes) {
    total_time += outcome.wall_time_nanos();
    peak_memory = std::max(peak_memory, outcome.memory_bytes());
  }
  if (peak_memory > static_cast<uint64_t>(memory_limit_bytes)) {
    record->set_classification(proto::FAILED);
    record->set_reason("memory limit exceeded");
    return;
  }
  record->set_classification(proto::PASSED);
  record->set_reason("");
  record->set_representative_time_nanos(total_time / outcomes.size());
  record->set_peak_memory_bytes(peak_memory);
}

}  // namespace judge
