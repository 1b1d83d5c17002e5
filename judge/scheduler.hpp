#ifndef JUDGE_SCHEDULER_HPP
#define JUDGE_SCHEDULER_HPP

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

#include "judge/compiler.hpp"
#include "judge/configuration.hpp"
#include "judge/execution_cell.hpp"
#include "judge/test_catalog.hpp"
#include "proto/evaluation.pb.h"
#include "proto/submission.pb.h"

namespace judge {

// Evaluates many submissions in parallel, one per worker thread at a time.
// The components are shared by all the workers and are not owned.
class Scheduler {
 public:
  Scheduler(const Configuration& config, Compiler* compiler,
            TestCatalog* catalog, ExecutionCell* cell)
      : config_(config), compiler_(compiler), catalog_(catalog), cell_(cell) {}

  // Returns exactly one record per submission, in no particular order. A
  // submission that takes more than the submission timeout is stopped and
  // classified as TIMED_OUT. If it does not stop within a grace period, its
  // worker moves on and the evaluation is only joined before returning.
  std::vector<proto::EvaluationRecord> Run(
      const std::vector<proto::Submission>& submissions);

 private:
  void ThreadBody(const std::vector<proto::Submission>& submissions);
  proto::EvaluationRecord EvaluateWithTimeout(
      const proto::Submission& submission);

  Configuration config_;
  Compiler* compiler_;
  TestCatalog* catalog_;
  ExecutionCell* cell_;

  size_t next_submission_ = 0;
  std::mutex next_submission_mutex_;
  std::vector<proto::EvaluationRecord> records_;
  std::mutex records_mutex_;
  // Evaluations that outlived their submission timeout.
  std::vector<std::thread> stragglers_;
  std::mutex stragglers_mutex_;
};

}  // namespace judge

#endif
