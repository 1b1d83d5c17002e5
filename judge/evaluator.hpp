#ifndef JUDGE_EVALUATOR_HPP
#define JUDGE_EVALUATOR_HPP

#include <atomic>
#include <string>
#include <vector>

#include "judge/compiler.hpp"
#include "judge/configuration.hpp"
#include "judge/execution_cell.hpp"
#include "judge/test_catalog.hpp"
#include "proto/evaluation.pb.h"
#include "proto/submission.pb.h"

namespace judge {

// Evaluates a single submission: compiles it, runs it on every test case of
// its task and classifies the result.
class Evaluator {
 public:
  enum class State {
    DISCOVERED,
    COMPILING,
    COMPILE_ERROR,
    RUNNING,
    AGGREGATING,
    TERMINAL
  };

  // The components are not owned, and must outlive the evaluator.
  Evaluator(const Configuration& config, Compiler* compiler,
            TestCatalog* catalog, ExecutionCell* cell)
      : config_(config), compiler_(compiler), catalog_(catalog), cell_(cell) {}

  // Never throws. If *stop becomes true the running program is killed, no
  // more test cases are run and the submission is classified as TIMED_OUT.
  proto::EvaluationRecord Evaluate(const proto::Submission& submission,
                                   const std::atomic<bool>* stop = nullptr);

  // Computes classification, time and memory of a compiled submission from
  // the outcomes of its test cases, in catalog order.
  static void Aggregate(const std::vector<proto::ExecutionOutcome>& outcomes,
                        int64_t memory_limit_bytes,
                        proto::EvaluationRecord* record);

  static const char* StateName(State state);

 private:
  void DoEvaluate(const proto::Submission& submission,
                  const std::atomic<bool>* stop, State* state,
                  proto::EvaluationRecord* record);

  Configuration config_;
  Compiler* compiler_;
  TestCatalog* catalog_;
  ExecutionCell* cell_;
};

}  // namespace judge

#endif
