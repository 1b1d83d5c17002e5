#ifndef JUDGE_EXECUTION_CELL_HPP
#define JUDGE_EXECUTION_CELL_HPP

#include <atomic>
#include <cstdint>
#include <string>

#include "judge/compiler.hpp"
#include "judge/configuration.hpp"
#include "proto/evaluation.pb.h"
#include "proto/submission.pb.h"

namespace judge {

// Runs a compiled submission on a single test case.
class ExecutionCell {
 public:
  explicit ExecutionCell(const Configuration& config) : config_(config) {}
  virtual ~ExecutionCell() = default;

  // Runs the program with the test input as stdin, and compares what it
  // writes on stdout with the expected output. The program is killed if it
  // runs for more than time_limit_millis, or as soon as *stop becomes true.
  // Memory is only measured here; the limit is enforced by the caller. Never
  // throws: every error is reported as an outcome.
  virtual proto::ExecutionOutcome Run(const CompiledArtifact& artifact,
                                      const proto::TestCase& test,
                                      int64_t time_limit_millis,
                                      int64_t memory_limit_bytes,
                                      const std::atomic<bool>* stop);

 private:
  proto::ExecutionOutcome DoRun(const CompiledArtifact& artifact,
                                const proto::TestCase& test,
                                int64_t time_limit_millis,
                                const std::atomic<bool>* stop);

  Configuration config_;
};

}  // namespace judge

#endif
