#ifndef JUDGE_MOCKS_HPP
#define JUDGE_MOCKS_HPP

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "judge/compiler.hpp"
#include "judge/execution_cell.hpp"
#include "judge/test_catalog.hpp"

namespace judge {

class MockCompiler : public Compiler {
 public:
  explicit MockCompiler(const Configuration& config) : Compiler(config) {}
  MOCK_METHOD(std::unique_ptr<CompiledArtifact>, Compile,
              (const proto::Submission& submission,
               const std::atomic<bool>* stop, std::string* error_msg),
              (override));
};

class MockTestCatalog : public TestCatalog {
 public:
  explicit MockTestCatalog(const Configuration& config)
      : TestCatalog(config) {}
  MOCK_METHOD(std::vector<proto::TestCase>, Resolve,
              (const std::string& task_id,
               const std::vector<std::string>& locations),
              (override));
};

class MockExecutionCell : public ExecutionCell {
 public:
  explicit MockExecutionCell(const Configuration& config)
      : ExecutionCell(config) {}
  MOCK_METHOD(proto::ExecutionOutcome, Run,
              (const CompiledArtifact& artifact, const proto::TestCase& test,
               int64_t time_limit_millis, int64_t memory_limit_bytes,
               const std::atomic<bool>* stop),
              (override));
};

}  // namespace judge

#endif
