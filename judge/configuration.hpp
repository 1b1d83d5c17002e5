#ifndef JUDGE_CONFIGURATION_HPP
#define JUDGE_CONFIGURATION_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace judge {

// Settings shared by all the components of the pipeline. Built once before
// any submission is evaluated and never modified afterwards.
struct Configuration {
  int64_t execution_timeout_millis = 10000;
  int64_t submission_timeout_millis = 60000;
  int64_t compile_timeout_millis = 30000;
  int64_t memory_limit_bytes = 64LL * 1024 * 1024;

  // Directories searched, in order, for the test cases of a task.
  std::vector<std::string> test_search_locations;
  std::string input_suffix = ".in";
  std::string output_suffix = ".out";

  // Number of submissions evaluated in parallel. Zero means one per core.
  int32_t concurrency = 0;

  std::string temp_directory = "temp";
  bool keep_sandboxes = false;

  std::string compiler = "c++";
  std::vector<std::string> compiler_args = {"-O2", "-std=c++14", "-DEVAL"};

  // Builds the configuration from the command line flags. Relative test
  // locations are resolved against root, and "." means root itself.
  static Configuration FromFlags(const std::string& root);

  // Throws std::invalid_argument if some value is out of range.
  void Validate() const;

  // Number of worker threads that should actually be started.
  int32_t EffectiveConcurrency() const;
};

}  // namespace judge

#endif
