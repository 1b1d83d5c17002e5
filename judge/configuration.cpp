#include "judge/configuration.hpp"

#include <stdexcept>
#include <thread>
#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace judge {

Configuration Configuration::FromFlags(const std::string& root) {
  Configuration config;
  config.execution_timeout_millis = FLAGS_execution_timeout_ms;
  config.submission_timeout_millis = FLAGS_submission_timeout_ms;
  config.compile_timeout_millis = FLAGS_compile_timeout_ms;
  config.memory_limit_bytes = FLAGS_memory_limit_kb * 1024;
  for (absl::string_view location :
       absl::StrSplit(FLAGS_test_locations, ',', absl::SkipWhitespace())) {
    std::string loc(absl::StripAsciiWhitespace(location));
    config.test_search_locations.push_back(
        loc == "." ? root : util::File::JoinPath(root, loc));
  }
  config.input_suffix = FLAGS_input_suffix;
  config.output_suffix = FLAGS_output_suffix;
  config.concurrency = FLAGS_num_cores;
  config.temp_directory = FLAGS_temp_directory;
  config.keep_sandboxes = FLAGS_keep_sandboxes;
  config.compiler = FLAGS_compiler;
  std::vector<std::string> compiler_args =
      absl::StrSplit(FLAGS_compiler_args, ' ', absl::SkipEmpty());
  config.compiler_args = std::move(compiler_args);
  return config;
}

void Configuration::Validate() const {
  if (execution_timeout_millis <= 0)
    throw std::invalid_argument(absl::StrCat(
        "Invalid execution timeout: ", execution_timeout_millis, "ms"));
  if (submission_timeout_millis <= 0)
    throw std::invalid_argument(absl::StrCat(
        "Invalid submission timeout: ", submission_timeout_millis, "ms"));
  if (compile_timeout_millis <= 0)
    throw std::invalid_argument(absl::StrCat(
        "Invalid compilation timeout: ", compile_timeout_millis, "ms"));
  if (memory_limit_bytes <= 0)
    throw std::invalid_argument(
        absl::StrCat("Invalid memory limit: ", memory_limit_bytes, " bytes"));
  if (concurrency < 0)
    throw std::invalid_argument(
        absl::StrCat("Invalid concurrency: ", concurrency));
  if (input_suffix.empty() || output_suffix.empty())
    throw std::invalid_argument("Test file suffixes cannot be empty");
  if (input_suffix == output_suffix)
    throw std::invalid_argument(
        "Input and output suffixes must be different");
  if (test_search_locations.empty())
    throw std::invalid_argument("No test search locations");
  if (compiler.empty()) throw std::invalid_argument("No compiler specified");
  if (temp_directory.empty())
    throw std::invalid_argument("No temporary directory specified");
}

int32_t Configuration::EffectiveConcurrency() const {
  if (concurrency > 0) return concurrency;
  int32_t cores = std::thread::hardware_concurrency();
  return cores > 0 ? cores : 1;
}

}  // namespace judge
