#ifndef JUDGE_TEST_CATALOG_HPP
#define JUDGE_TEST_CATALOG_HPP

#include <string>
#include <vector>

#include "judge/configuration.hpp"
#include "proto/submission.pb.h"

namespace judge {

// Finds the test cases of a task. For a task T, every file in a search
// location whose name starts with T and ends with the input suffix is an
// input; the expected output is the file with the same base name and the
// output suffix, in the same directory.
class TestCatalog {
 public:
  explicit TestCatalog(const Configuration& config)
      : input_suffix_(config.input_suffix),
        output_suffix_(config.output_suffix) {}
  virtual ~TestCatalog() = default;

  // Returns the test cases found in the given locations, in location order
  // and sorted by name within each location. Test cases found in more than
  // one location are returned more than once. Never fails: missing locations
  // and inputs without an expected output are skipped.
  virtual std::vector<proto::TestCase> Resolve(
      const std::string& task_id, const std::vector<std::string>& locations);

 private:
  std::string input_suffix_;
  std::string output_suffix_;
};

}  // namespace judge

#endif
