#include "judge/comparator.hpp"

#include <system_error>

#include "absl/strings/ascii.h"
#include "absl/strings/str_replace.h"
#include "glog/logging.h"
#include "util/file.hpp"

namespace judge {

bool Comparator::Equal(const std::string& actual_path,
                       const std::string& expected_path) {
  std::string actual;
  std::string expected;
  try {
    actual = util::File::Read(actual_path);
    expected = util::File::Read(expected_path);
  } catch (const std::system_error& exc) {
    VLOG(1) << "Cannot compare " << actual_path << " and " << expected_path
            << ": " << exc.what();
    return false;
  }
  return EqualContents(actual, expected);
}

bool Comparator::EqualContents(const std::string& actual,
                               const std::string& expected) {
  return Normalize(actual) == Normalize(expected);
}

std::string Comparator::Normalize(const std::string& content) {
  std::string normalized = absl::StrReplaceAll(content, {{"\r\n", "\n"}});
  return std::string(absl::StripAsciiWhitespace(normalized));
}

}  // namespace judge
