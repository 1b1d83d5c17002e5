#ifndef JUDGE_COMPARATOR_HPP
#define JUDGE_COMPARATOR_HPP

#include <string>

namespace judge {

// Checks whether the output of a program matches the expected one. Both
// contents are normalized first: "\r\n" becomes "\n" and leading and trailing
// whitespace is removed. Inner whitespace is significant.
class Comparator {
 public:
  // Compares two files. A file that cannot be read never matches.
  static bool Equal(const std::string& actual_path,
                    const std::string& expected_path);

  static bool EqualContents(const std::string& actual,
                            const std::string& expected);

  static std::string Normalize(const std::string& content);
};

}  // namespace judge

#endif
