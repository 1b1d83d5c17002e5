#ifndef JUDGE_COMPILER_HPP
#define JUDGE_COMPILER_HPP

#include <atomic>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "judge/configuration.hpp"
#include "proto/submission.pb.h"
#include "util/file.hpp"

namespace judge {

// A compiled submission. Owns the directory that contains the executable: the
// directory is removed when the artifact is destroyed.
class CompiledArtifact {
 public:
  CompiledArtifact(std::string owner, util::TempDir directory,
                   std::string executable, std::vector<std::string> diagnostics)
      : owner_(std::move(owner)),
        directory_(std::move(directory)),
        executable_(std::move(executable)),
        diagnostics_(std::move(diagnostics)) {}

  const std::string& Owner() const { return owner_; }
  const std::string& Directory() const { return directory_.Path(); }
  const std::string& Executable() const { return executable_; }
  const std::vector<std::string>& Diagnostics() const { return diagnostics_; }

 private:
  std::string owner_;
  util::TempDir directory_;
  std::string executable_;
  std::vector<std::string> diagnostics_;
};

class Compiler {
 public:
  explicit Compiler(const Configuration& config) : config_(config) {}
  virtual ~Compiler() = default;

  // Compiles the source of the submission in a new directory inside the
  // temporary directory. On failure returns nullptr and sets error_msg to the
  // diagnostics of the compiler, or to the reason why it could not be run.
  // If stop becomes true the compiler is killed.
  virtual std::unique_ptr<CompiledArtifact> Compile(
      const proto::Submission& submission, const std::atomic<bool>* stop,
      std::string* error_msg);

 private:
  Configuration config_;
};

}  // namespace judge

#endif
