#include "judge/compiler.hpp"

#include <unistd.h>

#include <cctype>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"
#include "sandbox/sandbox.hpp"
#include "util/which.hpp"

namespace {

static const constexpr size_t kMaxDiagnosticsSize = 64 * 1024;
static const constexpr char* kExecutableName = "program";

std::string SanitizeOwner(const std::string& owner) {
  std::string result = owner;
  for (char& c : result) {
    if (!isalnum(static_cast<unsigned char>(c)) && c != '-') c = '_';
  }
  return result;
}

// Collects what the compiler wrote on stderr and stdout, one entry per line.
std::vector<std::string> ReadDiagnostics(const std::string& stderr_file,
                                         const std::string& stdout_file) {
  std::vector<std::string> lines;
  for (const std::string& file : {stderr_file, stdout_file}) {
    std::string content;
    try {
      content = util::File::Read(file, kMaxDiagnosticsSize);
    } catch (const std::system_error& exc) {
      VLOG(1) << "Cannot read compiler output: " << exc.what();
      continue;
    }
    for (absl::string_view line : absl::StrSplit(content, '\n')) {
      if (!line.empty()) lines.emplace_back(line);
    }
  }
  return lines;
}

}  // namespace

namespace judge {

std::unique_ptr<CompiledArtifact> Compiler::Compile(
    const proto::Submission& submission, const std::atomic<bool>* stop,
    std::string* error_msg) {
  std::string source;
  try {
    source = util::File::AbsolutePath(submission.source_path());
  } catch (const std::system_error& exc) {
    *error_msg = absl::StrCat("source file not readable: ", exc.what());
    return nullptr;
  }
  if (access(source.c_str(), R_OK) == -1) {
    *error_msg = absl::StrCat("source file not readable: ", source);
    return nullptr;
  }

  std::string compiler;
  try {
    compiler = util::which(config_.compiler);
  } catch (const std::runtime_error& exc) {
    *error_msg =
        absl::StrCat("compiler not found: ", config_.compiler, ": ", exc.what());
    return nullptr;
  }
  if (compiler.empty()) {
    *error_msg = absl::StrCat("compiler not found: ", config_.compiler);
    return nullptr;
  }

  std::unique_ptr<util::TempDir> tmp;
  // The sandbox changes directory before running the compiler.
  std::string dir;
  try {
    tmp.reset(new util::TempDir(
        config_.temp_directory,
        absl::StrCat("compile_", SanitizeOwner(submission.owner()), "_")));
    dir = util::File::AbsolutePath(tmp->Path());
  } catch (const std::system_error& exc) {
    *error_msg = absl::StrCat("cannot create the compilation directory in ",
                              config_.temp_directory, ": ", exc.what());
    return nullptr;
  }
  if (config_.keep_sandboxes) tmp->Keep();
  std::string executable = util::File::JoinPath(dir, kExecutableName);

  sandbox::ExecutionOptions options(dir, compiler);
  options.args = config_.compiler_args;
  options.args.push_back("-o");
  options.args.push_back(executable);
  options.args.push_back(source);
  options.stdout_file = util::File::JoinPath(dir, "compiler.stdout");
  options.stderr_file = util::File::JoinPath(dir, "compiler.stderr");
  options.wall_limit_millis = config_.compile_timeout_millis;
  options.stop = stop;

  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) {
    *error_msg = "no sandbox available to run the compiler";
    return nullptr;
  }
  VLOG(1) << "Compiling " << source << " for " << submission.owner() << ": "
          << compiler << " " << absl::StrJoin(options.args, " ");
  sandbox::ExecutionInfo info;
  std::string sandbox_error;
  if (!sb->Execute(options, &info, &sandbox_error)) {
    *error_msg = absl::StrCat("cannot run the compiler: ", sandbox_error);
    return nullptr;
  }
  std::vector<std::string> diagnostics =
      ReadDiagnostics(options.stderr_file, options.stdout_file);
  if (info.killed) {
    *error_msg = info.stopped ? "compilation stopped"
                              : absl::StrCat("compilation timed out after ",
                                             config_.compile_timeout_millis,
                                             "ms");
    return nullptr;
  }
  if (info.signal != 0 || info.status_code != 0 ||
      util::File::Size(executable) < 0) {
    *error_msg = diagnostics.empty() ? absl::StrCat("compiler failed: ",
                                                    info.message)
                                     : absl::StrJoin(diagnostics, "\n");
    return nullptr;
  }
  if (!sb->PrepareForExecution(executable, error_msg)) return nullptr;
  return std::unique_ptr<CompiledArtifact>(new CompiledArtifact(
      submission.owner(), std::move(*tmp), executable, std::move(diagnostics)));
}

}  // namespace judge
