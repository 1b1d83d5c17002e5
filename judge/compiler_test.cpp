#include "judge/compiler.hpp"

#include <dirent.h>
#include <stdlib.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::StartsWith;

const std::string test_tmpdir = "/tmp/batchgrader_testdir";

std::vector<std::string> ListEntries(const std::string& path) {
  std::vector<std::string> entries;
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) return entries;
  while (struct dirent* entry = readdir(dir)) {
    std::string name = entry->d_name;
    if (name != "." && name != "..") entries.push_back(name);
  }
  closedir(dir);
  return entries;
}

class CompilerTest : public ::testing::Test {
 protected:
  CompilerTest() : tmp_(test_tmpdir, "compiler_") {
    config_.temp_directory = util::File::JoinPath(tmp_.Path(), "temp");
    config_.test_search_locations.push_back(tmp_.Path());
  }

  proto::Submission MakeSubmission(const std::string& owner,
                                   const std::string& source) {
    std::string path = util::File::JoinPath(tmp_.Path(), owner + ".cpp");
    util::File::Write(path, source);
    proto::Submission submission;
    submission.set_owner(owner);
    submission.set_task_id("sum");
    submission.set_source_path(path);
    return submission;
  }

  util::TempDir tmp_;
  judge::Configuration config_;
};

// NOLINTNEXTLINE
TEST_F(CompilerTest, CompileOk) {
  judge::Compiler compiler(config_);
  proto::Submission submission =
      MakeSubmission("alice", "int main() { return 0; }\n");
  std::string error_msg;
  std::string directory;
  {
    std::unique_ptr<judge::CompiledArtifact> artifact =
        compiler.Compile(submission, nullptr, &error_msg);
    ASSERT_TRUE(artifact) << error_msg;
    EXPECT_EQ(artifact->Owner(), "alice");
    EXPECT_THAT(util::File::BaseName(artifact->Directory()),
                StartsWith("compile_alice_"));
    EXPECT_GT(util::File::Size(artifact->Executable()), 0);
    directory = artifact->Directory();
    EXPECT_TRUE(util::File::IsDirectory(directory));
  }
  EXPECT_FALSE(util::File::IsDirectory(directory));
}

// NOLINTNEXTLINE
TEST_F(CompilerTest, DistinctDirectories) {
  judge::Compiler compiler(config_);
  proto::Submission submission =
      MakeSubmission("bob", "int main() { return 0; }\n");
  std::string error_msg;
  auto first = compiler.Compile(submission, nullptr, &error_msg);
  auto second = compiler.Compile(submission, nullptr, &error_msg);
  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  EXPECT_NE(first->Directory(), second->Directory());
}

// NOLINTNEXTLINE
TEST_F(CompilerTest, CompileError) {
  judge::Compiler compiler(config_);
  proto::Submission submission =
      MakeSubmission("carol", "int main() { return 0 }\n");
  std::string error_msg;
  EXPECT_FALSE(compiler.Compile(submission, nullptr, &error_msg));
  EXPECT_THAT(error_msg, HasSubstr("error"));
  EXPECT_THAT(ListEntries(config_.temp_directory), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(CompilerTest, MissingSource) {
  judge::Compiler compiler(config_);
  proto::Submission submission;
  submission.set_owner("dave");
  submission.set_task_id("sum");
  submission.set_source_path(tmp_.Path() + "/nope.cpp");
  std::string error_msg;
  EXPECT_FALSE(compiler.Compile(submission, nullptr, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("source file not readable"));
}

// NOLINTNEXTLINE
TEST_F(CompilerTest, MissingCompiler) {
  config_.compiler = "batchgrader-no-such-compiler";
  judge::Compiler compiler(config_);
  proto::Submission submission =
      MakeSubmission("erin", "int main() { return 0; }\n");
  std::string error_msg;
  EXPECT_FALSE(compiler.Compile(submission, nullptr, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("compiler not found"));
}

// NOLINTNEXTLINE
TEST_F(CompilerTest, PathNotSet) {
  config_.compiler = "batchgrader-compiler-without-path";
  judge::Compiler compiler(config_);
  proto::Submission submission =
      MakeSubmission("hank", "int main() { return 0; }\n");
  const char* path = getenv("PATH");
  std::string saved_path = path == nullptr ? "" : path;
  unsetenv("PATH");
  std::string error_msg;
  std::unique_ptr<judge::CompiledArtifact> artifact;
  EXPECT_NO_THROW(artifact = compiler.Compile(submission, nullptr, &error_msg));
  setenv("PATH", saved_path.c_str(), 1);
  EXPECT_FALSE(artifact);
  EXPECT_THAT(error_msg, StartsWith("compiler not found"));
}

// NOLINTNEXTLINE
TEST_F(CompilerTest, UnusableTempDirectory) {
  std::string blocker = util::File::JoinPath(tmp_.Path(), "blocker");
  util::File::Write(blocker, "");
  config_.temp_directory = util::File::JoinPath(blocker, "temp");
  judge::Compiler compiler(config_);
  proto::Submission submission =
      MakeSubmission("ivy", "int main() { return 0; }\n");
  std::string error_msg;
  std::unique_ptr<judge::CompiledArtifact> artifact;
  EXPECT_NO_THROW(artifact = compiler.Compile(submission, nullptr, &error_msg));
  EXPECT_FALSE(artifact);
  EXPECT_THAT(error_msg, StartsWith("cannot create the compilation directory"));
}

// NOLINTNEXTLINE
TEST_F(CompilerTest, CompilationTimeout) {
  config_.compile_timeout_millis = 1;
  judge::Compiler compiler(config_);
  proto::Submission submission =
      MakeSubmission("frank", "#include <iostream>\nint main() {}\n");
  std::string error_msg;
  EXPECT_FALSE(compiler.Compile(submission, nullptr, &error_msg));
  EXPECT_THAT(error_msg, HasSubstr("timed out"));
  EXPECT_THAT(ListEntries(config_.temp_directory), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(CompilerTest, OwnerIsSanitized) {
  judge::Compiler compiler(config_);
  proto::Submission submission =
      MakeSubmission("gina", "int main() { return 0; }\n");
  submission.set_owner("../gina x");
  std::string error_msg;
  auto artifact = compiler.Compile(submission, nullptr, &error_msg);
  ASSERT_TRUE(artifact) << error_msg;
  EXPECT_THAT(util::File::BaseName(artifact->Directory()),
              StartsWith("compile____gina_x_"));
}

}  // namespace
