#include "util/file.hpp"

#include <sys/stat.h>

#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::StartsWith;

const std::string test_tmpdir = "/tmp/batchgrader_testdir";

void writeFile(const std::string& path, const std::string& content) {
  std::ofstream of(path);
  of << content;
}

std::string readFile(const std::string& path) {
  std::ifstream t(path);
  std::string str((std::istreambuf_iterator<char>(t)),
                  std::istreambuf_iterator<char>());
  return str;
}

// NOLINTNEXTLINE
TEST(File, ListFiles) {
  util::TempDir tmp(test_tmpdir);
  util::File::MakeDirs(tmp.Path() + "/sub/deeper");
  writeFile(tmp.Path() + "/b.cpp", "");
  writeFile(tmp.Path() + "/a.cpp", "");
  writeFile(tmp.Path() + "/sub/c.cpp", "");
  writeFile(tmp.Path() + "/sub/deeper/d.cpp", "");

  EXPECT_THAT(util::File::ListFiles(tmp.Path()),
              ElementsAre(tmp.Path() + "/a.cpp", tmp.Path() + "/b.cpp"));
  EXPECT_THAT(util::File::ListFiles(tmp.Path(), true),
              ElementsAre(tmp.Path() + "/a.cpp", tmp.Path() + "/b.cpp",
                          tmp.Path() + "/sub/c.cpp",
                          tmp.Path() + "/sub/deeper/d.cpp"));
}

// NOLINTNEXTLINE
TEST(File, ListFilesEmpty) {
  util::TempDir tmp(test_tmpdir);
  EXPECT_THAT(util::File::ListFiles(tmp.Path()), IsEmpty());
}

// NOLINTNEXTLINE
TEST(File, ListFilesNoSuchDir) {
  EXPECT_THAT(util::File::ListFiles(test_tmpdir + "/nope/nope"), IsEmpty());
}

// NOLINTNEXTLINE
TEST(File, Read) {
  util::TempDir tmp(test_tmpdir);
  writeFile(tmp.Path() + "/file", "foobar");
  EXPECT_EQ(util::File::Read(tmp.Path() + "/file"), "foobar");
}

// NOLINTNEXTLINE
TEST(File, ReadMaxSize) {
  util::TempDir tmp(test_tmpdir);
  writeFile(tmp.Path() + "/file", "foobar");
  EXPECT_EQ(util::File::Read(tmp.Path() + "/file", 3), "foo");
}

// NOLINTNEXTLINE
TEST(File, ReadBigFile) {
  util::TempDir tmp(test_tmpdir);
  std::string content(util::kChunkSize * 3 + 17, 'x');
  writeFile(tmp.Path() + "/file", content);
  EXPECT_EQ(util::File::Read(tmp.Path() + "/file"), content);
}

// NOLINTNEXTLINE
TEST(File, ReadNoSuchFile) {
  util::TempDir tmp(test_tmpdir);
  EXPECT_THROW(util::File::Read(tmp.Path() + "/file"),  // NOLINT
               util::file_not_found);
}

// NOLINTNEXTLINE
TEST(File, Write) {
  util::TempDir tmp(test_tmpdir);
  util::File::Write(tmp.Path() + "/a/b/file", "foobar");
  EXPECT_EQ(readFile(tmp.Path() + "/a/b/file"), "foobar");
}

// NOLINTNEXTLINE
TEST(File, WriteNotOverwrite) {
  util::TempDir tmp(test_tmpdir);
  writeFile(tmp.Path() + "/file", "old");
  EXPECT_THROW(util::File::Write(tmp.Path() + "/file", "new"),  // NOLINT
               util::file_exists);
  EXPECT_EQ(readFile(tmp.Path() + "/file"), "old");
}

// NOLINTNEXTLINE
TEST(File, WriteOverwrite) {
  util::TempDir tmp(test_tmpdir);
  writeFile(tmp.Path() + "/file", "old");
  util::File::Write(tmp.Path() + "/file", "new", true);
  EXPECT_EQ(readFile(tmp.Path() + "/file"), "new");
}

// NOLINTNEXTLINE
TEST(File, MakeDirs) {
  util::TempDir tmp(test_tmpdir);
  util::File::MakeDirs(tmp.Path() + "/x/y/z");
  EXPECT_TRUE(util::File::IsDirectory(tmp.Path() + "/x/y/z"));
  EXPECT_FALSE(util::File::IsDirectory(tmp.Path() + "/x/y/w"));
}

// NOLINTNEXTLINE
TEST(File, PathHelpers) {
  EXPECT_EQ(util::File::JoinPath("a", "b"), "a/b");
  EXPECT_EQ(util::File::JoinPath("a/", "b"), "a/b");
  EXPECT_EQ(util::File::JoinPath("a", "/b"), "/b");
  EXPECT_EQ(util::File::JoinPath("", "b"), "b");
  EXPECT_EQ(util::File::BaseDir("a/b/c.in"), "a/b");
  EXPECT_EQ(util::File::BaseDir("c.in"), ".");
  EXPECT_EQ(util::File::BaseName("a/b/c.in"), "c.in");
  EXPECT_EQ(util::File::BaseName("c.in"), "c.in");
}

// NOLINTNEXTLINE
TEST(File, AbsolutePath) {
  util::TempDir tmp(test_tmpdir);
  writeFile(tmp.Path() + "/file", "");
  std::string abs = util::File::AbsolutePath(tmp.Path() + "/./file");
  EXPECT_THAT(abs, StartsWith("/"));
  EXPECT_EQ(util::File::BaseName(abs), "file");
  EXPECT_THROW(util::File::AbsolutePath(tmp.Path() + "/nope"),  // NOLINT
               util::file_not_found);
}

// NOLINTNEXTLINE
TEST(File, Size) {
  util::TempDir tmp(test_tmpdir);
  writeFile(tmp.Path() + "/file", "12345");
  EXPECT_EQ(util::File::Size(tmp.Path() + "/file"), 5);
  EXPECT_LT(util::File::Size(tmp.Path() + "/nope"), 0);
}

// NOLINTNEXTLINE
TEST(TempDir, RemovedOnDestruction) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir, "prefix_");
    path = tmp.Path();
    EXPECT_THAT(util::File::BaseName(path), StartsWith("prefix_"));
    writeFile(path + "/file", "content");
    EXPECT_TRUE(util::File::IsDirectory(path));
  }
  EXPECT_FALSE(util::File::IsDirectory(path));
}

// NOLINTNEXTLINE
TEST(TempDir, Keep) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir);
    tmp.Keep();
    path = tmp.Path();
  }
  EXPECT_TRUE(util::File::IsDirectory(path));
  util::File::RemoveTree(path);
  EXPECT_FALSE(util::File::IsDirectory(path));
}

// NOLINTNEXTLINE
TEST(TempDir, Move) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir);
    path = tmp.Path();
    util::TempDir moved(std::move(tmp));
    EXPECT_EQ(moved.Path(), path);
    EXPECT_TRUE(tmp.Path().empty());  // NOLINT
  }
  EXPECT_FALSE(util::File::IsDirectory(path));
}

}  // namespace
