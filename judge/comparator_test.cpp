#include "judge/comparator.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using judge::Comparator;

const std::string test_tmpdir = "/tmp/batchgrader_testdir";

// NOLINTNEXTLINE
TEST(Comparator, Normalize) {
  EXPECT_EQ(Comparator::Normalize("  a\r\nb\r\n\n"), "a\nb");
  EXPECT_EQ(Comparator::Normalize("\t\n "), "");
  EXPECT_EQ(Comparator::Normalize("a  b"), "a  b");
}

// NOLINTNEXTLINE
TEST(Comparator, TrailingWhitespaceIgnored) {
  EXPECT_TRUE(Comparator::EqualContents("s\n0\n", "s\n0"));
  EXPECT_TRUE(Comparator::EqualContents("s\r\n0\r\n", "s\n0\n"));
  EXPECT_TRUE(Comparator::EqualContents("\n\ns\n0", "s\n0   \n"));
}

// NOLINTNEXTLINE
TEST(Comparator, InnerDifferencesMatter) {
  EXPECT_FALSE(Comparator::EqualContents("s\n0", "s\n1"));
  EXPECT_FALSE(Comparator::EqualContents("s 0", "s  0"));
  EXPECT_FALSE(Comparator::EqualContents("s\n\n0", "s\n0"));
  EXPECT_FALSE(Comparator::EqualContents("", "0"));
}

// NOLINTNEXTLINE
TEST(Comparator, Files) {
  util::TempDir tmp(test_tmpdir, "cmp_");
  util::File::Write(tmp.Path() + "/a", "500\r\n800\r\n");
  util::File::Write(tmp.Path() + "/b", "500\n800");
  util::File::Write(tmp.Path() + "/c", "500\n801");
  EXPECT_TRUE(Comparator::Equal(tmp.Path() + "/a", tmp.Path() + "/b"));
  EXPECT_FALSE(Comparator::Equal(tmp.Path() + "/a", tmp.Path() + "/c"));
}

// NOLINTNEXTLINE
TEST(Comparator, MissingFileNeverMatches) {
  util::TempDir tmp(test_tmpdir, "cmp_");
  util::File::Write(tmp.Path() + "/a", "");
  EXPECT_FALSE(Comparator::Equal(tmp.Path() + "/a", tmp.Path() + "/nope"));
  EXPECT_FALSE(Comparator::Equal(tmp.Path() + "/nope", tmp.Path() + "/a"));
}

}  // namespace
