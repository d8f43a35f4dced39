#include "util/file.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using namespace util;

const constexpr char* kTestDir = "/tmp/code_runner_testdir";

TEST(FileTest, TestJoinPath) {
  EXPECT_EQ(File::JoinPath("a", "b"), "a/b");
  EXPECT_EQ(File::JoinPath("a", "/b"), "/b");
}

TEST(FileTest, TestBaseDir) {
  EXPECT_EQ(File::BaseDir("/a/b/c"), "/a/b");
}

TEST(FileTest, TestWriteAndRead) {
  TempDir tmp(kTestDir);
  std::string path = File::JoinPath(tmp.Path(), "dir/file");
  File::Write(path, std::string("con\0tents", 9));
  EXPECT_EQ(File::Read(path), std::string("con\0tents", 9));
  EXPECT_EQ(File::Size(path), 9);
  EXPECT_TRUE(File::Exists(path));
}

TEST(FileTest, TestWriteExisting) {
  TempDir tmp(kTestDir);
  std::string path = File::JoinPath(tmp.Path(), "file");
  File::Write(path, "a");
  EXPECT_THROW(File::Write(path, "b"), file_exists);
  File::Write(path, "b", /*overwrite = */ true);
  EXPECT_EQ(File::Read(path), "b");
}

TEST(FileTest, TestReadMissing) {
  TempDir tmp(kTestDir);
  EXPECT_THROW(File::Read(File::JoinPath(tmp.Path(), "missing")),
               file_not_found);
  EXPECT_LT(File::Size(File::JoinPath(tmp.Path(), "missing")), 0);
}

TEST(FileTest, TestReadTruncated) {
  TempDir tmp(kTestDir);
  std::string path = File::JoinPath(tmp.Path(), "file");
  File::Write(path, std::string(100000, 'x'));
  bool truncated = false;
  EXPECT_EQ(File::Read(path, 10, &truncated), std::string(10, 'x'));
  EXPECT_TRUE(truncated);
  truncated = false;
  EXPECT_EQ(File::Read(path, 100000, &truncated).size(), 100000);
  EXPECT_FALSE(truncated);
}

TEST(FileTest, TestRemoveTree) {
  TempDir tmp(kTestDir);
  std::string dir = File::JoinPath(tmp.Path(), "tree");
  File::Write(File::JoinPath(dir, "a/b/c"), "c");
  File::Write(File::JoinPath(dir, "d"), "d");
  File::RemoveTree(dir);
  EXPECT_FALSE(File::Exists(dir));
}

TEST(TempDirTest, TestRemovedOnDestruction) {
  std::string path;
  {
    TempDir tmp(kTestDir);
    path = tmp.Path();
    File::Write(File::JoinPath(path, "file"), "x");
    EXPECT_TRUE(File::Exists(path));
  }
  EXPECT_FALSE(File::Exists(path));
}

TEST(TempDirTest, TestKeep) {
  std::string path;
  {
    TempDir tmp(kTestDir);
    tmp.Keep();
    path = tmp.Path();
  }
  EXPECT_TRUE(File::Exists(path));
  File::RemoveTree(path);
}

TEST(TempDirTest, TestMove) {
  std::string path;
  {
    TempDir tmp(kTestDir);
    path = tmp.Path();
    TempDir moved(std::move(tmp));
    EXPECT_EQ(moved.Path(), path);
  }
  EXPECT_FALSE(File::Exists(path));
}

}  // namespace
