/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */


#include <cerrno>

#include <gtest/gtest.h>

#include <pocods/DiskFile.h>
#include <pocods/os/FileLock.h>
#include <pocods/os/Time.h>
#include <pocods/os/Utils.h>

using namespace std;
using namespace pocods;

struct OsUtilsTest : testing::Test {
  const string kTestFolder = os::getUniquePath(os::pathJoin(os::getTempFolder(), "utils_test"));
};

TEST_F(OsUtilsTest, paths) {
  EXPECT_EQ(os::pathJoin("a", "b"), "a/b");
  EXPECT_EQ(os::pathJoin("a", "b", "c"), "a/b/c");
  EXPECT_EQ(os::pathJoin("a", "b", "c", "d"), "a/b/c/d");
  EXPECT_EQ(os::getFilename("/data/store/core/abc"), "abc");
  EXPECT_EQ(os::getParentFolder("/data/store/core/abc"), "/data/store/core");
  EXPECT_EQ(
      os::getRelativePath("/data/store/core/abc/pocolog/x.0.log", "/data/store/core/abc"),
      "pocolog/x.0.log");
  EXPECT_TRUE(os::isSamePath("/data/store/", "/data/store"));
  EXPECT_TRUE(os::isSamePath("/data/store/core/..", "/data/store"));
  EXPECT_FALSE(os::isSamePath("/data/store/core", "/data/store/cache"));
}

TEST_F(OsUtilsTest, makeNewDir) {
  EXPECT_EQ(os::makeDirectories(kTestFolder), 0);
  EXPECT_EQ(os::makeDirectories(kTestFolder), 0); // exists already
  const string newDir = os::pathJoin(kTestFolder, "0");
  EXPECT_EQ(os::makeNewDir(newDir), 0);
  EXPECT_EQ(os::makeNewDir(newDir), EEXIST);
  EXPECT_EQ(os::makeDir(newDir), 0);
  EXPECT_TRUE(os::isDir(newDir));
  EXPECT_FALSE(os::isFile(newDir));
}

TEST_F(OsUtilsTest, copyAndRemove) {
  const string source = os::pathJoin(kTestFolder, "source");
  ASSERT_EQ(os::makeDirectories(os::pathJoin(source, "sub")), 0);
  ASSERT_EQ(DiskFile::writeTextFile(os::pathJoin(source, "sub", "file.txt"), "hello"), 0);
  const string target = os::pathJoin(kTestFolder, "target");
  EXPECT_EQ(os::copyRecursively(source, target), 0);
  EXPECT_EQ(os::getFileSize(os::pathJoin(target, "sub", "file.txt")), 5);

  // copyFile overwrites
  ASSERT_EQ(DiskFile::writeTextFile(os::pathJoin(source, "other.txt"), "hi"), 0);
  EXPECT_EQ(
      os::copyFile(os::pathJoin(source, "other.txt"), os::pathJoin(target, "sub", "file.txt")), 0);
  EXPECT_EQ(os::getFileSize(os::pathJoin(target, "sub", "file.txt")), 2);

  EXPECT_EQ(os::removeRecursively(target), 0);
  EXPECT_FALSE(os::pathExists(target));
  EXPECT_EQ(os::getFileSize(target), -1);
}

TEST_F(OsUtilsTest, uniquePath) {
  const string base = os::pathJoin(kTestFolder, "file");
  string path1 = os::getUniquePath(base);
  EXPECT_EQ(path1.size(), base.size() + 6);
  EXPECT_EQ(path1.compare(0, base.size() + 1, base + "~"), 0);
  EXPECT_FALSE(os::pathExists(path1));
}

TEST_F(OsUtilsTest, fileLock) {
  ASSERT_EQ(os::makeDirectories(kTestFolder), 0);
  os::FileLock lock;
  EXPECT_FALSE(lock.isLocked());
  EXPECT_EQ(lock.lock(os::pathJoin(kTestFolder, "lock")), 0);
  EXPECT_TRUE(lock.isLocked());
  EXPECT_TRUE(os::isFile(os::pathJoin(kTestFolder, "lock")));
  EXPECT_EQ(lock.unlock(), 0);
  EXPECT_FALSE(lock.isLocked());
}

TEST_F(OsUtilsTest, time) {
  double before = os::getTimestampSec();
  double after = os::getTimestampSec();
  EXPECT_LE(before, after);
  EXPECT_GT(os::getCurrentTimeSecSinceEpoch(), 1600000000);
}
