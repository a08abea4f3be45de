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


#include <gtest/gtest.h>

#include <pocods/os/FileList.h>
#include <pocods/os/Utils.h>
#include <pocods/pocolog/Compression.h>
#include <pocods/pocolog/LogFile.h>
#include <pocods/test/helpers/PocodsTestsHelpers.h>
#include <pocods/utils/Zstd.h>

using namespace std;
using namespace pocods;
using namespace pocods::pocolog;
using namespace pocods::test;

struct CompressionTest : testing::Test {
  const string kFolder = makeTestFolder("compression_test");
};

TEST_F(CompressionTest, paths) {
  EXPECT_TRUE(isCompressed("a/task.0.log.zst"));
  EXPECT_FALSE(isCompressed("a/task.0.log"));
  EXPECT_EQ(decompressedPath("a/task.0.log.zst", "cache"), "cache/task.0.log");
  EXPECT_EQ(decompressedPath("a/task.0.log", "cache"), "a/task.0.log");
}

TEST_F(CompressionTest, decompressed) {
  const string plain = os::pathJoin(kFolder, "source", "task.0.log");
  ASSERT_EQ(createPocologFile(plain, {makeTaskStream("task", "out", {{1, 1, 1}})}), 0);
  const string compressed = os::pathJoin(kFolder, "task.0.log.zst");
  ASSERT_EQ(utils::compressFile(plain, compressed), 0);

  const string cacheDir = os::pathJoin(kFolder, "cache");
  ASSERT_EQ(os::makeDirectories(cacheDir), 0);
  string path;
  EXPECT_FALSE(findDecompressed(compressed, cacheDir, path));
  ASSERT_EQ(decompressed(compressed, cacheDir, path), 0);
  EXPECT_EQ(path, os::pathJoin(cacheDir, "task.0.log"));
  EXPECT_TRUE(findDecompressed(compressed, cacheDir, path));

  LogFile file;
  ASSERT_EQ(file.open(path), 0);
  EXPECT_EQ(file.getDataBlocks().size(), 1);

  // plain files are used in place
  ASSERT_EQ(decompressed(plain, cacheDir, path), 0);
  EXPECT_EQ(path, plain);
}

TEST_F(CompressionTest, corruptedFile) {
  const string compressed = os::pathJoin(kFolder, "bad.0.log.zst");
  ASSERT_EQ(createTextFile(compressed, "not compressed"), 0);
  const string cacheDir = os::pathJoin(kFolder, "cache");
  ASSERT_EQ(os::makeDirectories(cacheDir), 0);
  string path;
  EXPECT_NE(decompressed(compressed, cacheDir, path), 0);
  // no partial file left behind
  vector<string> files;
  ASSERT_EQ(os::getFilesAndFolders(cacheDir, files), 0);
  EXPECT_TRUE(files.empty());
}
