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

#include <pocods/ErrorCode.h>
#include <pocods/os/Utils.h>
#include <pocods/pocolog/Index.h>
#include <pocods/test/helpers/PocodsTestsHelpers.h>

using namespace std;
using namespace pocods;
using namespace pocods::pocolog;
using namespace pocods::test;

struct PocologIndexTest : testing::Test {
  const string kFolder = makeTestFolder("pocolog_index_test");
};

TEST_F(PocologIndexTest, defaultIndexFilename) {
  EXPECT_EQ(defaultIndexFilename("/logs/task.0.log"), "/logs/task.0.idx");
  EXPECT_EQ(
      defaultIndexFilename("/logs/task.0.log", "/cache/pocolog"), "/cache/pocolog/task.0.idx");
}

TEST_F(PocologIndexTest, rebuildAndRead) {
  const string logPath = os::pathJoin(kFolder, "task.0.log");
  ASSERT_EQ(
      createPocologFile(
          logPath,
          {makeTaskStream("task", "a", {{10, 100, 1}, {30, 300, 3}}),
           makeTaskStream("task", "b", {{20, 200, 2}})}),
      0);
  const string indexPath = defaultIndexFilename(logPath);
  EXPECT_FALSE(isIndexValid(logPath, indexPath));
  ASSERT_EQ(rebuildIndex(logPath, indexPath), 0);
  EXPECT_TRUE(isIndexValid(logPath, indexPath));

  IndexInfo info;
  ASSERT_EQ(readIndex(indexPath, info), 0);
  EXPECT_EQ(info.logFileSize, static_cast<uint64_t>(os::getFileSize(logPath)));
  ASSERT_EQ(info.streams.size(), 2);
  const IndexedStream& a = info.streams[0];
  EXPECT_EQ(a.index, 0);
  EXPECT_EQ(a.sampleCount, 2);
  EXPECT_EQ(a.rtFirst, 10);
  EXPECT_EQ(a.rtLast, 30);
  EXPECT_EQ(a.lgFirst, 100);
  EXPECT_EQ(a.lgLast, 300);
  EXPECT_EQ(a.logicalTimes, (vector<int64_t>{100, 300}));
  EXPECT_EQ(a.blockOffsets.size(), 2);
  EXPECT_EQ(info.streams[1].sampleCount, 1);
}

TEST_F(PocologIndexTest, staleIndex) {
  const string logPath = os::pathJoin(kFolder, "stale.0.log");
  ASSERT_EQ(createPocologFile(logPath, {makeTaskStream("task", "a", {{10, 100, 1}})}), 0);
  const string indexPath = defaultIndexFilename(logPath);
  ASSERT_EQ(rebuildIndex(logPath, indexPath), 0);
  EXPECT_TRUE(isIndexValid(logPath, indexPath));

  // the log file changes
  ASSERT_EQ(
      createPocologFile(logPath, {makeTaskStream("task", "a", {{10, 100, 1}, {20, 200, 2}})}), 0);
  EXPECT_FALSE(isIndexValid(logPath, indexPath));

  // an index that isn't one
  ASSERT_EQ(createTextFile(indexPath, "garbage"), 0);
  EXPECT_FALSE(isIndexValid(logPath, indexPath));
  IndexInfo info;
  EXPECT_EQ(readIndex(indexPath, info), INVALID_INDEX_FILE);
}

TEST_F(PocologIndexTest, notALogFile) {
  const string logPath = os::pathJoin(kFolder, "text.0.log");
  ASSERT_EQ(createTextFile(logPath, "some text"), 0);
  EXPECT_EQ(rebuildIndex(logPath, defaultIndexFilename(logPath)), NOT_A_POCOLOG_FILE);
}
