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

#include <pocods/DiskFile.h>
#include <pocods/datastore/IndexBuild.h>
#include <pocods/os/Utils.h>
#include <pocods/roby/EventLog.h>
#include <pocods/test/helpers/PocodsTestsHelpers.h>

using namespace std;
using namespace pocods;
using namespace pocods::datastore;
using namespace pocods::test;

namespace {

class CountingPocologIndexer : public PocologIndexer {
 public:
  explicit CountingPocologIndexer(int& rebuildCount) : rebuildCount_{rebuildCount} {}

  int rebuildIndex(const string& logPath, const string& indexPath) override {
    rebuildCount_++;
    return PocologIndexer::rebuildIndex(logPath, indexPath);
  }

 private:
  int& rebuildCount_;
};

} // namespace

struct IndexBuildTest : testing::Test {
  const string kFolder = makeTestFolder("index_build_test");
  const string kCore = os::pathJoin(kFolder, "core");
  const string kCache = os::pathJoin(kFolder, "cache");
  RecordingReporter reporter;
};

TEST_F(IndexBuildTest, emptyDataset) {
  ASSERT_EQ(os::makeDirectories(kCore), 0);
  Dataset dataset(kCore, kCache);
  IndexBuild indexBuild(dataset);
  ASSERT_EQ(indexBuild.rebuildAll(false, reporter), 0);
  EXPECT_TRUE(os::isDir(os::pathJoin(kCache, "pocolog")));
}

TEST_F(IndexBuildTest, rebuildAll) {
  ASSERT_EQ(
      createPocologFile(
          os::pathJoin(kCore, "pocolog", "task::a.0.log"),
          {makeTaskStream("task", "a", {{1, 1, 1}})}),
      0);
  ASSERT_EQ(createRobyEventLog(os::pathJoin(kCore, "roby-events.0.log")), 0);
  ASSERT_EQ(
      createRobyEventLog(
          os::pathJoin(kCore, "roby-events.1.log"), roby::kEventLogFormatVersion - 1),
      0);
  ASSERT_EQ(createTextFile(os::pathJoin(kCore, "roby-events.2.log"), "not an event log"), 0);

  Dataset dataset(kCore, kCache);
  int rebuildCount = 0;
  IndexBuild indexBuild(
      dataset, make_unique<CountingPocologIndexer>(rebuildCount), make_unique<RobyIndexer>());
  ASSERT_EQ(indexBuild.rebuildAll(false, reporter), 0);
  EXPECT_TRUE(os::isFile(os::pathJoin(kCache, "pocolog", "task::a.0.idx")));
  EXPECT_TRUE(os::isFile(os::pathJoin(kCache, "roby-events.0-index.log")));
  EXPECT_FALSE(os::isFile(os::pathJoin(kCache, "roby-events.1-index.log")));
  EXPECT_FALSE(os::isFile(os::pathJoin(kCache, "roby-events.2-index.log")));
  EXPECT_TRUE(reporter.hasWarning(
      "  roby-events.1.log is in an obsolete Roby log file format, skipping"));
  EXPECT_TRUE(reporter.hasWarning("  roby-events.2.log is not a Roby event log, skipping"));
  EXPECT_EQ(rebuildCount, 1);

  // valid indexes are kept, unless forced
  const string pocologIndex = os::pathJoin(kCache, "pocolog", "task::a.0.idx");
  const string robyIndex = os::pathJoin(kCache, "roby-events.0-index.log");
  string pocologContent;
  string robyContent;
  ASSERT_EQ(DiskFile::readTextFile(pocologIndex, pocologContent), 0);
  ASSERT_EQ(DiskFile::readTextFile(robyIndex, robyContent), 0);
  ASSERT_EQ(indexBuild.rebuildAll(false, reporter), 0);
  EXPECT_EQ(rebuildCount, 1);
  string content;
  ASSERT_EQ(DiskFile::readTextFile(pocologIndex, content), 0);
  EXPECT_EQ(content, pocologContent);
  ASSERT_EQ(DiskFile::readTextFile(robyIndex, content), 0);
  EXPECT_EQ(content, robyContent);
  ASSERT_EQ(indexBuild.rebuildPocologIndexes(true, reporter), 0);
  EXPECT_EQ(rebuildCount, 2);
}

TEST_F(IndexBuildTest, invalidLogFile) {
  ASSERT_EQ(createTextFile(os::pathJoin(kCore, "pocolog", "task::a.0.log"), "garbage"), 0);
  Dataset dataset(kCore, kCache);
  IndexBuild indexBuild(dataset);
  EXPECT_NE(indexBuild.rebuildPocologIndexes(false, reporter), 0);
  EXPECT_EQ(reporter.errors.size(), 1);
}
