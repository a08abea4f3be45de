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
#include <pocods/ErrorCode.h>
#include <pocods/Reporter.h>
#include <pocods/datastore/Normalize.h>
#include <pocods/os/FileList.h>
#include <pocods/os/Utils.h>
#include <pocods/pocolog/LogFile.h>
#include <pocods/test/helpers/PocodsTestsHelpers.h>
#include <pocods/utils/Zstd.h>

using namespace std;
using namespace pocods;
using namespace pocods::datastore;
using namespace pocods::test;

namespace {

class ProgressReporter : public NullReporter {
 public:
  void finishProgress() override {
    finalProgress = getProgress();
    finalTotal = getProgressTotal();
    NullReporter::finishProgress();
  }
  uint64_t finalProgress{};
  uint64_t finalTotal{};
};

} // namespace

struct NormalizeTest : testing::Test {
  const string kFolder = makeTestFolder("normalize_test");
  const string kInput = os::pathJoin(kFolder, "input");
  RecordingReporter reporter;

  void createInput() {
    ASSERT_EQ(
        createPocologFile(
            os::pathJoin(kInput, "task.0.log"),
            {makeTaskStream("task", "a", {{1, 100, 1}, {3, 300, 3}}),
             makeTaskStream("task", "b", {{2, 200, 2}})}),
        0);
    ASSERT_EQ(
        createPocologFile(
            os::pathJoin(kInput, "task.1.log"),
            {makeTaskStream("task", "a", {{4, 400, 4}}),
             makeTaskStream("task", "b", {{5, 500, 5}})}),
        0);
  }
};

TEST_F(NormalizeTest, oneFilePerStream) {
  createInput();
  const string outDir = os::pathJoin(kFolder, "out");
  const string cacheDir = os::pathJoin(kFolder, "cache");
  map<string, string> digests;
  ASSERT_EQ(
      normalize(
          {os::pathJoin(kInput, "task.1.log"), os::pathJoin(kInput, "task.0.log")},
          outDir,
          cacheDir,
          true,
          reporter,
          &digests),
      0);

  vector<string> files;
  ASSERT_EQ(os::getFilesAndFolders(outDir, files), 0);
  ASSERT_EQ(files.size(), 2);
  EXPECT_EQ(os::getFilename(files[0]), "task::a.0.log");
  EXPECT_EQ(os::getFilename(files[1]), "task::b.0.log");

  pocolog::LogFile streamA;
  ASSERT_EQ(streamA.open(files[0]), 0);
  ASSERT_EQ(streamA.getStreams().size(), 1);
  EXPECT_EQ(streamA.getStreams()[0].name, "task.a");
  const vector<pocolog::DataBlockInfo>& blocks = streamA.getDataBlocks();
  ASSERT_EQ(blocks.size(), 3);
  // segments are processed in order, whatever the order they were given in
  EXPECT_EQ(blocks[0].logicalTime, 100);
  EXPECT_EQ(blocks[1].logicalTime, 300);
  EXPECT_EQ(blocks[2].logicalTime, 400);

  EXPECT_TRUE(os::isFile(os::pathJoin(cacheDir, "task::a.0.idx")));
  EXPECT_TRUE(os::isFile(os::pathJoin(cacheDir, "task::b.0.idx")));
  ASSERT_EQ(digests.size(), 2);
  EXPECT_EQ(digests[files[0]].size(), 64);
}

TEST_F(NormalizeTest, deterministic) {
  createInput();
  const vector<string> inputs = {
      os::pathJoin(kInput, "task.0.log"), os::pathJoin(kInput, "task.1.log")};
  map<string, string> digests1;
  map<string, string> digests2;
  const string out1 = os::pathJoin(kFolder, "out1");
  const string out2 = os::pathJoin(kFolder, "out2");
  ASSERT_EQ(normalize(inputs, out1, out1, true, reporter, &digests1), 0);
  ASSERT_EQ(normalize(inputs, out2, out2, true, reporter, &digests2), 0);
  for (const char* name : {"task::a.0.log", "task::b.0.log"}) {
    string content1;
    string content2;
    ASSERT_EQ(DiskFile::readTextFile(os::pathJoin(out1, name), content1), 0);
    ASSERT_EQ(DiskFile::readTextFile(os::pathJoin(out2, name), content2), 0);
    EXPECT_EQ(content1, content2);
    EXPECT_EQ(digests1[os::pathJoin(out1, name)], digests2[os::pathJoin(out2, name)]);
  }
}

TEST_F(NormalizeTest, compressedInput) {
  const string plain = os::pathJoin(kFolder, "plain", "task.0.log");
  ASSERT_EQ(createPocologFile(plain, {makeTaskStream("task", "a", {{1, 100, 1}})}), 0);
  const string compressed = os::pathJoin(kInput, "task.0.log.zst");
  ASSERT_EQ(os::makeDirectories(kInput), 0);
  ASSERT_EQ(utils::compressFile(plain, compressed), 0);

  const string outDir = os::pathJoin(kFolder, "out");
  const string cacheDir = os::pathJoin(kFolder, "cache");
  ASSERT_EQ(normalize({compressed}, outDir, cacheDir, false, reporter), 0);
  EXPECT_TRUE(os::isFile(os::pathJoin(cacheDir, "task.0.log")));
  EXPECT_TRUE(os::isFile(os::pathJoin(outDir, "task::a.0.log")));
}

TEST_F(NormalizeTest, compressedInputInOutputDir) {
  const string plain = os::pathJoin(kFolder, "plain", "task.0.log");
  ASSERT_EQ(createPocologFile(plain, {makeTaskStream("task", "a", {{1, 100, 1}})}), 0);
  const string compressed = os::pathJoin(kInput, "task.0.log.zst");
  ASSERT_EQ(os::makeDirectories(kInput), 0);
  ASSERT_EQ(utils::compressFile(plain, compressed), 0);

  // the decompressed input isn't left among the output files
  const string outDir = os::pathJoin(kFolder, "out");
  ASSERT_EQ(normalize({compressed}, outDir, outDir, false, reporter), 0);
  vector<string> files;
  ASSERT_EQ(os::getFilesAndFolders(outDir, files), 0);
  ASSERT_EQ(files.size(), 2);
  EXPECT_EQ(os::getFilename(files[0]), "task::a.0.idx");
  EXPECT_EQ(os::getFilename(files[1]), "task::a.0.log");
}

TEST_F(NormalizeTest, progress) {
  createInput();
  ProgressReporter progressReporter;
  const string outDir = os::pathJoin(kFolder, "out");
  ASSERT_EQ(
      normalize(
          {os::pathJoin(kInput, "task.0.log"), os::pathJoin(kInput, "task.1.log")},
          outDir,
          outDir,
          false,
          progressReporter),
      0);
  const uint64_t inputSize = static_cast<uint64_t>(
      os::getFileSize(os::pathJoin(kInput, "task.0.log")) +
      os::getFileSize(os::pathJoin(kInput, "task.1.log")));
  EXPECT_EQ(progressReporter.finalTotal, inputSize);
  EXPECT_EQ(progressReporter.finalProgress, inputSize);
}

TEST_F(NormalizeTest, followUpMismatch) {
  ASSERT_EQ(
      createPocologFile(os::pathJoin(kInput, "task.0.log"), {makeTaskStream("task", "a")}), 0);
  ASSERT_EQ(
      createPocologFile(
          os::pathJoin(kInput, "task.1.log"), {makeTaskStream("task", "a", {}, "/double")}),
      0);
  const string outDir = os::pathJoin(kFolder, "out");
  EXPECT_EQ(
      normalize(
          {os::pathJoin(kInput, "task.0.log"), os::pathJoin(kInput, "task.1.log")},
          outDir,
          outDir,
          false,
          reporter),
      INVALID_FOLLOWUP_STREAM);
  ASSERT_EQ(reporter.errors.size(), 1);
}
