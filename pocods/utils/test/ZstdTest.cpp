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


#include <string>

#include <gtest/gtest.h>

#include <pocods/DiskFile.h>
#include <pocods/ErrorCode.h>
#include <pocods/os/Utils.h>
#include <pocods/utils/Zstd.h>

using namespace std;
using namespace pocods;

struct ZstdTest : testing::Test {
  const string kFolder = os::getUniquePath(os::pathJoin(os::getTempFolder(), "zstd_test"));
};

TEST_F(ZstdTest, compressDecompress) {
  ASSERT_EQ(os::makeDirectories(kFolder), 0);
  string content;
  for (int i = 0; i < 100000; i++) {
    content += to_string(i) + ' ';
  }
  const string source = os::pathJoin(kFolder, "source.log");
  const string compressed = source + ".zst";
  const string decompressed = os::pathJoin(kFolder, "decompressed.log");
  ASSERT_EQ(DiskFile::writeTextFile(source, content), 0);

  EXPECT_EQ(utils::compressFile(source, compressed), 0);
  EXPECT_LT(os::getFileSize(compressed), os::getFileSize(source));
  EXPECT_EQ(utils::decompressFile(compressed, decompressed), 0);
  string result;
  EXPECT_EQ(DiskFile::readTextFile(decompressed, result), 0);
  EXPECT_EQ(result, content);
}

TEST_F(ZstdTest, invalidInput) {
  ASSERT_EQ(os::makeDirectories(kFolder), 0);
  const string notCompressed = os::pathJoin(kFolder, "plain.zst");
  ASSERT_EQ(DiskFile::writeTextFile(notCompressed, "this is not zstd data"), 0);
  EXPECT_NE(utils::decompressFile(notCompressed, os::pathJoin(kFolder, "out")), 0);

  // truncated frame
  const string source = os::pathJoin(kFolder, "source");
  ASSERT_EQ(DiskFile::writeTextFile(source, string(10000, 'x')), 0);
  const string compressed = source + ".zst";
  ASSERT_EQ(utils::compressFile(source, compressed), 0);
  string data;
  ASSERT_EQ(DiskFile::readTextFile(compressed, data), 0);
  const string truncated = os::pathJoin(kFolder, "truncated.zst");
  ASSERT_EQ(DiskFile::writeTextFile(truncated, data.substr(0, data.size() - 4)), 0);
  EXPECT_EQ(utils::decompressFile(truncated, os::pathJoin(kFolder, "out2")), NOT_ENOUGH_DATA);

  EXPECT_NE(utils::decompressFile(os::pathJoin(kFolder, "missing.zst"), source), 0);
}
