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
#include <pocods/os/FileList.h>
#include <pocods/os/Utils.h>

using namespace std;
using namespace pocods;

static void createFile(const string& path, size_t size) {
  EXPECT_EQ(DiskFile::writeTextFile(path, string(size, 'a')), 0);
}

struct FileListTest : testing::Test {
  FileListTest() {
    for (const string& folder : kTestFolders) {
      EXPECT_EQ(os::makeDirectories(os::pathJoin(kSubTestFolder, folder)), 0);
    }
    for (const auto& files : kTestFiles) {
      createFile(os::pathJoin(kSubTestFolder, files.first), files.second);
    }
  }

  const string kSubTestFolder = os::pathJoin(os::getTempFolder(), "file_list_test");
  const string kLogFilesFolder{"log_files"};
  const vector<string> kTestFolders{kLogFilesFolder};
  const vector<pair<string, size_t>> kTestFiles = {
      {"info.yml", 1},
      {"task.2.log", 2},
      {"task.10.log", 3},
      {"test3.txt", 4},
      {"log_files/test_sub1.log", 42},
      {"log_files/test_sub2.log", 43},
      {"log_files/test_sub3.log", 44},
  };
};

TEST_F(FileListTest, getFilesAndFoldersTest) {
  vector<string> files, folders;
  EXPECT_EQ(os::getFilesAndFolders(kSubTestFolder, files, &folders), 0);
  ASSERT_EQ(files.size(), 4);
  EXPECT_EQ(os::getFilename(files[0]), kTestFiles[0].first);
  // numbers are compared as numbers
  EXPECT_EQ(os::getFilename(files[1]), kTestFiles[1].first);
  EXPECT_EQ(os::getFilename(files[2]), kTestFiles[2].first);
  ASSERT_EQ(folders.size(), 1);
  EXPECT_EQ(os::getFilename(folders[0]), kLogFilesFolder);

  vector<string> files2;
  EXPECT_EQ(os::getFilesAndFolders(kSubTestFolder, files2), 0);
  ASSERT_EQ(files, files2);

  vector<string> missing;
  EXPECT_NE(os::getFilesAndFolders(os::pathJoin(kSubTestFolder, "missing"), missing), 0);
}

TEST_F(FileListTest, getFileListTest) {
  vector<string> files;
  EXPECT_EQ(os::getFileList(kSubTestFolder, files, 1), 0);
  ASSERT_EQ(files.size(), 7);
  EXPECT_EQ(os::getFilename(files[0]), kTestFiles[0].first);
  EXPECT_EQ(os::getFilename(files[1]), kTestFiles[1].first);
  EXPECT_EQ(os::getFilename(files[2]), kTestFiles[2].first);
  int logFilesCount = 0;
  for (const string& file : files) {
    if (os::getFilename(os::getParentFolder(file)) == kLogFilesFolder) {
      logFilesCount++;
    }
    if (os::getFilename(file) == "test_sub2.log") {
      EXPECT_EQ(os::getFileSize(file), 43);
    }
  }
  EXPECT_EQ(logFilesCount, 3);

  vector<string> topFiles;
  EXPECT_EQ(os::getFileList(kSubTestFolder, topFiles, 0), 0);
  EXPECT_EQ(topFiles.size(), 4);
}
