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


#include <algorithm>

#include <gtest/gtest.h>

#include <pocods/ErrorCode.h>
#include <pocods/datastore/Datastore.h>
#include <pocods/os/FileLock.h>
#include <pocods/os/Utils.h>
#include <pocods/test/helpers/PocodsTestsHelpers.h>

using namespace std;
using namespace pocods;
using namespace pocods::datastore;
using namespace pocods::test;

struct DatastoreTest : testing::Test {
  const string kStorePath = makeTestFolder("datastore_test");
  RecordingReporter reporter;

  void SetUp() override {
    ASSERT_EQ(Datastore::create(kStorePath), 0);
  }

  // Store a dataset with a single text file
  string storeDataset(Datastore& store, const string& content) {
    const string staging = os::pathJoin(kStorePath, "staging");
    EXPECT_EQ(createTextFile(os::pathJoin(staging, "text", "notes.txt"), content), 0);
    Dataset dataset(staging);
    EXPECT_EQ(dataset.writeIdentityManifest(reporter), 0);
    EXPECT_EQ(os::rename(staging, store.corePathOf(dataset.getDigest())), 0);
    return dataset.getDigest();
  }
};

TEST_F(DatastoreTest, layout) {
  EXPECT_TRUE(os::isDir(os::pathJoin(kStorePath, "core")));
  EXPECT_TRUE(os::isDir(os::pathJoin(kStorePath, "cache")));
  EXPECT_TRUE(os::isDir(os::pathJoin(kStorePath, "incoming")));
  Datastore store(kStorePath);
  EXPECT_EQ(store.corePathOf("abc"), os::pathJoin(kStorePath, "core", "abc"));
  EXPECT_EQ(store.cachePathOf("abc"), os::pathJoin(kStorePath, "cache", "abc"));
  EXPECT_FALSE(store.has(""));
  EXPECT_FALSE(store.has("abc"));
}

TEST_F(DatastoreTest, datasets) {
  Datastore store(kStorePath);
  const string digest1 = storeDataset(store, "one");
  const string digest2 = storeDataset(store, "two");
  ASSERT_EQ(os::makeDirectories(os::pathJoin(kStorePath, "incoming", "0", "core")), 0);
  EXPECT_TRUE(store.has(digest1));

  vector<string> digests;
  ASSERT_EQ(store.listDigests(digests), 0);
  vector<string> expected = {digest1, digest2};
  sort(expected.begin(), expected.end());
  EXPECT_EQ(digests, expected);

  Dataset dataset;
  ASSERT_EQ(store.getDataset(digest1, dataset), 0);
  EXPECT_EQ(dataset.getDigest(), digest1);
  EXPECT_EQ(dataset.getCachePath(), store.cachePathOf(digest1));
  EXPECT_EQ(dataset.getIdentity().size(), 1);

  // a dataset stored under the wrong digest
  ASSERT_EQ(os::rename(store.corePathOf(digest2), store.corePathOf("mismatch")), 0);
  EXPECT_EQ(store.getDataset("mismatch", dataset), INVALID_DATASET);

  ASSERT_EQ(os::makeDirectories(store.cachePathOf(digest1)), 0);
  ASSERT_EQ(store.deleteDataset(digest1), 0);
  EXPECT_FALSE(store.has(digest1));
  EXPECT_FALSE(os::pathExists(store.cachePathOf(digest1)));
  EXPECT_EQ(store.deleteDataset(digest1), DATASET_NOT_FOUND);
  EXPECT_EQ(store.getDataset(digest1, dataset), DATASET_NOT_FOUND);
}

TEST_F(DatastoreTest, incoming) {
  Datastore store(kStorePath);
  ASSERT_EQ(os::makeDirectories(os::pathJoin(kStorePath, "incoming", "0")), 0);
  string workCore;
  string workCache;
  int status = store.inIncoming(
      [&workCore, &workCache](const string& corePath, const string& cachePath, bool&) {
        workCore = corePath;
        workCache = cachePath;
        EXPECT_TRUE(os::isDir(corePath));
        EXPECT_TRUE(os::isDir(cachePath));
        return DATASET_ALREADY_EXISTS;
      });
  EXPECT_EQ(status, DATASET_ALREADY_EXISTS);
  EXPECT_EQ(workCore, os::pathJoin(kStorePath, "incoming", "1", "core"));
  EXPECT_EQ(workCache, os::pathJoin(kStorePath, "incoming", "1", "cache"));
  EXPECT_FALSE(os::pathExists(os::pathJoin(kStorePath, "incoming", "1")));

  status = store.inIncoming([](const string&, const string&, bool& outKeep) {
    outKeep = true;
    return 0;
  });
  ASSERT_EQ(status, 0);
  EXPECT_TRUE(os::isDir(os::pathJoin(kStorePath, "incoming", "1", "core")));
}

TEST_F(DatastoreTest, lock) {
  Datastore store(kStorePath);
  os::FileLock lock;
  ASSERT_EQ(store.lock(lock), 0);
  EXPECT_TRUE(lock.isLocked());
  EXPECT_TRUE(os::isFile(os::pathJoin(kStorePath, "lock")));
  EXPECT_EQ(lock.unlock(), 0);
  EXPECT_FALSE(lock.isLocked());
}
