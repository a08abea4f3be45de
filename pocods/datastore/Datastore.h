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


#pragma once

#include <functional>
#include <string>
#include <vector>

#include <pocods/datastore/Dataset.h>
#include <pocods/os/FileLock.h>

namespace pocods {
namespace datastore {

using std::string;
using std::vector;

/// \brief A content-addressed store of datasets.
///
/// Layout of a datastore:
/// - core/<digest>: the canonical files of each dataset,
/// - cache/<digest>: the rebuildable artifacts of each dataset (indexes, decompressed files),
/// - incoming/<n>: staging areas of imports in progress. Never considered part of the store.
/// - lock: file locked while datasets are validated & moved into the store.
class Datastore {
 public:
  static constexpr const char* kCoreDir = "core";
  static constexpr const char* kCacheDir = "cache";
  static constexpr const char* kIncomingDir = "incoming";
  static constexpr const char* kLockFilename = "lock";

  /// Create a datastore at a path, or make sure its directories exist if it exists already.
  static int create(const string& path);

  explicit Datastore(const string& path) : path_{path} {}

  const string& getPath() const {
    return path_;
  }
  string corePathOf(const string& digest) const;
  string cachePathOf(const string& digest) const;

  /// Tell if a dataset with that digest is in the store.
  bool has(const string& digest) const;
  /// Delete a dataset, both its core & cache directories.
  /// @return 0 on success, DATASET_NOT_FOUND, or an error code.
  int deleteDataset(const string& digest);
  /// Get a dataset from the store, with its identity & metadata loaded.
  int getDataset(const string& digest, Dataset& outDataset) const;
  /// List the digests of the datasets in the store, sorted.
  int listDigests(vector<string>& outDigests) const;

  /// Callback for inIncoming.
  /// @param corePath: the core directory to stage a dataset in.
  /// @param cachePath: the cache directory to stage a dataset in.
  /// @param outKeep: set to true to keep the incoming directory after the callback returns.
  /// @return 0 on success, or an error code.
  using IncomingCallback =
      std::function<int(const string& corePath, const string& cachePath, bool& outKeep)>;
  /// Allocate a new incoming directory, and call the callback with it.
  /// Allocation is safe between processes: a directory already created by someone else is never
  /// reused. The incoming directory is deleted after the callback, unless it asks to keep it.
  /// @return The callback's return value, or an error code.
  int inIncoming(const IncomingCallback& callback);

  /// Lock the store, to validate & move a dataset into it.
  /// @return 0 on success, or STORE_LOCK_ERROR.
  int lock(os::FileLock& outLock) const;

 private:
  string path_;
};

} // namespace datastore
} // namespace pocods
