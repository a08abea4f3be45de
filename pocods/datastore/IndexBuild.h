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

#include <memory>
#include <string>

#include <pocods/datastore/Dataset.h>
#include <pocods/datastore/IndexCache.h>

namespace pocods {

class Reporter;

namespace datastore {

using std::string;
using std::unique_ptr;

/// \brief Rebuild the indexes of a dataset's log files, in the dataset's cache directory.
///
/// Indexes are only rebuilt when missing or out-of-date, unless rebuilding is forced.
class IndexBuild {
 public:
  explicit IndexBuild(const Dataset& dataset);
  /// For tests, to observe or alter the indexing of each log format.
  IndexBuild(
      const Dataset& dataset,
      unique_ptr<LogIndexer> pocologIndexer,
      unique_ptr<LogIndexer> robyIndexer);

  /// Rebuild both the pocolog & Roby indexes.
  int rebuildAll(bool force, Reporter& reporter);
  /// Rebuild the indexes of the dataset's pocolog files, in cache/pocolog.
  /// Compressed files are only indexed when their decompressed copy is in the cache.
  int rebuildPocologIndexes(bool force, Reporter& reporter);
  /// Rebuild the indexes of the dataset's Roby event logs, in the cache directory.
  /// Event logs in an obsolete format are skipped with a warning.
  int rebuildRobyIndex(bool force, Reporter& reporter);

 private:
  const Dataset& dataset_;
  unique_ptr<LogIndexer> pocologIndexer_;
  unique_ptr<LogIndexer> robyIndexer_;
};

} // namespace datastore
} // namespace pocods
