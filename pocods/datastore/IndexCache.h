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

#include <string>

namespace pocods {
namespace datastore {

using std::string;

/// \brief Interface to the index validation & rebuilding logic of a log file format.
class LogIndexer {
 public:
  virtual ~LogIndexer();

  /// Path of the index file of a log file, in an index directory.
  virtual string indexPathOf(const string& logPath, const string& indexDir) const = 0;
  /// Tell if the index file is up-to-date with the log file.
  virtual bool isIndexValid(const string& logPath, const string& indexPath) = 0;
  /// Write the index of the log file at indexPath.
  virtual int rebuildIndex(const string& logPath, const string& indexPath) = 0;
};

/// Indexer for pocolog log files.
class PocologIndexer : public LogIndexer {
 public:
  string indexPathOf(const string& logPath, const string& indexDir) const override;
  bool isIndexValid(const string& logPath, const string& indexPath) override;
  int rebuildIndex(const string& logPath, const string& indexPath) override;
};

/// Indexer for Roby event logs.
class RobyIndexer : public LogIndexer {
 public:
  string indexPathOf(const string& logPath, const string& indexDir) const override;
  bool isIndexValid(const string& logPath, const string& indexPath) override;
  int rebuildIndex(const string& logPath, const string& indexPath) override;
};

/// Make sure that a log file's index exists in an index directory, and is up-to-date.
/// - the index directory is created if needed,
/// - a valid index is left untouched, unless force is true,
/// - otherwise, the index is rebuilt in a temporary file, which then replaces the index.
/// A log file that doesn't exist (yet) is silently skipped.
/// @param indexer: the logic of the log file's format.
/// @param logPath: path of the log file.
/// @param indexDir: directory of the index file.
/// @param force: rebuild the index even if it is valid.
/// @param outIndexPath: set to the path of the index file.
/// @param outRebuilt: if provided, set to true if the index was rebuilt.
/// @return 0 on success, or an error code. On error, no partial index is left.
int ensureIndexValid(
    LogIndexer& indexer,
    const string& logPath,
    const string& indexDir,
    bool force,
    string& outIndexPath,
    bool* outRebuilt = nullptr);

} // namespace datastore
} // namespace pocods
