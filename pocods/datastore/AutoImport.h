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
#include <vector>

#include <pocods/datastore/Datastore.h>
#include <pocods/datastore/Import.h>

namespace pocods {

class Reporter;

namespace datastore {

using std::string;
using std::vector;

struct AutoImportOptions {
  static constexpr double kDefaultMinDuration = 60;

  /// Directories whose streams span less than this logical duration, in seconds, are ignored.
  /// 0 to import all directories.
  double minDuration{kDefaultMinDuration};
  /// Import directories again, even if they were imported already.
  bool force{false};
};

/// \brief Import all the log sessions found in directory trees, one dataset per directory.
///
/// The failure to import a directory is reported, but never stops the batch.
class AutoImport {
 public:
  enum class Result {
    Imported,
    AlreadyImported,
    TooShort,
    Failed,
  };

  AutoImport(Datastore& datastore, Import& import, const AutoImportOptions& options)
      : datastore_{datastore}, import_{import}, options_{options} {}

  /// Tell if a directory has log files: pocolog files, or a Roby event log.
  static bool hasLogFiles(const string& dir);
  /// Find the directories to import: a directory with log files is a candidate, otherwise its
  /// sub-directories are searched.
  static int findCandidates(const string& root, vector<string>& inOutCandidates);

  /// Import each candidate directory found in each root.
  /// @return 0, unless a root can't be searched.
  int run(const vector<string>& roots, Reporter& reporter);
  /// Import a single directory, if it wasn't imported before, and if it lasts long enough.
  /// @param outDigest: if provided, set to the digest of the dataset, when it is known.
  Result importDirectory(const string& dir, Reporter& reporter, string* outDigest = nullptr);

 private:
  Datastore& datastore_;
  Import& import_;
  AutoImportOptions options_;
};

} // namespace datastore
} // namespace pocods
