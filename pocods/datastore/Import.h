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

#include <cstdint>

#include <string>
#include <vector>

#include <pocods/datastore/Dataset.h>
#include <pocods/datastore/Datastore.h>

namespace pocods {

class Reporter;

namespace datastore {

using std::string;
using std::vector;

/// What to do with the entries of a directory to import.
struct ImportPlan {
  vector<string> pocologFiles;
  vector<string> textFiles;
  vector<string> robyEventLogs;
  /// Files & folders that are not part of a log session, copied in the dataset's ignored folder.
  vector<string> remaining;
};

/// \brief Import log sessions in a datastore.
///
/// An import goes through three stages:
/// - staged: the dataset is normalized in a fresh incoming directory of the store,
/// - validated: its digest is checked against the datasets of the store,
/// - stored: it is moved at its final place in the store.
/// Validation & storage are done while holding the store's lock.
class Import {
 public:
  /// Name of the file written in imported directories, to remember their import.
  static constexpr const char* kImportInfoFilename = ".pocods-import";
  static constexpr const char* kRobyInfoFilename = "info.yml";
  static constexpr const char* kRobyMetadataPrefix = "roby:";

  explicit Import(Datastore& datastore) : datastore_{datastore} {}
  virtual ~Import();

  /// Classify the entries of a directory.
  /// Index files of pocolog files & Roby event logs are left out, as are hidden entries.
  /// @return 0 on success, MULTIPLE_EVENT_LOGS if the directory has more than one event log, or
  /// an error code.
  static int prepareImport(const string& dir, ImportPlan& outPlan);

  /// Import directories as a single dataset.
  /// @param dirs: the directories of the log session.
  /// @param force: replace a dataset with the same digest, if there is one in the store.
  /// @param reporter: to report messages & progress.
  /// @param outDataset: on success, the dataset at its final place in the store. If the dataset
  /// is in the store already, the staged dataset, to tell its digest.
  /// @param keepRejected: if the dataset is in the store already, leave the staged dataset in its
  /// incoming directory for inspection. Otherwise, it is deleted.
  /// @return 0 on success, DATASET_ALREADY_EXISTS, or an error code.
  int import(
      const vector<string>& dirs,
      bool force,
      Reporter& reporter,
      Dataset& outDataset,
      bool keepRejected = true);

  /// Normalize the content of directories in a dataset directory structure.
  /// The dataset is not imported in the store.
  /// @param dirs: the directories of the log session.
  /// @param outputDir: the dataset's core directory.
  /// @param cacheDir: the dataset's cache directory.
  /// @param outDataset: the new dataset, with its identity manifest & metadata written.
  /// @return 0 on success, or an error code.
  virtual int normalizeDataset(
      const vector<string>& dirs,
      const string& outputDir,
      const string& cacheDir,
      Reporter& reporter,
      Dataset& outDataset);

  /// Verify that a dataset can be stored.
  /// If force is true, a stored dataset with the same digest is accepted, to be replaced by
  /// moveDatasetToStore.
  /// @return 0 if the dataset can be stored, DATASET_ALREADY_EXISTS, or an error code.
  int validateDatasetImport(const Dataset& dataset, bool force, Reporter& reporter);

  /// Move a dataset at its place in the store.
  /// A stored dataset with the same digest is moved next to the dataset's core directory, and
  /// deleted once the new dataset is in place.
  /// If the cache can't be moved, the dataset's core directory is moved back, and the replaced
  /// dataset restored.
  /// @param dataset: the dataset to move.
  /// @param outDataset: the dataset at its final place.
  /// @return 0 on success, or STORE_MOVE_ERROR.
  virtual int moveDatasetToStore(const Dataset& dataset, Dataset& outDataset);

  /// Add the first entry of a Roby info.yml file in a dataset's metadata.
  /// Keys are prefixed with "roby:". A file that can't be parsed is reported as a warning.
  static void importRobyMetadata(Dataset& dataset, const string& infoPath, Reporter& reporter);

  /// Find if a directory was imported already.
  /// @param outDigest: set to the digest of the last import.
  /// @param outTime: set to the time of the last import, in seconds since epoch.
  /// @return True if the directory has import information.
  static bool findImportInfo(const string& dir, string& outDigest, int64_t& outTime);
  /// Save the import information of a directory, for findImportInfo.
  static int saveImportInfo(const string& dir, const Dataset& dataset, int64_t time);

 private:
  int copyRobyEventLog(const string& outputDir, const string& eventLog);
  int copyTextFiles(const string& outputDir, const vector<string>& files);
  int copyIgnoredEntries(const string& outputDir, const vector<string>& entries);

  Datastore& datastore_;
};

} // namespace datastore
} // namespace pocods
