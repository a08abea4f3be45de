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


#include "IndexBuild.h"

#include <vector>

#include <fmt/format.h>

#define DEFAULT_LOG_CHANNEL "IndexBuild"
#include <logging/Log.h>

#include <pocods/ErrorCode.h>
#include <pocods/Reporter.h>
#include <pocods/helpers/FileMacros.h>
#include <pocods/os/Utils.h>
#include <pocods/pocolog/Compression.h>
#include <pocods/roby/EventLog.h>

using namespace std;

namespace pocods {
namespace datastore {

IndexBuild::IndexBuild(const Dataset& dataset)
    : IndexBuild(dataset, make_unique<PocologIndexer>(), make_unique<RobyIndexer>()) {}

IndexBuild::IndexBuild(
    const Dataset& dataset,
    unique_ptr<LogIndexer> pocologIndexer,
    unique_ptr<LogIndexer> robyIndexer)
    : dataset_{dataset},
      pocologIndexer_{std::move(pocologIndexer)},
      robyIndexer_{std::move(robyIndexer)} {}

int IndexBuild::rebuildAll(bool force, Reporter& reporter) {
  IF_ERROR_RETURN(rebuildPocologIndexes(force, reporter));
  return rebuildRobyIndex(force, reporter);
}

int IndexBuild::rebuildPocologIndexes(bool force, Reporter& reporter) {
  const string cacheDir = dataset_.getPocologCachePath();
  IF_ERROR_LOG_AND_RETURN(os::makeDirectories(cacheDir));

  const vector<string> logFiles = dataset_.getPocologFiles();
  reporter.info(fmt::format("Rebuilding the indexes of {} pocolog files", logFiles.size()));
  for (const string& logFile : logFiles) {
    string plainPath = logFile;
    if (pocolog::isCompressed(logFile) &&
        !pocolog::findDecompressed(logFile, cacheDir, plainPath)) {
      PDS_LOGD("No decompressed copy of {}, not indexing it", logFile);
      continue;
    }
    string indexPath;
    bool rebuilt = false;
    int error =
        ensureIndexValid(*pocologIndexer_, plainPath, cacheDir, force, indexPath, &rebuilt);
    if (error != 0) {
      reporter.error(
          fmt::format("Failed to index {}: {}", plainPath, errorCodeToMessage(error)));
      return error;
    }
    if (rebuilt) {
      PDS_LOGD("Rebuilt {}", indexPath);
    }
  }
  return SUCCESS;
}

int IndexBuild::rebuildRobyIndex(bool force, Reporter& reporter) {
  const string& cacheDir = dataset_.getCachePath();
  IF_ERROR_LOG_AND_RETURN(os::makeDirectories(cacheDir));

  for (const string& eventLog : dataset_.getRobyEventLogs()) {
    uint32_t formatVersion = 0;
    int error = roby::readFormatVersion(eventLog, formatVersion);
    if (error == NOT_A_ROBY_LOG_FILE) {
      reporter.warn(
          fmt::format("  {} is not a Roby event log, skipping", os::getFilename(eventLog)));
      continue;
    }
    IF_ERROR_LOG_AND_RETURN(error);
    if (formatVersion < roby::kEventLogFormatVersion) {
      reporter.warn(fmt::format(
          "  {} is in an obsolete Roby log file format, skipping", os::getFilename(eventLog)));
      continue;
    }
    string indexPath;
    error = ensureIndexValid(*robyIndexer_, eventLog, cacheDir, force, indexPath);
    if (error != 0) {
      reporter.error(
          fmt::format("Failed to index {}: {}", eventLog, errorCodeToMessage(error)));
      return error;
    }
  }
  return SUCCESS;
}

} // namespace datastore
} // namespace pocods
