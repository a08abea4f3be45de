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


#include "AutoImport.h"

#include <fmt/format.h>

#define DEFAULT_LOG_CHANNEL "AutoImport"
#include <logging/Log.h>

#include <pocods/ErrorCode.h>
#include <pocods/Reporter.h>
#include <pocods/helpers/FileMacros.h>
#include <pocods/helpers/Strings.h>
#include <pocods/os/FileList.h>
#include <pocods/os/Time.h>
#include <pocods/os/Utils.h>
#include <pocods/pocolog/Streams.h>

using namespace std;

namespace pocods {
namespace datastore {

namespace {

const int kMaxSearchDepth = 32;

int searchCandidates(const string& dir, vector<string>& inOutCandidates, int depth) {
  if (AutoImport::hasLogFiles(dir)) {
    inOutCandidates.push_back(dir);
    return SUCCESS;
  }
  if (depth >= kMaxSearchDepth) {
    PDS_LOGW("Not searching {}, too deep", dir);
    return SUCCESS;
  }
  vector<string> files;
  vector<string> folders;
  IF_ERROR_LOG_AND_RETURN(os::getFilesAndFolders(dir, files, &folders));
  for (const string& folder : folders) {
    const string name = os::getFilename(folder);
    if (!name.empty() && name[0] != '.') {
      IF_ERROR_RETURN(searchCandidates(folder, inOutCandidates, depth + 1));
    }
  }
  return SUCCESS;
}

} // namespace

bool AutoImport::hasLogFiles(const string& dir) {
  if (!pocolog::logfilesInDir(dir).empty()) {
    return true;
  }
  vector<string> files;
  if (os::getFilesAndFolders(dir, files) != 0) {
    return false;
  }
  for (const string& file : files) {
    if (helpers::endsWith(file, "-events.log")) {
      return true;
    }
  }
  return false;
}

int AutoImport::findCandidates(const string& root, vector<string>& inOutCandidates) {
  if (!os::isDir(root)) {
    PDS_LOGE("{} is not a directory", root);
    return FILE_NOT_FOUND;
  }
  return searchCandidates(root, inOutCandidates, 0);
}

int AutoImport::run(const vector<string>& roots, Reporter& reporter) {
  vector<string> candidates;
  for (const string& root : roots) {
    int error = findCandidates(root, candidates);
    if (error != 0) {
      reporter.error(fmt::format("Can't search {}: {}", root, errorCodeToMessage(error)));
      return error;
    }
  }
  int imported = 0;
  for (const string& dir : candidates) {
    if (importDirectory(dir, reporter) == Result::Imported) {
      imported++;
    }
  }
  PDS_LOGI("Imported {} of {} directories", imported, candidates.size());
  return SUCCESS;
}

AutoImport::Result
AutoImport::importDirectory(const string& dir, Reporter& reporter, string* outDigest) {
  string digest;
  int64_t importTime = 0;
  if (Import::findImportInfo(dir, digest, importTime) && datastore_.has(digest)) {
    if (outDigest != nullptr) {
      *outDigest = digest;
    }
    if (!options_.force) {
      reporter.warn(fmt::format(
          "{} already seem to have been imported as {}. Give --force to import again",
          dir,
          digest));
      return Result::AlreadyImported;
    }
    reporter.warn(fmt::format(
        "{} seem to have already been imported but --force is given, overwriting", dir));
  }

  if (options_.minDuration > 0) {
    NullReporter nullReporter;
    pocolog::Streams streams;
    int error = pocolog::Streams::fromDir(dir, streams, nullReporter);
    if (error != 0) {
      reporter.warn(fmt::format("{} failed to import: {}", dir, errorCodeToMessage(error)));
      return Result::Failed;
    }
    double duration = streams.logicalDuration();
    if (duration < options_.minDuration) {
      reporter.warn(fmt::format("{} lasts only {:.1f}s, ignored", dir, duration));
      return Result::TooShort;
    }
  }

  Dataset dataset;
  // rejected imports get a marker, their staged copy is deleted
  int error = import_.import({dir}, options_.force, reporter, dataset, false);
  if (outDigest != nullptr) {
    *outDigest = dataset.getDigest();
  }
  if (error == DATASET_ALREADY_EXISTS) {
    reporter.warn(fmt::format(
        "{} already seem to have been imported as {}. Give --force to import again",
        dir,
        dataset.getDigest()));
    IF_ERROR_LOG(Import::saveImportInfo(dir, dataset, os::getCurrentTimeSecSinceEpoch()));
    return Result::AlreadyImported;
  }
  if (error != 0) {
    reporter.warn(fmt::format("{} failed to import: {}", dir, errorCodeToMessage(error)));
    return Result::Failed;
  }
  error = Import::saveImportInfo(dir, dataset, os::getCurrentTimeSecSinceEpoch());
  if (error != 0) {
    reporter.warn(fmt::format(
        "Can't save the import information of {}: {}", dir, errorCodeToMessage(error)));
  }
  reporter.info(fmt::format("{} imported as {}", dir, dataset.getDigest()));
  return Result::Imported;
}

} // namespace datastore
} // namespace pocods
