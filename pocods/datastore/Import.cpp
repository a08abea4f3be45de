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


#include "Import.h"

#include <algorithm>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#define DEFAULT_LOG_CHANNEL "Import"
#include <logging/Log.h>

#include <pocods/DiskFile.h>
#include <pocods/ErrorCode.h>
#include <pocods/Reporter.h>
#include <pocods/datastore/Normalize.h>
#include <pocods/helpers/FileMacros.h>
#include <pocods/helpers/Rapidjson.hpp>
#include <pocods/helpers/Strings.h>
#include <pocods/os/FileList.h>
#include <pocods/os/FileLock.h>
#include <pocods/os/Utils.h>
#include <pocods/pocolog/Compression.h>
#include <pocods/pocolog/Index.h>
#include <pocods/pocolog/Streams.h>

using namespace std;

namespace pocods {
namespace datastore {

namespace {

const char* const kEventLogSuffix = "-events.log";
const char* const kEventIndexSuffix = "-index.log";
const char* const kTextSuffix = ".txt";
const char* const kRobyEventLogPrefix = "roby-events.";

const char* const kDigestKey = "digest";
const char* const kTimeKey = "time";

bool isHidden(const string& path) {
  const string name = os::getFilename(path);
  return !name.empty() && name[0] == '.';
}

string replaceSuffix(const string& path, const string& suffix, const string& replacement) {
  return path.substr(0, path.size() - suffix.size()) + replacement;
}

void addYamlValue(Dataset& dataset, const string& key, const YAML::Node& value) {
  if (value.IsScalar()) {
    dataset.metadataAdd(key, value.Scalar());
  } else if (value.IsSequence()) {
    for (const YAML::Node& element : value) {
      if (element.IsScalar()) {
        dataset.metadataAdd(key, element.Scalar());
      }
    }
  } else if (value.IsMap()) {
    dataset.metadataAdd(key, YAML::Dump(value));
  }
}

} // namespace

Import::~Import() = default;

int Import::prepareImport(const string& dir, ImportPlan& outPlan) {
  outPlan = ImportPlan();
  vector<string> files;
  vector<string> folders;
  IF_ERROR_LOG_AND_RETURN(os::getFilesAndFolders(dir, files, &folders));

  outPlan.pocologFiles = pocolog::logfilesInDir(dir);
  vector<string> indexFiles;
  for (const string& logFile : outPlan.pocologFiles) {
    string plainPath = logFile;
    if (pocolog::isCompressed(logFile)) {
      plainPath = replaceSuffix(logFile, pocolog::kCompressedExtension, "");
    }
    indexFiles.push_back(pocolog::defaultIndexFilename(plainPath));
  }
  for (const string& file : files) {
    if (isHidden(file)) {
      continue;
    }
    if (helpers::endsWith(file, kEventLogSuffix)) {
      outPlan.robyEventLogs.push_back(file);
      indexFiles.push_back(replaceSuffix(file, kEventLogSuffix, kEventIndexSuffix));
    } else if (helpers::endsWith(file, kTextSuffix)) {
      outPlan.textFiles.push_back(file);
    }
  }

  auto isPlanned = [&outPlan, &indexFiles](const string& path) {
    auto contains = [&path](const vector<string>& paths) {
      return find(paths.begin(), paths.end(), path) != paths.end();
    };
    return contains(outPlan.pocologFiles) || contains(outPlan.textFiles) ||
        contains(outPlan.robyEventLogs) || contains(indexFiles);
  };
  vector<string> entries;
  entries.reserve(files.size() + folders.size());
  entries.insert(entries.end(), files.begin(), files.end());
  entries.insert(entries.end(), folders.begin(), folders.end());
  sort(entries.begin(), entries.end());
  for (const string& entry : entries) {
    if (!isHidden(entry) && !isPlanned(entry)) {
      outPlan.remaining.push_back(entry);
    }
  }

  if (outPlan.robyEventLogs.size() > 1) {
    PDS_LOGE("More than one Roby event log found in {}", dir);
    return MULTIPLE_EVENT_LOGS;
  }
  return SUCCESS;
}

int Import::import(
    const vector<string>& dirs,
    bool force,
    Reporter& reporter,
    Dataset& outDataset,
    bool keepRejected) {
  return datastore_.inIncoming(
      [this, &dirs, force, &reporter, &outDataset, keepRejected](
          const string& corePath, const string& cachePath, bool& outKeep) {
        Dataset staged;
        IF_ERROR_RETURN(normalizeDataset(dirs, corePath, cachePath, reporter, staged));

        os::FileLock lock;
        IF_ERROR_LOG_AND_RETURN(datastore_.lock(lock));
        int status = validateDatasetImport(staged, force, reporter);
        if (status == DATASET_ALREADY_EXISTS) {
          outKeep = keepRejected;
          outDataset = staged;
          return status;
        }
        IF_ERROR_RETURN(status);
        return moveDatasetToStore(staged, outDataset);
      });
}

int Import::normalizeDataset(
    const vector<string>& dirs,
    const string& outputDir,
    const string& cacheDir,
    Reporter& reporter,
    Dataset& outDataset) {
  ImportPlan plan;
  for (const string& dir : dirs) {
    ImportPlan dirPlan;
    IF_ERROR_RETURN(prepareImport(dir, dirPlan));
    auto append = [](vector<string>& to, const vector<string>& from) {
      to.insert(to.end(), from.begin(), from.end());
    };
    append(plan.pocologFiles, dirPlan.pocologFiles);
    append(plan.textFiles, dirPlan.textFiles);
    append(plan.robyEventLogs, dirPlan.robyEventLogs);
    append(plan.remaining, dirPlan.remaining);
  }
  if (plan.robyEventLogs.size() > 1) {
    reporter.error(fmt::format(
        "{} Roby event logs found, expected at most one", plan.robyEventLogs.size()));
    return MULTIPLE_EVENT_LOGS;
  }
  IF_ERROR_LOG_AND_RETURN(os::makeDirectories(outputDir));
  IF_ERROR_LOG_AND_RETURN(os::makeDirectories(cacheDir));
  outDataset = Dataset(outputDir, cacheDir);

  map<string, string> knownSha2;
  reporter.info("Normalizing pocolog log files");
  if (!plan.pocologFiles.empty()) {
    IF_ERROR_RETURN(normalize(
        plan.pocologFiles,
        os::pathJoin(outputDir, Dataset::kPocologDir),
        outDataset.getPocologCachePath(),
        true,
        reporter,
        &knownSha2));
  }

  reporter.info("Copying the Roby event logs");
  for (const string& eventLog : plan.robyEventLogs) {
    IF_ERROR_RETURN(copyRobyEventLog(outputDir, eventLog));
  }

  reporter.info(fmt::format("Copying {} text files", plan.textFiles.size()));
  IF_ERROR_RETURN(copyTextFiles(outputDir, plan.textFiles));

  reporter.info(fmt::format("Copying {} remaining files and folders", plan.remaining.size()));
  IF_ERROR_RETURN(copyIgnoredEntries(outputDir, plan.remaining));

  IF_ERROR_RETURN(outDataset.writeIdentityManifest(reporter, knownSha2));

  for (auto dir = dirs.rbegin(); dir != dirs.rend(); ++dir) {
    const string infoPath = os::pathJoin(*dir, kRobyInfoFilename);
    if (os::isFile(infoPath)) {
      importRobyMetadata(outDataset, infoPath, reporter);
    }
  }
  return outDataset.metadataWriteToFile();
}

int Import::validateDatasetImport(const Dataset& dataset, bool force, Reporter& reporter) {
  const string& digest = dataset.getDigest();
  if (!datastore_.has(digest)) {
    return SUCCESS;
  }
  if (!force) {
    PDS_LOGI(
        "A dataset identical to {} already exists in the store (computed digest is {})",
        dataset.getCorePath(),
        digest);
    return DATASET_ALREADY_EXISTS;
  }
  reporter.warn(fmt::format("Replacing existing dataset {} with new one", digest));
  return SUCCESS;
}

int Import::moveDatasetToStore(const Dataset& dataset, Dataset& outDataset) {
  const string& digest = dataset.getDigest();
  const string finalCoreDir = datastore_.corePathOf(digest);
  const string finalCacheDir = datastore_.cachePathOf(digest);
  IF_ERROR_LOG_AND_RETURN(os::makeDirectories(os::getParentFolder(finalCoreDir)));
  IF_ERROR_LOG_AND_RETURN(os::makeDirectories(os::getParentFolder(finalCacheDir)));

  // A replaced dataset is set aside next to the new one, until the new one is in place
  const string stagingDir = os::getParentFolder(dataset.getCorePath());
  string replacedCoreDir;
  string replacedCacheDir;
  if (os::pathExists(finalCoreDir)) {
    replacedCoreDir = os::getUniquePath(os::pathJoin(stagingDir, "replaced-core"));
    IF_ERROR_LOG_AND_RETURN(os::rename(finalCoreDir, replacedCoreDir));
    if (os::pathExists(finalCacheDir)) {
      replacedCacheDir = os::getUniquePath(os::pathJoin(stagingDir, "replaced-cache"));
      int error = os::rename(finalCacheDir, replacedCacheDir);
      if (error != 0) {
        PDS_LOGE("Can't move {} aside: {}", finalCacheDir, errorCodeToMessage(error));
        IF_ERROR_LOG(os::rename(replacedCoreDir, finalCoreDir));
        return STORE_MOVE_ERROR;
      }
    }
  } else if (os::pathExists(finalCacheDir)) {
    PDS_LOGW("Removing stale cache {}", finalCacheDir);
    IF_ERROR_LOG_AND_RETURN(os::removeRecursively(finalCacheDir));
  }
  auto restoreReplaced = [&replacedCoreDir, &replacedCacheDir, &finalCoreDir, &finalCacheDir]() {
    if (!replacedCoreDir.empty()) {
      IF_ERROR_LOG(os::rename(replacedCoreDir, finalCoreDir));
    }
    if (!replacedCacheDir.empty()) {
      IF_ERROR_LOG(os::rename(replacedCacheDir, finalCacheDir));
    }
  };

  int error = os::rename(dataset.getCorePath(), finalCoreDir);
  if (error != 0) {
    PDS_LOGE(
        "Can't move {} to {}: {}",
        dataset.getCorePath(),
        finalCoreDir,
        errorCodeToMessage(error));
    restoreReplaced();
    return STORE_MOVE_ERROR;
  }
  if (!dataset.isCacheInCore()) {
    error = os::rename(dataset.getCachePath(), finalCacheDir);
    if (error != 0) {
      PDS_LOGE(
          "Can't move {} to {}: {}",
          dataset.getCachePath(),
          finalCacheDir,
          errorCodeToMessage(error));
      IF_ERROR_LOG(os::rename(finalCoreDir, dataset.getCorePath()));
      restoreReplaced();
      return STORE_MOVE_ERROR;
    }
  }
  if (!replacedCoreDir.empty()) {
    IF_ERROR_LOG(os::removeRecursively(replacedCoreDir));
  }
  if (!replacedCacheDir.empty()) {
    IF_ERROR_LOG(os::removeRecursively(replacedCacheDir));
  }
  outDataset = Dataset(finalCoreDir, finalCacheDir);
  IF_ERROR_RETURN(outDataset.readIdentityManifest());
  return outDataset.metadataReadFromFile();
}

void Import::importRobyMetadata(Dataset& dataset, const string& infoPath, Reporter& reporter) {
  YAML::Node info;
  try {
    info = YAML::LoadFile(infoPath);
  } catch (const YAML::Exception& e) {
    PDS_LOGD("{}: {}", infoPath, e.what());
    reporter.warn(fmt::format("failed to load Roby metadata from {}", infoPath));
    return;
  }
  if (!info.IsSequence() || info.size() == 0 || !info[0].IsMap()) {
    return;
  }
  for (const auto& entry : info[0]) {
    if (entry.first.IsScalar()) {
      addYamlValue(dataset, kRobyMetadataPrefix + entry.first.Scalar(), entry.second);
    }
  }
}

bool Import::findImportInfo(const string& dir, string& outDigest, int64_t& outTime) {
  const string path = os::pathJoin(dir, kImportInfoFilename);
  if (!os::isFile(path)) {
    return false;
  }
  string json;
  if (DiskFile::readTextFile(path, json) != 0) {
    PDS_LOGW("Can't read {}", path);
    return false;
  }
  JDocument doc;
  jParse(doc, json);
  if (doc.HasParseError() || !doc.IsObject() || !getJString(outDigest, doc, kDigestKey) ||
      !getJInt64(outTime, doc, kTimeKey)) {
    PDS_LOGW("Invalid import information in {}", path);
    return false;
  }
  return true;
}

int Import::saveImportInfo(const string& dir, const Dataset& dataset, int64_t time) {
  JDocument doc;
  JsonWrapper rj(doc);
  rj.addMember(kDigestKey, dataset.getDigest());
  rj.addMember(kTimeKey, time);
  return DiskFile::writeTextFile(
      os::pathJoin(dir, kImportInfoFilename), jDocumentToJsonStringPretty(doc));
}

int Import::copyRobyEventLog(const string& outputDir, const string& eventLog) {
  string target;
  for (int i = 0; target.empty() || os::isFile(target); i++) {
    target = os::pathJoin(outputDir, fmt::format("{}{}.log", kRobyEventLogPrefix, i));
  }
  int error = os::copyFile(eventLog, target);
  if (error != 0) {
    PDS_LOGE("Can't copy {} to {}: {}", eventLog, target, errorCodeToMessage(error));
  }
  return error;
}

int Import::copyTextFiles(const string& outputDir, const vector<string>& files) {
  if (files.empty()) {
    return SUCCESS;
  }
  const string textDir = os::pathJoin(outputDir, Dataset::kTextDir);
  IF_ERROR_LOG_AND_RETURN(os::makeDirectories(textDir));
  for (const string& file : files) {
    IF_ERROR_LOG_AND_RETURN(os::copyFile(file, os::pathJoin(textDir, os::getFilename(file))));
  }
  return SUCCESS;
}

int Import::copyIgnoredEntries(const string& outputDir, const vector<string>& entries) {
  if (entries.empty()) {
    return SUCCESS;
  }
  const string ignoredDir = os::pathJoin(outputDir, Dataset::kIgnoredDir);
  IF_ERROR_LOG_AND_RETURN(os::makeDirectories(ignoredDir));
  for (const string& entry : entries) {
    IF_ERROR_LOG_AND_RETURN(
        os::copyRecursively(entry, os::pathJoin(ignoredDir, os::getFilename(entry))));
  }
  return SUCCESS;
}

} // namespace datastore
} // namespace pocods
