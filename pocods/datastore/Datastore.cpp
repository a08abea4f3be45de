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


#include "Datastore.h"

#include <cerrno>

#include <algorithm>

#define DEFAULT_LOG_CHANNEL "Datastore"
#include <logging/Log.h>

#include <pocods/ErrorCode.h>
#include <pocods/helpers/FileMacros.h>
#include <pocods/os/FileList.h>
#include <pocods/os/Utils.h>

using namespace std;

namespace pocods {
namespace datastore {

namespace {
// Give up after that many attempts to allocate an incoming directory
const int kMaxIncomingAttempts = 10000;
} // namespace

int Datastore::create(const string& path) {
  IF_ERROR_LOG_AND_RETURN(os::makeDirectories(os::pathJoin(path, kCoreDir)));
  IF_ERROR_LOG_AND_RETURN(os::makeDirectories(os::pathJoin(path, kCacheDir)));
  IF_ERROR_LOG_AND_RETURN(os::makeDirectories(os::pathJoin(path, kIncomingDir)));
  return SUCCESS;
}

string Datastore::corePathOf(const string& digest) const {
  return os::pathJoin(path_, kCoreDir, digest);
}

string Datastore::cachePathOf(const string& digest) const {
  return os::pathJoin(path_, kCacheDir, digest);
}

bool Datastore::has(const string& digest) const {
  return !digest.empty() && os::isDir(corePathOf(digest));
}

int Datastore::deleteDataset(const string& digest) {
  if (!has(digest)) {
    return DATASET_NOT_FOUND;
  }
  IF_ERROR_LOG_AND_RETURN(os::removeRecursively(corePathOf(digest)));
  const string cachePath = cachePathOf(digest);
  if (os::pathExists(cachePath)) {
    IF_ERROR_LOG_AND_RETURN(os::removeRecursively(cachePath));
  }
  return SUCCESS;
}

int Datastore::getDataset(const string& digest, Dataset& outDataset) const {
  if (!has(digest)) {
    return DATASET_NOT_FOUND;
  }
  outDataset = Dataset(corePathOf(digest), cachePathOf(digest));
  IF_ERROR_RETURN(outDataset.readIdentityManifest());
  if (outDataset.getDigest() != digest) {
    PDS_LOGE("Dataset {} has digest {} in its identity manifest", digest, outDataset.getDigest());
    return INVALID_DATASET;
  }
  return outDataset.metadataReadFromFile();
}

int Datastore::listDigests(vector<string>& outDigests) const {
  outDigests.clear();
  const string coreDir = os::pathJoin(path_, kCoreDir);
  if (!os::isDir(coreDir)) {
    return SUCCESS;
  }
  vector<string> files;
  vector<string> folders;
  IF_ERROR_LOG_AND_RETURN(os::getFilesAndFolders(coreDir, files, &folders));
  for (const string& folder : folders) {
    outDigests.push_back(os::getFilename(folder));
  }
  sort(outDigests.begin(), outDigests.end());
  return SUCCESS;
}

int Datastore::inIncoming(const IncomingCallback& callback) {
  const string incomingDir = os::pathJoin(path_, kIncomingDir);
  IF_ERROR_LOG_AND_RETURN(os::makeDirectories(incomingDir));
  string workDir;
  for (int n = 0; n < kMaxIncomingAttempts && workDir.empty(); n++) {
    const string candidate = os::pathJoin(incomingDir, to_string(n));
    int error = os::makeNewDir(candidate);
    if (error == 0) {
      workDir = candidate;
    } else if (error != EEXIST) {
      PDS_LOGE("Can't create {}: {}", candidate, errorCodeToMessage(error));
      return error;
    }
  }
  if (workDir.empty()) {
    return INCOMING_ALLOCATION_ERROR;
  }
  const string corePath = os::pathJoin(workDir, kCoreDir);
  const string cachePath = os::pathJoin(workDir, kCacheDir);
  int status = os::makeDir(corePath);
  if (status == 0) {
    status = os::makeDir(cachePath);
  }
  bool keep = false;
  if (status == 0) {
    status = callback(corePath, cachePath, keep);
  }
  if (keep) {
    PDS_LOGI("Keeping {}", workDir);
  } else {
    IF_ERROR_LOG(os::removeRecursively(workDir));
  }
  return status;
}

int Datastore::lock(os::FileLock& outLock) const {
  if (outLock.lock(os::pathJoin(path_, kLockFilename)) != 0) {
    return STORE_LOCK_ERROR;
  }
  return SUCCESS;
}

} // namespace datastore
} // namespace pocods
