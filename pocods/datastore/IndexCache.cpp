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


#include "IndexCache.h"

#define DEFAULT_LOG_CHANNEL "IndexCache"
#include <logging/Log.h>

#include <pocods/ErrorCode.h>
#include <pocods/helpers/FileMacros.h>
#include <pocods/os/Utils.h>
#include <pocods/pocolog/Index.h>
#include <pocods/roby/EventLog.h>

using namespace std;

namespace pocods {
namespace datastore {

LogIndexer::~LogIndexer() = default;

string PocologIndexer::indexPathOf(const string& logPath, const string& indexDir) const {
  return pocolog::defaultIndexFilename(logPath, indexDir);
}

bool PocologIndexer::isIndexValid(const string& logPath, const string& indexPath) {
  return pocolog::isIndexValid(logPath, indexPath);
}

int PocologIndexer::rebuildIndex(const string& logPath, const string& indexPath) {
  return pocolog::rebuildIndex(logPath, indexPath);
}

string RobyIndexer::indexPathOf(const string& logPath, const string& indexDir) const {
  return roby::defaultIndexFilename(logPath, indexDir);
}

bool RobyIndexer::isIndexValid(const string& logPath, const string& indexPath) {
  return roby::isIndexValid(logPath, indexPath);
}

int RobyIndexer::rebuildIndex(const string& logPath, const string& indexPath) {
  return roby::rebuildIndex(logPath, indexPath);
}

int ensureIndexValid(
    LogIndexer& indexer,
    const string& logPath,
    const string& indexDir,
    bool force,
    string& outIndexPath,
    bool* outRebuilt) {
  if (outRebuilt != nullptr) {
    *outRebuilt = false;
  }
  IF_ERROR_LOG_AND_RETURN(os::makeDirectories(indexDir));
  outIndexPath = indexer.indexPathOf(logPath, indexDir);
  if (!os::isFile(logPath)) {
    PDS_LOGD("{} not found, not indexing it", logPath);
    return SUCCESS;
  }
  if (!force && indexer.isIndexValid(logPath, outIndexPath)) {
    return SUCCESS;
  }
  const string tmpPath = os::getUniquePath(outIndexPath);
  int error = indexer.rebuildIndex(logPath, tmpPath);
  if (error == 0) {
    error = os::rename(tmpPath, outIndexPath);
  }
  if (error != 0) {
    if (os::pathExists(tmpPath)) {
      IF_ERROR_LOG(os::remove(tmpPath));
    }
    return error;
  }
  if (outRebuilt != nullptr) {
    *outRebuilt = true;
  }
  return SUCCESS;
}

} // namespace datastore
} // namespace pocods
