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


#include "Compression.h"

#include <cstring>

#define DEFAULT_LOG_CHANNEL "Compression"
#include <logging/Log.h>

#include <pocods/ErrorCode.h>
#include <pocods/helpers/FileMacros.h>
#include <pocods/helpers/Strings.h>
#include <pocods/os/Utils.h>
#include <pocods/utils/Zstd.h>

using namespace std;

namespace pocods {
namespace pocolog {

bool isCompressed(const string& path) {
  return helpers::endsWith(path, kCompressedExtension);
}

string decompressedPath(const string& path, const string& cacheDir) {
  if (!isCompressed(path)) {
    return path;
  }
  string name = os::getFilename(path);
  name.resize(name.size() - strlen(kCompressedExtension));
  return os::pathJoin(cacheDir, name);
}

bool findDecompressed(const string& path, const string& cacheDir, string& outPath) {
  outPath = decompressedPath(path, cacheDir);
  return os::isFile(outPath);
}

int decompressed(const string& path, const string& cacheDir, string& outPath) {
  if (findDecompressed(path, cacheDir, outPath) || !isCompressed(path)) {
    return os::isFile(outPath) ? SUCCESS : FILE_NOT_FOUND;
  }
  IF_ERROR_LOG_AND_RETURN(os::makeDirectories(cacheDir));
  string tmpPath = os::getUniquePath(outPath + ".tmp");
  int error = utils::decompressFile(path, tmpPath);
  if (error != 0) {
    PDS_LOGE("Failed to decompress {}: {}", path, errorCodeToMessage(error));
    if (os::pathExists(tmpPath)) {
      IF_ERROR_LOG(os::remove(tmpPath));
    }
    return error;
  }
  IF_ERROR_LOG_AND_RETURN(os::rename(tmpPath, outPath));
  return SUCCESS;
}

} // namespace pocolog
} // namespace pocods
