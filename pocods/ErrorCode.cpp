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

#include <pocods/ErrorCode.h>

#include <map>
#include <mutex>
#include <string>

#include <fmt/format.h>

#include <pocods/os/Utils.h>

using namespace std;
using namespace pocods;

namespace {
const char* getSimpleErrorName(int errorCode) {
  static map<int, const char*> sRegistry = {
      {SUCCESS, "Success"},
      {FAILURE, "Misc error"},
      {NOT_SUPPORTED, "Given method is not supported on your platform"},
      {NOT_IMPLEMENTED, "Given method is not implemented (yet)"},
      {INTERNAL_ERROR, "Internal error"},

      {FILE_NOT_FOUND, "File not found"},
      {INVALID_PARAMETER, "Invalid parameter"},
      {INVALID_DISK_DATA, "Read error: invalid data"},
      {READ_ERROR, "Read error: failed to read data"},
      {NOT_ENOUGH_DATA, "Read error: not enough data"},

      {NOT_A_POCOLOG_FILE, "Not a pocolog file"},
      {UNSUPPORTED_FORMAT_VERSION, "Unsupported file format version"},
      {NOT_A_ROBY_LOG_FILE, "Not a Roby event log file"},
      {OBSOLETE_FORMAT_VERSION, "Obsolete file format version"},
      {INVALID_INDEX_FILE, "Invalid or stale index file"},
      {INVALID_FOLLOWUP_STREAM, "Stream declaration differs from the stream it continues"},
      {DUPLICATE_STREAM, "Stream with the same task, object and type already exists"},
      {INVALID_METADATA, "Invalid metadata"},

      {MULTIPLE_EVENT_LOGS, "More than one Roby event log found"},
      {INVALID_DATASET, "Invalid dataset"},
      {DATASET_NOT_FOUND, "Dataset not found"},
      {DATASET_ALREADY_EXISTS, "Dataset already exists in the datastore"},
      {INCOMING_ALLOCATION_ERROR, "Could not allocate an incoming directory"},
      {STORE_MOVE_ERROR, "Could not move the dataset into the datastore"},
      {STORE_LOCK_ERROR, "Could not lock the datastore"},

      {DISKFILE_NOT_OPEN, "DiskFile no file open"},
      {DISKFILE_FILE_NOT_FOUND, "DiskFile file not found"},
      {DISKFILE_NOT_ENOUGH_DATA, "DiskFile not enough data"},
      {DISKFILE_PARTIAL_WRITE_ERROR, "DiskFile unexpected partial write"},
  };
  auto iter = sRegistry.find(errorCode);
  return iter != sRegistry.end() ? iter->second : nullptr;
}

map<int, string> sDomainErrorRegistry;
map<int, map<int64_t, int>> sRangeIndexMap;
mutex sDomainErrorRegistryMutex;

// must be called with sDomainErrorRegistryMutex held
int newDomainErrorCode(ErrorDomain errorDomain, int64_t errorCode) {
  map<int64_t, int>& indexMap = sRangeIndexMap[errorDomainToErrorCodeStart(errorDomain)];
  int& newErrorCode = indexMap[errorCode]; // create a code of value 0 if it didn't exist
  if (newErrorCode != 0) {
    return newErrorCode; // the error existed already
  }
  if (indexMap.size() >= static_cast<size_t>(kErrorsDomainSize - 1)) {
    // Too many errors for that domain
    return FAILURE;
  }
  newErrorCode = errorDomainToErrorCodeStart(errorDomain) + static_cast<int>(indexMap.size());
  return newErrorCode;
}

} // namespace

namespace pocods {

string errorCodeToMessage(int errorCode) {
  if (errorCode < 0 || (errorCode > 0 && errorCode < kPlatformUserErrorsStart)) {
    return os::fileErrorToString(errorCode);
  }
  const char* errorName = getSimpleErrorName(errorCode);
  if (errorName != nullptr) {
    return errorName;
  }
  {
    unique_lock<mutex> lock(sDomainErrorRegistryMutex);
    auto iter = sDomainErrorRegistry.find(errorCode);
    if (iter != sDomainErrorRegistry.end()) {
      return iter->second;
    }
  }
  return fmt::format("<Unknown error code '{}'>", errorCode);
}

int domainErrorCode(ErrorDomain errorDomain, int64_t errorCode, const char* errorMessage) {
  unique_lock<mutex> lock(sDomainErrorRegistryMutex);
  static bool sInternalDomainsRegistered = false;
  if (!sInternalDomainsRegistered) {
    sInternalDomainsRegistered = true;
    sDomainErrorRegistry[errorDomainToErrorCodeStart(ErrorDomain::ZstdCompressionErrorDomain)] =
        "ZSTD Compression";
    sDomainErrorRegistry[errorDomainToErrorCodeStart(ErrorDomain::ZstdDecompressionErrorDomain)] =
        "ZSTD Decompression";
    sDomainErrorRegistry[errorDomainToErrorCodeStart(ErrorDomain::YamlErrorDomain)] = "YAML";
  }
  int newErrorCode = newDomainErrorCode(errorDomain, errorCode);
  // check if there are already too many errors registered for that domain.
  if (newErrorCode == FAILURE) {
    newErrorCode = errorDomainToErrorCodeStart(errorDomain) + kErrorsDomainSize - 1;
    string& lastErrorMessage = sDomainErrorRegistry[newErrorCode];
    if (lastErrorMessage.empty()) {
      lastErrorMessage = sDomainErrorRegistry[errorDomainToErrorCodeStart(errorDomain)] +
          " error: <too many domain errors to track>";
    }
    return newErrorCode;
  }
  // example: "ZSTD Decompression error 25: invalid data".
  // Always update the text, in case it changes, to return the last one!
  sDomainErrorRegistry[newErrorCode] =
      sDomainErrorRegistry[errorDomainToErrorCodeStart(errorDomain)] + " error " +
      to_string(errorCode) + ": " + errorMessage;

  return newErrorCode;
}

} // namespace pocods
