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

#include <pocods/os/Platform.h>

namespace pocods {

#if IS_APPLE_PLATFORM()
// Largest error number is 100102 kPOSIXErrorEOPNOTSUPP
const int kPlatformUserErrorsStart = 200000;
#elif IS_WINDOWS_PLATFORM()
const int kPlatformUserErrorsStart = 1 << 29; // bit 29 is set for user errors
#else
const int kPlatformUserErrorsStart = 1000; // Errorno is 131
#endif

const int kSimpleErrorsSize = 1000;
const int kErrorsDomainSize = 100;
const int kDomainErrorsStart = kPlatformUserErrorsStart + kSimpleErrorsSize;

/// Enum for regular pocods errors.
/// Any other non-zero value returned by a pocods API is either a system errno value, or a domain
/// error. Use errorCodeToMessage() to get a human readable description of any of them.
enum ErrorCode : int {
  SUCCESS = 0,

  FAILURE = kPlatformUserErrorsStart,
  NOT_SUPPORTED,
  NOT_IMPLEMENTED,
  INTERNAL_ERROR,

  FILE_NOT_FOUND,
  INVALID_PARAMETER,
  INVALID_DISK_DATA,
  READ_ERROR,
  NOT_ENOUGH_DATA,

  NOT_A_POCOLOG_FILE,
  UNSUPPORTED_FORMAT_VERSION,
  NOT_A_ROBY_LOG_FILE,
  OBSOLETE_FORMAT_VERSION,
  INVALID_INDEX_FILE,
  INVALID_FOLLOWUP_STREAM,
  DUPLICATE_STREAM,
  INVALID_METADATA,

  MULTIPLE_EVENT_LOGS,
  INVALID_DATASET,
  DATASET_NOT_FOUND,
  DATASET_ALREADY_EXISTS,
  INCOMING_ALLOCATION_ERROR,
  STORE_MOVE_ERROR,
  STORE_LOCK_ERROR,

  DISKFILE_NOT_OPEN,
  DISKFILE_FILE_NOT_FOUND,
  DISKFILE_NOT_ENOUGH_DATA,
  DISKFILE_PARTIAL_WRITE_ERROR,
};

/// Errors can come from pocods, or a helper library like ZSTD.
/// Error domains create a safe mechanism to report any of these errors as an int,
/// which can then be converted back to a human readable string using errorCodeToMessage(code).
/// The caveat is that the numeric values themselves may vary from run-to-run.
enum class ErrorDomain : int {
  ZstdCompressionErrorDomain,
  ZstdDecompressionErrorDomain,
  YamlErrorDomain,

  // keep last
  CustomDomains
};

/// Conversion of a error domain to an int. For internal & test purposes only.
constexpr int errorDomainToErrorCodeStart(ErrorDomain errorDomain) {
  return kDomainErrorsStart + static_cast<int>(errorDomain) * kErrorsDomainSize;
}

/// Convert an int error code into a human readable string for logging.
/// This API should work with any int error code returned by any pocods API.
/// @param errorCode: an error code returned by any pocods API.
/// @return A string that describes the error.
std::string errorCodeToMessage(int errorCode);

/// Create an int error code for a specific error domain and error code within that domain.
/// @param errorDomain: the error domain of the error code.
/// @param errorCode: an error code within that domain, which can be any value.
/// @param errorMessage: an error description for the errorCode.
/// @return A int that can be safely returned by pocods to represent the domain error.
/// The errorMessage is saved, so that future calls to errorCodeToMessage() will return that
/// error message for that int error code.
int domainErrorCode(ErrorDomain errorDomain, int64_t errorCode, const char* errorMessage);

template <class T>
int domainErrorCode(ErrorDomain errorDomain, T errorCode, const char* errorMessage) {
  return domainErrorCode(errorDomain, static_cast<int64_t>(errorCode), errorMessage);
}

} // namespace pocods
