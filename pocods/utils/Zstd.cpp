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


#include "Zstd.h"

#include <memory>
#include <vector>

#include <zstd.h>

#define DEFAULT_LOG_CHANNEL "Zstd"
#include <logging/Log.h>

#include <pocods/DiskFile.h>
#include <pocods/ErrorCode.h>
#include <pocods/helpers/FileMacros.h>

using namespace std;

namespace {

struct DStreamDeleter {
  void operator()(ZSTD_DStream* stream) const {
    ZSTD_freeDStream(stream);
  }
};

struct CStreamDeleter {
  void operator()(ZSTD_CStream* stream) const {
    ZSTD_freeCStream(stream);
  }
};

} // namespace

#define ZSTD_DOMAIN_ERROR(domain__, code__) \
  pocods::domainErrorCode(domain__, code__, ZSTD_getErrorName(code__))

#define IF_ZSTD_ERROR_LOG_AND_RETURN(domain__, operation__)                              \
  do {                                                                                   \
    size_t zresult__ = operation__;                                                      \
    if (ZSTD_isError(zresult__)) {                                                       \
      PDS_LOGE("{} failed: {}, {}", #operation__, zresult__, ZSTD_getErrorName(zresult__)); \
      return ZSTD_DOMAIN_ERROR(domain__, zresult__);                                     \
    }                                                                                    \
  } while (false)

namespace pocods {
namespace utils {

int decompressFile(const string& sourcePath, const string& targetPath) {
  DiskFile source;
  IF_ERROR_LOG_AND_RETURN(source.open(sourcePath));
  DiskFile target;
  IF_ERROR_LOG_AND_RETURN(target.create(targetPath));
  unique_ptr<ZSTD_DStream, DStreamDeleter> context(ZSTD_createDStream());
  if (!context) {
    return INTERNAL_ERROR;
  }
  const ErrorDomain domain = ErrorDomain::ZstdDecompressionErrorDomain;
  IF_ZSTD_ERROR_LOG_AND_RETURN(domain, ZSTD_initDStream(context.get()));
  vector<char> inBuffer(ZSTD_DStreamInSize());
  vector<char> outBuffer(ZSTD_DStreamOutSize());
  int64_t remaining = source.getTotalSize();
  size_t lastResult = 0;
  while (remaining > 0) {
    size_t readSize = static_cast<size_t>(min<int64_t>(remaining, inBuffer.size()));
    IF_ERROR_LOG_AND_RETURN(source.read(inBuffer.data(), readSize));
    remaining -= static_cast<int64_t>(readSize);
    ZSTD_inBuffer input{inBuffer.data(), readSize, 0};
    while (input.pos < input.size) {
      ZSTD_outBuffer output{outBuffer.data(), outBuffer.size(), 0};
      lastResult = ZSTD_decompressStream(context.get(), &output, &input);
      if (ZSTD_isError(lastResult)) {
        PDS_LOGE("Decompression of {} failed: {}", sourcePath, ZSTD_getErrorName(lastResult));
        return ZSTD_DOMAIN_ERROR(domain, lastResult);
      }
      WRITE_OR_LOG_AND_RETURN(target, outBuffer.data(), output.pos);
    }
  }
  // drain what's left in the decoder's buffers
  while (lastResult != 0) {
    ZSTD_inBuffer input{inBuffer.data(), 0, 0};
    ZSTD_outBuffer output{outBuffer.data(), outBuffer.size(), 0};
    lastResult = ZSTD_decompressStream(context.get(), &output, &input);
    if (ZSTD_isError(lastResult)) {
      PDS_LOGE("Decompression of {} failed: {}", sourcePath, ZSTD_getErrorName(lastResult));
      return ZSTD_DOMAIN_ERROR(domain, lastResult);
    }
    if (output.pos == 0) {
      PDS_LOGE("{} is truncated", sourcePath);
      return NOT_ENOUGH_DATA;
    }
    WRITE_OR_LOG_AND_RETURN(target, outBuffer.data(), output.pos);
  }
  return target.close();
}

int compressFile(const string& sourcePath, const string& targetPath, int compressionLevel) {
  DiskFile source;
  IF_ERROR_LOG_AND_RETURN(source.open(sourcePath));
  DiskFile target;
  IF_ERROR_LOG_AND_RETURN(target.create(targetPath));
  unique_ptr<ZSTD_CStream, CStreamDeleter> context(ZSTD_createCStream());
  if (!context) {
    return INTERNAL_ERROR;
  }
  const ErrorDomain domain = ErrorDomain::ZstdCompressionErrorDomain;
  IF_ZSTD_ERROR_LOG_AND_RETURN(domain, ZSTD_initCStream(context.get(), compressionLevel));
  vector<char> inBuffer(ZSTD_CStreamInSize());
  vector<char> outBuffer(ZSTD_CStreamOutSize());
  int64_t remaining = source.getTotalSize();
  while (remaining > 0) {
    size_t readSize = static_cast<size_t>(min<int64_t>(remaining, inBuffer.size()));
    IF_ERROR_LOG_AND_RETURN(source.read(inBuffer.data(), readSize));
    remaining -= static_cast<int64_t>(readSize);
    ZSTD_inBuffer input{inBuffer.data(), readSize, 0};
    while (input.pos < input.size) {
      ZSTD_outBuffer output{outBuffer.data(), outBuffer.size(), 0};
      IF_ZSTD_ERROR_LOG_AND_RETURN(
          domain, ZSTD_compressStream(context.get(), &output, &input));
      WRITE_OR_LOG_AND_RETURN(target, outBuffer.data(), output.pos);
    }
  }
  size_t pending = 0;
  do {
    ZSTD_outBuffer output{outBuffer.data(), outBuffer.size(), 0};
    pending = ZSTD_endStream(context.get(), &output);
    if (ZSTD_isError(pending)) {
      PDS_LOGE("Compression of {} failed: {}", sourcePath, ZSTD_getErrorName(pending));
      return ZSTD_DOMAIN_ERROR(domain, pending);
    }
    WRITE_OR_LOG_AND_RETURN(target, outBuffer.data(), output.pos);
  } while (pending != 0);
  return target.close();
}

} // namespace utils
} // namespace pocods
