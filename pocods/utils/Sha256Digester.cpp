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


#include "Sha256Digester.h"

#include <vector>

#define DEFAULT_LOG_CHANNEL "Sha256Digester"
#include <logging/Log.h>

#include <pocods/DiskFile.h>
#include <pocods/ErrorCode.h>
#include <pocods/helpers/FileMacros.h>

using namespace std;

namespace pocods {
namespace utils {

namespace {
const size_t kFileReadBufferSize = 256 * 1024;
}

Sha256Digester::Sha256Digester() {
  hasher_.init();
}

Sha256Digester& Sha256Digester::ingest(const void* data, size_t length) {
  const uint8_t* bytes = reinterpret_cast<const uint8_t*>(data);
  hasher_.process(bytes, bytes + length);
  return *this;
}

string Sha256Digester::digestToString() {
  hasher_.finish();
  string hex;
  picosha2::get_hash_hex_string(hasher_, hex);
  hasher_.init();
  return hex;
}

int Sha256Digester::fileDigest(const string& path, string& outHexDigest) {
  outHexDigest.clear();
  DiskFile file;
  IF_ERROR_LOG_AND_RETURN(file.open(path));
  Sha256Digester digester;
  vector<uint8_t> buffer(kFileReadBufferSize);
  int64_t remaining = file.getTotalSize();
  while (remaining > 0) {
    size_t chunkSize = static_cast<size_t>(min<int64_t>(remaining, buffer.size()));
    IF_ERROR_LOG_AND_RETURN(file.read(buffer.data(), chunkSize));
    digester.ingest(buffer.data(), chunkSize);
    remaining -= static_cast<int64_t>(chunkSize);
  }
  outHexDigest = digester.digestToString();
  return SUCCESS;
}

} // namespace utils
} // namespace pocods
