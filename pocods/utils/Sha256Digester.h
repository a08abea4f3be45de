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

#include <picosha2.h>

namespace pocods {
namespace utils {

/// SHA-256 digester, used to compute the identity of dataset files & of datasets themselves.
class Sha256Digester {
 public:
  Sha256Digester();

  Sha256Digester& ingest(const void* data, size_t length);
  Sha256Digester& ingest(const std::string& str) {
    return ingest(str.data(), str.size());
  }
  /// Finish the hash and get its lowercase hex representation.
  /// The digester is reset, and can be reused for another hash.
  std::string digestToString();

  /// Compute the SHA-256 of a file's content.
  /// @param path: path of the file to hash.
  /// @param outHexDigest: on success, set to the lowercase hex digest.
  /// @return 0 on success, or an error code.
  static int fileDigest(const std::string& path, std::string& outHexDigest);

 private:
  picosha2::hash256_one_by_one hasher_;
};

} // namespace utils
} // namespace pocods
