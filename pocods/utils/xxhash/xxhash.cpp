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

#include "xxhash.h"

#include <fmt/format.h>

#include <logging/Checks.h>

using namespace std;

namespace pocods {

XXH64Digester::XXH64Digester() {
  xxh_ = XXH64_createState();
  PDS_CHECK_NOTNULL(xxh_);
  XXH64_reset(xxh_, 0);
}

XXH64Digester::~XXH64Digester() {
  clear();
}

void XXH64Digester::clear() {
  if (xxh_ != nullptr) {
    XXH64_freeState(xxh_);
    xxh_ = nullptr;
  }
}

XXH64Digester& XXH64Digester::ingest(const void* data, size_t len) {
  PDS_CHECK_NOTNULL(xxh_, "Digester used after digest()");
  PDS_CHECK_EQ(XXH64_update(xxh_, data, len), XXH_OK);
  return *this;
}

uint64_t XXH64Digester::digest() {
  PDS_CHECK_NOTNULL(xxh_, "Digester used after digest()");
  uint64_t xxHash64 = XXH64_digest(xxh_);
  clear();
  return xxHash64;
}

string XXH64Digester::digestToString() {
  return fmt::format("{:016x}", digest());
}

} // namespace pocods
