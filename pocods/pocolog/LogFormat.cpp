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


#include "LogFormat.h"

#include <cstring>

namespace pocods {
namespace pocolog {

void Prologue::init() {
  memcpy(magic, kPocologMagic, kPocologMagicSize);
  version.set(kPocologFormatVersion);
  flags.set(0);
}

bool Prologue::looksLikePocolog() const {
  return memcmp(magic, kPocologMagic, kPocologMagicSize) == 0;
}

BlockHeader::BlockHeader(BlockType blockType, uint16_t index, uint32_t size) {
  type.set(static_cast<uint8_t>(blockType));
  padding.set(0);
  streamIndex.set(index);
  payloadSize.set(size);
}

void DataBlockHeader::setTimes(int64_t realTimeUs, int64_t logicalTimeUs) {
  rtSec.set(static_cast<uint32_t>(realTimeUs / 1000000));
  rtUsec.set(static_cast<uint32_t>(realTimeUs % 1000000));
  lgSec.set(static_cast<uint32_t>(logicalTimeUs / 1000000));
  lgUsec.set(static_cast<uint32_t>(logicalTimeUs % 1000000));
}

void IndexHeader::init() {
  memcpy(magic, kIndexMagic, kIndexMagicSize);
  version.set(kIndexFormatVersion);
  logFileSize.set(0);
  logFileMtimeNs.set(0);
  headFingerprint.set(0);
  streamCount.set(0);
}

bool IndexHeader::looksLikeIndex() const {
  return memcmp(magic, kIndexMagic, kIndexMagicSize) == 0 &&
      version.get() == kIndexFormatVersion;
}

} // namespace pocolog
} // namespace pocods
