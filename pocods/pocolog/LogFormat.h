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

#include <cstddef>
#include <cstdint>

#include <pocods/FileFormat.h>

/// Pocolog log file format description.
///
/// Every file starts with a Prologue. It is followed by a series of blocks, each starting with a
/// BlockHeader that tells the type of the block, the stream it belongs to, and the size of its
/// payload, which immediately follows.
///
/// Stream declaration blocks describe a stream: a kind byte, followed by four strings, each
/// prefixed by its uint32 length: the stream name, its type name, its type registry, and its
/// metadata as a YAML mapping.
///
/// Data blocks start with a DataBlockHeader, followed by the sample's bytes, which are never
/// interpreted here.

namespace pocods {
namespace pocolog {

using FileFormat::LittleEndian;

constexpr char kPocologMagic[] = "POCOSIM";
constexpr size_t kPocologMagicSize = sizeof(kPocologMagic) - 1;
constexpr uint32_t kPocologFormatVersion = 3;
constexpr uint32_t kBigEndianFlag = 1;

constexpr char kIndexMagic[] = "POCOIDX";
constexpr size_t kIndexMagicSize = sizeof(kIndexMagic) - 1;
constexpr uint32_t kIndexFormatVersion = 1;
/// Number of bytes at the start of a log file used to fingerprint it.
constexpr size_t kFingerprintSize = 4096;

enum class BlockType : uint8_t {
  Unknown = 0,
  Stream = 1,
  Data = 2,
  Control = 3,
};

constexpr uint8_t kDataStreamKind = 1;

#pragma pack(push, 1)

struct Prologue {
  char magic[kPocologMagicSize];
  LittleEndian<uint32_t> version;
  LittleEndian<uint32_t> flags;

  void init();
  bool looksLikePocolog() const;
};

struct BlockHeader {
  LittleEndian<uint8_t> type;
  LittleEndian<uint8_t> padding;
  LittleEndian<uint16_t> streamIndex;
  LittleEndian<uint32_t> payloadSize;

  BlockHeader() = default;
  BlockHeader(BlockType blockType, uint16_t index, uint32_t size);
  BlockType getType() const {
    return static_cast<BlockType>(type.get());
  }
};

struct DataBlockHeader {
  LittleEndian<uint32_t> rtSec;
  LittleEndian<uint32_t> rtUsec;
  LittleEndian<uint32_t> lgSec;
  LittleEndian<uint32_t> lgUsec;
  LittleEndian<uint32_t> dataSize;
  LittleEndian<uint8_t> compressed;

  void setTimes(int64_t realTimeUs, int64_t logicalTimeUs);
  int64_t getRealTime() const {
    return FileFormat::toMicroseconds(rtSec.get(), rtUsec.get());
  }
  int64_t getLogicalTime() const {
    return FileFormat::toMicroseconds(lgSec.get(), lgUsec.get());
  }
};

/// Index files start with this header, which ties them to a specific version of a log file.
struct IndexHeader {
  char magic[kIndexMagicSize];
  LittleEndian<uint32_t> version;
  LittleEndian<uint64_t> logFileSize;
  LittleEndian<int64_t> logFileMtimeNs;
  LittleEndian<uint64_t> headFingerprint;
  LittleEndian<uint32_t> streamCount;

  void init();
  bool looksLikeIndex() const;
};

/// One per stream, followed by the stream's sample entries.
struct IndexStreamEntry {
  LittleEndian<uint16_t> index;
  LittleEndian<uint64_t> declarationOffset;
  LittleEndian<uint64_t> sampleCount;
  LittleEndian<int64_t> rtFirst;
  LittleEndian<int64_t> rtLast;
  LittleEndian<int64_t> lgFirst;
  LittleEndian<int64_t> lgLast;
};

struct IndexSampleEntry {
  LittleEndian<uint64_t> blockOffset;
  LittleEndian<int64_t> lgTime;
};

#pragma pack(pop)

} // namespace pocolog
} // namespace pocods
