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
#include <vector>

#include <pocods/DiskFile.h>
#include <pocods/FileFormat.h>

/// Roby event log format description.
///
/// An event log starts with a Header, followed by a series of chunks, each prefixed with its
/// uint32 size. Chunks are never interpreted here.
/// Event log index files start with an IndexHeader, followed by one IndexEntry per chunk.

namespace pocods {
namespace roby {

using std::string;
using std::vector;

constexpr char kEventLogMagic[] = "ROBYLOG";
constexpr size_t kEventLogMagicSize = sizeof(kEventLogMagic) - 1;
constexpr uint32_t kEventLogFormatVersion = 5;

constexpr char kIndexMagic[] = "ROBYIDX";
constexpr size_t kIndexMagicSize = sizeof(kIndexMagic) - 1;
constexpr uint32_t kIndexFormatVersion = 1;
/// Suffix of index files, replacing the ".log" extension of their event log.
constexpr char kIndexSuffix[] = "-index.log";

#pragma pack(push, 1)

struct Header {
  char magic[kEventLogMagicSize];
  FileFormat::LittleEndian<uint32_t> version;

  void init(uint32_t formatVersion = kEventLogFormatVersion);
  bool looksLikeEventLog() const;
};

struct IndexHeader {
  char magic[kIndexMagicSize];
  FileFormat::LittleEndian<uint32_t> version;
  FileFormat::LittleEndian<uint64_t> logFileSize;
  FileFormat::LittleEndian<int64_t> logFileMtimeNs;
  FileFormat::LittleEndian<uint64_t> chunkCount;

  void init();
  bool looksLikeIndex() const;
};

struct IndexEntry {
  FileFormat::LittleEndian<uint64_t> offset;
  FileFormat::LittleEndian<uint32_t> size;
};

#pragma pack(pop)

/// Read the format version of an event log.
/// @return 0 on success, NOT_A_ROBY_LOG_FILE if the file isn't an event log, or an error code.
int readFormatVersion(const string& path, uint32_t& outVersion);

/// Write an event log's header.
int writeHeader(DiskFile& file, uint32_t formatVersion = kEventLogFormatVersion);
/// Append a chunk of data to an event log.
int appendChunk(DiskFile& file, const void* data, size_t size);

/// Default path of the index of an event log: its name with the ".log" extension replaced by
/// "-index.log", in indexDir, or next to the event log if indexDir is empty.
string defaultIndexFilename(const string& logPath, const string& indexDir = {});

/// Tell if an index file exists and matches the current version of its event log.
bool isIndexValid(const string& logPath, const string& indexPath);

/// Scan an event log and write its index file.
/// @return 0 on success, OBSOLETE_FORMAT_VERSION if the event log's format isn't current, or an
/// error code.
int rebuildIndex(const string& logPath, const string& indexPath);

/// Read the chunk locations recorded in an index file.
int readIndex(const string& indexPath, vector<IndexEntry>& outEntries);

} // namespace roby
} // namespace pocods
