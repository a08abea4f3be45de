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

namespace pocods {
namespace pocolog {

using std::string;
using std::vector;

/// Index information about one stream of a log file.
struct IndexedStream {
  uint16_t index{};
  int64_t declarationOffset{};
  uint64_t sampleCount{};
  int64_t rtFirst{};
  int64_t rtLast{};
  int64_t lgFirst{};
  int64_t lgLast{};
  /// Offset of each sample's block, in the file.
  vector<int64_t> blockOffsets;
  /// Logical time of each sample, in microseconds.
  vector<int64_t> logicalTimes;
};

struct IndexInfo {
  uint64_t logFileSize{};
  int64_t logFileMtimeNs{};
  uint64_t headFingerprint{};
  vector<IndexedStream> streams;
};

/// Default path of the index file of a log file: its name with the ".log" extension replaced by
/// ".idx", in indexDir, or next to the log file if indexDir is empty.
string defaultIndexFilename(const string& logPath, const string& indexDir = {});

/// Fingerprint of a log file, based on its first bytes.
int computeFingerprint(const string& logPath, uint64_t& outFingerprint);

/// Tell if an index file exists and matches the current version of its log file.
/// The log file's size, modification time & fingerprint must all match.
bool isIndexValid(const string& logPath, const string& indexPath);

/// Scan a log file and write its index file.
/// The index is written directly at indexPath: callers wanting atomicity should write to a
/// temporary path, then rename.
/// @return 0 on success, or an error code.
int rebuildIndex(const string& logPath, const string& indexPath);

/// Read an index file.
/// @return 0 on success, or an error code, INVALID_INDEX_FILE if the file isn't an index.
int readIndex(const string& indexPath, IndexInfo& outInfo);

} // namespace pocolog
} // namespace pocods
