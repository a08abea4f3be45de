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

#include <map>
#include <string>
#include <vector>

#include <pocods/DiskFile.h>
#include <pocods/pocolog/LogFormat.h>

namespace pocods {

class Reporter;

namespace pocolog {

using std::map;
using std::string;
using std::vector;

/// Metadata key names used by the stream producers.
constexpr const char* kTaskNameKey = "rock_task_name";
constexpr const char* kTaskObjectNameKey = "rock_task_object_name";
constexpr const char* kTaskModelKey = "rock_task_model";
constexpr const char* kStreamTypeKey = "rock_stream_type";

/// Description of a stream, as found in a stream declaration block.
struct StreamDeclaration {
  uint16_t index{};
  string name;
  string typeName;
  string registry;
  /// Metadata as found in the file, copied verbatim when the stream is rewritten.
  string metadataYaml;
  /// Metadata, parsed from metadataYaml.
  map<string, string> metadata;
  /// Offset of the declaration's block header in the file.
  int64_t declarationOffset{};

  /// Tell if two declarations describe the same stream, regardless of their index.
  bool sameDefinition(const StreamDeclaration& other) const;
};

/// Location & timestamps of a data block.
struct DataBlockInfo {
  int64_t offset{}; ///< offset of the block's header in the file
  uint32_t payloadSize{};
  uint16_t streamIndex{};
  int64_t realTime{}; ///< microseconds
  int64_t logicalTime{}; ///< microseconds
};

/// Parse a stream's metadata, a YAML mapping of scalar values.
/// Non-scalar values are kept as their YAML text.
/// @return 0 on success, or an error code if the text isn't a valid YAML mapping.
int parseMetadata(const string& yaml, map<string, string>& outMetadata);
/// Convert metadata into a YAML mapping.
string metadataToYaml(const map<string, string>& metadata);

/// \brief Block-level reader of a pocolog log file.
///
/// Opening a file scans all its blocks, so that stream declarations and data block locations are
/// available immediately. Sample payloads are never interpreted.
class LogFile {
 public:
  LogFile() = default;

  /// Open a log file & scan its blocks.
  /// A truncated last block is dropped with a warning, as it happens when a recording is
  /// interrupted.
  /// @param path: path of the log file.
  /// @param reporter: optional, to report warnings. If null, warnings are logged.
  /// @return 0 on success, or an error code.
  int open(const string& path, Reporter* reporter = nullptr);
  int close();

  const string& getPath() const {
    return file_.getPath();
  }
  int64_t getFileSize() const {
    return file_.getTotalSize();
  }
  const vector<StreamDeclaration>& getStreams() const {
    return streams_;
  }
  /// All the data blocks, in file order.
  const vector<DataBlockInfo>& getDataBlocks() const {
    return dataBlocks_;
  }
  const StreamDeclaration* getStream(uint16_t index) const;

  /// Read the whole payload of a data block, data block header included.
  int readBlockPayload(const DataBlockInfo& block, vector<uint8_t>& outPayload);
  /// Read a data block's header & sample bytes.
  int readSample(const DataBlockInfo& block, DataBlockHeader& outHeader, vector<uint8_t>& outData);

 private:
  int readString(uint32_t& inOutRemaining, string& outString);
  int readDeclaration(int64_t blockOffset, const BlockHeader& header, Reporter* reporter);
  void warn(Reporter* reporter, const string& message);

  DiskFile file_;
  vector<StreamDeclaration> streams_;
  vector<DataBlockInfo> dataBlocks_;
};

/// \brief Writer of pocolog log files.
class LogFileWriter {
 public:
  /// Create a log file & write its prologue.
  int create(const string& path);
  /// Declare a stream, copying the declaration verbatim.
  /// @param declaration: the stream to declare. Its index is ignored.
  /// @param outIndex: set to the index of the new stream in this file.
  int declareStream(const StreamDeclaration& declaration, uint16_t& outIndex);
  int declareStream(
      const string& name,
      const string& typeName,
      const map<string, string>& metadata,
      uint16_t& outIndex);
  /// Write a sample's bytes.
  /// @param realTime: sample's real time, in microseconds.
  /// @param logicalTime: sample's logical time, in microseconds.
  int writeSample(
      uint16_t streamIndex,
      int64_t realTime,
      int64_t logicalTime,
      const void* data,
      size_t dataSize);
  /// Write a data block payload, as read by LogFile::readBlockPayload().
  int writeBlockPayload(uint16_t streamIndex, const vector<uint8_t>& payload);
  int close();

  bool isOpened() const {
    return file_.isOpened();
  }

 private:
  int writeString(const string& str);

  DiskFile file_;
  uint16_t nextStreamIndex_{};
};

} // namespace pocolog
} // namespace pocods
