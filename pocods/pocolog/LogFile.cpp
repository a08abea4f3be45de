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


#include "LogFile.h"

#include <limits>

#include <yaml-cpp/yaml.h>

#define DEFAULT_LOG_CHANNEL "LogFile"
#include <logging/Log.h>

#include <pocods/ErrorCode.h>
#include <pocods/Reporter.h>
#include <pocods/helpers/FileMacros.h>

using namespace std;

namespace pocods {
namespace pocolog {

namespace {

// Strings larger than that can only come from a corrupt file
const uint32_t kMaxStringSize = 64 * 1024 * 1024;

} // namespace

bool StreamDeclaration::sameDefinition(const StreamDeclaration& other) const {
  return name == other.name && typeName == other.typeName && registry == other.registry &&
      metadataYaml == other.metadataYaml;
}

int parseMetadata(const string& yaml, map<string, string>& outMetadata) {
  outMetadata.clear();
  try {
    YAML::Node root = YAML::Load(yaml);
    if (root.IsNull()) {
      return SUCCESS;
    }
    if (!root.IsMap()) {
      return INVALID_METADATA;
    }
    for (const auto& entry : root) {
      const YAML::Node& value = entry.second;
      outMetadata[entry.first.as<string>()] = value.IsScalar() ? value.as<string>()
          : value.IsNull()                                     ? string()
                                                               : YAML::Dump(value);
    }
  } catch (const YAML::Exception& e) {
    outMetadata.clear();
    return domainErrorCode(ErrorDomain::YamlErrorDomain, e.mark.line + 1, e.msg.c_str());
  }
  return SUCCESS;
}

string metadataToYaml(const map<string, string>& metadata) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  for (const auto& entry : metadata) {
    out << YAML::Key << entry.first << YAML::Value << entry.second;
  }
  out << YAML::EndMap;
  return out.c_str();
}

int LogFile::open(const string& path, Reporter* reporter) {
  close();
  IF_ERROR_RETURN(file_.open(path));
  Prologue prologue;
  if (file_.read(prologue) != 0 || !prologue.looksLikePocolog()) {
    file_.close();
    return NOT_A_POCOLOG_FILE;
  }
  if (prologue.version.get() < kPocologFormatVersion) {
    PDS_LOGE(
        "{} uses pocolog format version {}, which is not supported",
        path,
        prologue.version.get());
    file_.close();
    return UNSUPPORTED_FORMAT_VERSION;
  }
  if ((prologue.flags.get() & kBigEndianFlag) != 0) {
    PDS_LOGE("{} is a big endian log file, which is not supported", path);
    file_.close();
    return NOT_SUPPORTED;
  }
  const int64_t fileSize = file_.getTotalSize();
  int64_t offset = static_cast<int64_t>(sizeof(Prologue));
  bool truncated = false;
  while (!truncated && offset + static_cast<int64_t>(sizeof(BlockHeader)) <= fileSize) {
    BlockHeader header;
    IF_ERROR_LOG_AND_RETURN(file_.setPos(offset));
    IF_ERROR_LOG_AND_RETURN(file_.read(header));
    const int64_t payloadOffset = offset + static_cast<int64_t>(sizeof(BlockHeader));
    const int64_t nextOffset = payloadOffset + header.payloadSize.get();
    if (nextOffset > fileSize) {
      warn(reporter, fmt::format("{}: truncated block at offset {}, ignored", path, offset));
      truncated = true;
      continue;
    }
    switch (header.getType()) {
      case BlockType::Stream:
        IF_ERROR_RETURN(readDeclaration(offset, header, reporter));
        break;
      case BlockType::Data: {
        DataBlockHeader dataHeader;
        if (header.payloadSize.get() < sizeof(DataBlockHeader)) {
          PDS_LOGE("{}: data block at offset {} is too small", path, offset);
          return INVALID_DISK_DATA;
        }
        IF_ERROR_LOG_AND_RETURN(file_.read(dataHeader));
        if (getStream(header.streamIndex.get()) == nullptr) {
          PDS_LOGE(
              "{}: data block at offset {} references undeclared stream {}",
              path,
              offset,
              header.streamIndex.get());
          return INVALID_DISK_DATA;
        }
        DataBlockInfo block;
        block.offset = offset;
        block.payloadSize = header.payloadSize.get();
        block.streamIndex = header.streamIndex.get();
        block.realTime = dataHeader.getRealTime();
        block.logicalTime = dataHeader.getLogicalTime();
        dataBlocks_.push_back(block);
      } break;
      default:
        // control blocks & unknown blocks are skipped
        break;
    }
    offset = nextOffset;
  }
  if (!truncated && offset < fileSize) {
    warn(reporter, fmt::format("{}: {} trailing bytes ignored", path, fileSize - offset));
  }
  return SUCCESS;
}

int LogFile::close() {
  streams_.clear();
  dataBlocks_.clear();
  return file_.close();
}

const StreamDeclaration* LogFile::getStream(uint16_t index) const {
  for (const auto& stream : streams_) {
    if (stream.index == index) {
      return &stream;
    }
  }
  return nullptr;
}

int LogFile::readString(uint32_t& inOutRemaining, string& outString) {
  uint32_t length = 0;
  if (inOutRemaining < sizeof(length)) {
    return INVALID_DISK_DATA;
  }
  IF_ERROR_RETURN(file_.read(length));
  inOutRemaining -= sizeof(length);
  if (length > inOutRemaining || length > kMaxStringSize) {
    return INVALID_DISK_DATA;
  }
  outString.resize(length);
  if (length > 0) {
    IF_ERROR_RETURN(file_.read(&outString[0], length));
  }
  inOutRemaining -= length;
  return SUCCESS;
}

int LogFile::readDeclaration(int64_t blockOffset, const BlockHeader& header, Reporter* reporter) {
  uint32_t remaining = header.payloadSize.get();
  uint8_t kind = 0;
  if (remaining < sizeof(kind)) {
    return INVALID_DISK_DATA;
  }
  IF_ERROR_RETURN(file_.read(kind));
  remaining -= sizeof(kind);
  if (kind != kDataStreamKind) {
    PDS_LOGD("{}: skipping stream of kind {}", getPath(), kind);
    return SUCCESS;
  }
  StreamDeclaration declaration;
  declaration.index = header.streamIndex.get();
  declaration.declarationOffset = blockOffset;
  int error = readString(remaining, declaration.name);
  if (error == 0) {
    error = readString(remaining, declaration.typeName);
  }
  if (error == 0) {
    error = readString(remaining, declaration.registry);
  }
  if (error == 0) {
    error = readString(remaining, declaration.metadataYaml);
  }
  if (error != 0) {
    PDS_LOGE(
        "{}: invalid stream declaration at offset {}: {}",
        getPath(),
        blockOffset,
        errorCodeToMessage(error));
    return error;
  }
  if (getStream(declaration.index) != nullptr) {
    PDS_LOGE("{}: stream index {} declared twice", getPath(), declaration.index);
    return INVALID_DISK_DATA;
  }
  int metadataError = parseMetadata(declaration.metadataYaml, declaration.metadata);
  if (metadataError != 0) {
    warn(
        reporter,
        fmt::format(
            "{}: invalid metadata for stream {}, ignored: {}",
            getPath(),
            declaration.name,
            errorCodeToMessage(metadataError)));
  }
  streams_.push_back(std::move(declaration));
  return SUCCESS;
}

void LogFile::warn(Reporter* reporter, const string& message) {
  if (reporter != nullptr) {
    reporter->warn(message);
  } else {
    PDS_LOGW("{}", message);
  }
}

int LogFile::readBlockPayload(const DataBlockInfo& block, vector<uint8_t>& outPayload) {
  outPayload.resize(block.payloadSize);
  IF_ERROR_RETURN(file_.setPos(block.offset + static_cast<int64_t>(sizeof(BlockHeader))));
  return file_.read(outPayload.data(), outPayload.size());
}

int LogFile::readSample(
    const DataBlockInfo& block,
    DataBlockHeader& outHeader,
    vector<uint8_t>& outData) {
  IF_ERROR_RETURN(file_.setPos(block.offset + static_cast<int64_t>(sizeof(BlockHeader))));
  IF_ERROR_RETURN(file_.read(outHeader));
  if (outHeader.dataSize.get() > block.payloadSize - sizeof(DataBlockHeader)) {
    return INVALID_DISK_DATA;
  }
  outData.resize(outHeader.dataSize.get());
  return file_.read(outData.data(), outData.size());
}

int LogFileWriter::create(const string& path) {
  IF_ERROR_LOG_AND_RETURN(file_.create(path));
  nextStreamIndex_ = 0;
  Prologue prologue;
  prologue.init();
  WRITE_OR_LOG_AND_RETURN(file_, &prologue, sizeof(prologue));
  return SUCCESS;
}

int LogFileWriter::writeString(const string& str) {
  uint32_t length = static_cast<uint32_t>(str.size());
  WRITE_OR_LOG_AND_RETURN(file_, &length, sizeof(length));
  WRITE_OR_LOG_AND_RETURN(file_, str.data(), str.size());
  return SUCCESS;
}

int LogFileWriter::declareStream(const StreamDeclaration& declaration, uint16_t& outIndex) {
  if (nextStreamIndex_ == numeric_limits<uint16_t>::max()) {
    return INVALID_PARAMETER;
  }
  const size_t payloadSize = sizeof(kDataStreamKind) + 4 * sizeof(uint32_t) +
      declaration.name.size() + declaration.typeName.size() + declaration.registry.size() +
      declaration.metadataYaml.size();
  outIndex = nextStreamIndex_++;
  BlockHeader header(BlockType::Stream, outIndex, static_cast<uint32_t>(payloadSize));
  WRITE_OR_LOG_AND_RETURN(file_, &header, sizeof(header));
  WRITE_OR_LOG_AND_RETURN(file_, &kDataStreamKind, sizeof(kDataStreamKind));
  IF_ERROR_RETURN(writeString(declaration.name));
  IF_ERROR_RETURN(writeString(declaration.typeName));
  IF_ERROR_RETURN(writeString(declaration.registry));
  return writeString(declaration.metadataYaml);
}

int LogFileWriter::declareStream(
    const string& name,
    const string& typeName,
    const map<string, string>& metadata,
    uint16_t& outIndex) {
  StreamDeclaration declaration;
  declaration.name = name;
  declaration.typeName = typeName;
  declaration.metadataYaml = metadataToYaml(metadata);
  return declareStream(declaration, outIndex);
}

int LogFileWriter::writeSample(
    uint16_t streamIndex,
    int64_t realTime,
    int64_t logicalTime,
    const void* data,
    size_t dataSize) {
  DataBlockHeader dataHeader;
  dataHeader.setTimes(realTime, logicalTime);
  dataHeader.dataSize.set(static_cast<uint32_t>(dataSize));
  dataHeader.compressed.set(0);
  BlockHeader header(
      BlockType::Data, streamIndex, static_cast<uint32_t>(sizeof(dataHeader) + dataSize));
  WRITE_OR_LOG_AND_RETURN(file_, &header, sizeof(header));
  WRITE_OR_LOG_AND_RETURN(file_, &dataHeader, sizeof(dataHeader));
  WRITE_OR_LOG_AND_RETURN(file_, data, dataSize);
  return SUCCESS;
}

int LogFileWriter::writeBlockPayload(uint16_t streamIndex, const vector<uint8_t>& payload) {
  BlockHeader header(BlockType::Data, streamIndex, static_cast<uint32_t>(payload.size()));
  WRITE_OR_LOG_AND_RETURN(file_, &header, sizeof(header));
  WRITE_OR_LOG_AND_RETURN(file_, payload.data(), payload.size());
  return SUCCESS;
}

int LogFileWriter::close() {
  return file_.close();
}

} // namespace pocolog
} // namespace pocods
