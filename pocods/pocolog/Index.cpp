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


#include "Index.h"

#include <algorithm>
#include <map>

#define DEFAULT_LOG_CHANNEL "PocologIndex"
#include <logging/Log.h>

#include <pocods/DiskFile.h>
#include <pocods/ErrorCode.h>
#include <pocods/helpers/FileMacros.h>
#include <pocods/helpers/Strings.h>
#include <pocods/os/Utils.h>
#include <pocods/pocolog/LogFile.h>
#include <pocods/utils/xxhash/xxhash.h>

using namespace std;

namespace pocods {
namespace pocolog {

string defaultIndexFilename(const string& logPath, const string& indexDir) {
  string name = os::getFilename(logPath);
  if (helpers::endsWith(name, ".log")) {
    name.resize(name.size() - 4);
  }
  name += ".idx";
  return indexDir.empty() ? os::pathJoin(os::getParentFolder(logPath), name)
                          : os::pathJoin(indexDir, name);
}

int computeFingerprint(const string& logPath, uint64_t& outFingerprint) {
  DiskFile file;
  IF_ERROR_RETURN(file.open(logPath));
  vector<uint8_t> head(static_cast<size_t>(min<int64_t>(file.getTotalSize(), kFingerprintSize)));
  IF_ERROR_RETURN(file.read(head.data(), head.size()));
  XXH64Digester digester;
  outFingerprint = digester.ingest(head.data(), head.size()).digest();
  return SUCCESS;
}

namespace {

int readIndexHeader(DiskFile& file, IndexHeader& outHeader) {
  if (file.read(outHeader) != 0 || !outHeader.looksLikeIndex()) {
    return INVALID_INDEX_FILE;
  }
  return SUCCESS;
}

} // namespace

bool isIndexValid(const string& logPath, const string& indexPath) {
  if (!os::isFile(logPath) || !os::isFile(indexPath)) {
    return false;
  }
  DiskFile file;
  IndexHeader header;
  if (file.open(indexPath) != 0 || readIndexHeader(file, header) != 0) {
    return false;
  }
  int64_t mtimeNs = 0;
  uint64_t fingerprint = 0;
  if (os::getModificationTimeNs(logPath, mtimeNs) != 0 ||
      computeFingerprint(logPath, fingerprint) != 0) {
    return false;
  }
  return header.logFileSize.get() == static_cast<uint64_t>(os::getFileSize(logPath)) &&
      header.logFileMtimeNs.get() == mtimeNs && header.headFingerprint.get() == fingerprint;
}

int rebuildIndex(const string& logPath, const string& indexPath) {
  LogFile logFile;
  IF_ERROR_LOG_AND_RETURN(logFile.open(logPath));
  IndexHeader header;
  header.init();
  int64_t mtimeNs = 0;
  uint64_t fingerprint = 0;
  IF_ERROR_LOG_AND_RETURN(os::getModificationTimeNs(logPath, mtimeNs));
  IF_ERROR_LOG_AND_RETURN(computeFingerprint(logPath, fingerprint));
  header.logFileSize.set(static_cast<uint64_t>(logFile.getFileSize()));
  header.logFileMtimeNs.set(mtimeNs);
  header.headFingerprint.set(fingerprint);
  header.streamCount.set(static_cast<uint32_t>(logFile.getStreams().size()));

  map<uint16_t, vector<const DataBlockInfo*>> blocksPerStream;
  for (const DataBlockInfo& block : logFile.getDataBlocks()) {
    blocksPerStream[block.streamIndex].push_back(&block);
  }

  DiskFile file;
  IF_ERROR_LOG_AND_RETURN(file.create(indexPath));
  WRITE_OR_LOG_AND_RETURN(file, &header, sizeof(header));
  for (const StreamDeclaration& stream : logFile.getStreams()) {
    const vector<const DataBlockInfo*>& blocks = blocksPerStream[stream.index];
    IndexStreamEntry entry;
    entry.index.set(stream.index);
    entry.declarationOffset.set(static_cast<uint64_t>(stream.declarationOffset));
    entry.sampleCount.set(blocks.size());
    if (!blocks.empty()) {
      entry.rtFirst.set(blocks.front()->realTime);
      entry.rtLast.set(blocks.back()->realTime);
      entry.lgFirst.set(blocks.front()->logicalTime);
      entry.lgLast.set(blocks.back()->logicalTime);
    }
    WRITE_OR_LOG_AND_RETURN(file, &entry, sizeof(entry));
    for (const DataBlockInfo* block : blocks) {
      IndexSampleEntry sample;
      sample.blockOffset.set(static_cast<uint64_t>(block->offset));
      sample.lgTime.set(block->logicalTime);
      WRITE_OR_LOG_AND_RETURN(file, &sample, sizeof(sample));
    }
  }
  return file.close();
}

int readIndex(const string& indexPath, IndexInfo& outInfo) {
  outInfo = IndexInfo();
  DiskFile file;
  IF_ERROR_RETURN(file.open(indexPath));
  IndexHeader header;
  IF_ERROR_RETURN(readIndexHeader(file, header));
  outInfo.logFileSize = header.logFileSize.get();
  outInfo.logFileMtimeNs = header.logFileMtimeNs.get();
  outInfo.headFingerprint = header.headFingerprint.get();
  for (uint32_t k = 0; k < header.streamCount.get(); k++) {
    IndexStreamEntry entry;
    if (file.read(entry) != 0) {
      return INVALID_INDEX_FILE;
    }
    IndexedStream stream;
    stream.index = entry.index.get();
    stream.declarationOffset = static_cast<int64_t>(entry.declarationOffset.get());
    stream.sampleCount = entry.sampleCount.get();
    stream.rtFirst = entry.rtFirst.get();
    stream.rtLast = entry.rtLast.get();
    stream.lgFirst = entry.lgFirst.get();
    stream.lgLast = entry.lgLast.get();
    const int64_t entriesSize = static_cast<int64_t>(stream.sampleCount * sizeof(IndexSampleEntry));
    if (file.getPos() + entriesSize > file.getTotalSize()) {
      return INVALID_INDEX_FILE;
    }
    stream.blockOffsets.reserve(stream.sampleCount);
    stream.logicalTimes.reserve(stream.sampleCount);
    for (uint64_t s = 0; s < stream.sampleCount; s++) {
      IndexSampleEntry sample;
      IF_ERROR_RETURN(file.read(sample));
      stream.blockOffsets.push_back(static_cast<int64_t>(sample.blockOffset.get()));
      stream.logicalTimes.push_back(sample.lgTime.get());
    }
    outInfo.streams.push_back(std::move(stream));
  }
  return SUCCESS;
}

} // namespace pocolog
} // namespace pocods
