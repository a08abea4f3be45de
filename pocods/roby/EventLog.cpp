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


#include "EventLog.h"

#include <cstring>

#define DEFAULT_LOG_CHANNEL "EventLog"
#include <logging/Log.h>

#include <pocods/ErrorCode.h>
#include <pocods/helpers/FileMacros.h>
#include <pocods/helpers/Strings.h>
#include <pocods/os/Utils.h>

using namespace std;

namespace pocods {
namespace roby {

void Header::init(uint32_t formatVersion) {
  memcpy(magic, kEventLogMagic, kEventLogMagicSize);
  version.set(formatVersion);
}

bool Header::looksLikeEventLog() const {
  return memcmp(magic, kEventLogMagic, kEventLogMagicSize) == 0;
}

void IndexHeader::init() {
  memcpy(magic, kIndexMagic, kIndexMagicSize);
  version.set(kIndexFormatVersion);
  logFileSize.set(0);
  logFileMtimeNs.set(0);
  chunkCount.set(0);
}

bool IndexHeader::looksLikeIndex() const {
  return memcmp(magic, kIndexMagic, kIndexMagicSize) == 0 &&
      version.get() == kIndexFormatVersion;
}

int readFormatVersion(const string& path, uint32_t& outVersion) {
  outVersion = 0;
  DiskFile file;
  IF_ERROR_RETURN(file.open(path));
  Header header;
  if (file.read(header) != 0 || !header.looksLikeEventLog()) {
    return NOT_A_ROBY_LOG_FILE;
  }
  outVersion = header.version.get();
  return SUCCESS;
}

int writeHeader(DiskFile& file, uint32_t formatVersion) {
  Header header;
  header.init(formatVersion);
  WRITE_OR_LOG_AND_RETURN(file, &header, sizeof(header));
  return SUCCESS;
}

int appendChunk(DiskFile& file, const void* data, size_t size) {
  uint32_t chunkSize = static_cast<uint32_t>(size);
  WRITE_OR_LOG_AND_RETURN(file, &chunkSize, sizeof(chunkSize));
  WRITE_OR_LOG_AND_RETURN(file, data, size);
  return SUCCESS;
}

string defaultIndexFilename(const string& logPath, const string& indexDir) {
  string name = os::getFilename(logPath);
  if (helpers::endsWith(name, ".log")) {
    name.resize(name.size() - 4);
  }
  name += kIndexSuffix;
  return indexDir.empty() ? os::pathJoin(os::getParentFolder(logPath), name)
                          : os::pathJoin(indexDir, name);
}

bool isIndexValid(const string& logPath, const string& indexPath) {
  if (!os::isFile(logPath) || !os::isFile(indexPath)) {
    return false;
  }
  DiskFile file;
  IndexHeader header;
  if (file.open(indexPath) != 0 || file.read(header) != 0 || !header.looksLikeIndex()) {
    return false;
  }
  int64_t mtimeNs = 0;
  if (os::getModificationTimeNs(logPath, mtimeNs) != 0) {
    return false;
  }
  const int64_t expectedSize = static_cast<int64_t>(
      sizeof(IndexHeader) + header.chunkCount.get() * sizeof(IndexEntry));
  return header.logFileSize.get() == static_cast<uint64_t>(os::getFileSize(logPath)) &&
      header.logFileMtimeNs.get() == mtimeNs && file.getTotalSize() == expectedSize;
}

int rebuildIndex(const string& logPath, const string& indexPath) {
  DiskFile log;
  IF_ERROR_LOG_AND_RETURN(log.open(logPath));
  Header header;
  if (log.read(header) != 0 || !header.looksLikeEventLog()) {
    PDS_LOGE("{} is not a Roby event log", logPath);
    return NOT_A_ROBY_LOG_FILE;
  }
  if (header.version.get() < kEventLogFormatVersion) {
    return OBSOLETE_FORMAT_VERSION;
  }
  if (header.version.get() > kEventLogFormatVersion) {
    PDS_LOGE("{} uses an unknown format version {}", logPath, header.version.get());
    return UNSUPPORTED_FORMAT_VERSION;
  }
  vector<IndexEntry> entries;
  const int64_t fileSize = log.getTotalSize();
  int64_t offset = static_cast<int64_t>(sizeof(Header));
  while (offset + static_cast<int64_t>(sizeof(uint32_t)) <= fileSize) {
    uint32_t chunkSize = 0;
    IF_ERROR_LOG_AND_RETURN(log.setPos(offset));
    IF_ERROR_LOG_AND_RETURN(log.read(chunkSize));
    const int64_t dataOffset = offset + static_cast<int64_t>(sizeof(chunkSize));
    if (dataOffset + chunkSize > fileSize) {
      PDS_LOGW("{}: truncated chunk at offset {}, ignored", logPath, offset);
      break;
    }
    IndexEntry entry;
    entry.offset.set(static_cast<uint64_t>(dataOffset));
    entry.size.set(chunkSize);
    entries.push_back(entry);
    offset = dataOffset + chunkSize;
  }

  int64_t mtimeNs = 0;
  IF_ERROR_LOG_AND_RETURN(os::getModificationTimeNs(logPath, mtimeNs));
  IndexHeader indexHeader;
  indexHeader.init();
  indexHeader.logFileSize.set(static_cast<uint64_t>(fileSize));
  indexHeader.logFileMtimeNs.set(mtimeNs);
  indexHeader.chunkCount.set(entries.size());
  DiskFile index;
  IF_ERROR_LOG_AND_RETURN(index.create(indexPath));
  WRITE_OR_LOG_AND_RETURN(index, &indexHeader, sizeof(indexHeader));
  WRITE_OR_LOG_AND_RETURN(index, entries.data(), entries.size() * sizeof(IndexEntry));
  return index.close();
}

int readIndex(const string& indexPath, vector<IndexEntry>& outEntries) {
  outEntries.clear();
  DiskFile file;
  IF_ERROR_RETURN(file.open(indexPath));
  IndexHeader header;
  if (file.read(header) != 0 || !header.looksLikeIndex()) {
    return INVALID_INDEX_FILE;
  }
  const uint64_t count = header.chunkCount.get();
  const uint64_t expectedSize = sizeof(IndexHeader) + count * sizeof(IndexEntry);
  if (expectedSize != static_cast<uint64_t>(file.getTotalSize())) {
    return INVALID_INDEX_FILE;
  }
  outEntries.resize(count);
  return file.read(outEntries.data(), count * sizeof(IndexEntry));
}

} // namespace roby
} // namespace pocods
