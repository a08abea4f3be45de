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


#include "Streams.h"

#include <algorithm>
#include <cstring>
#include <limits>

#define DEFAULT_LOG_CHANNEL "Streams"
#include <logging/Log.h>

#include <pocods/ErrorCode.h>
#include <pocods/Reporter.h>
#include <pocods/helpers/FileMacros.h>
#include <pocods/helpers/Strings.h>
#include <pocods/os/FileList.h>
#include <pocods/os/Utils.h>
#include <pocods/pocolog/Compression.h>
#include <pocods/pocolog/LogFile.h>

using namespace std;

namespace pocods {
namespace pocolog {

namespace {

// Split "dir/base.N.log[.zst]" into "dir/base" and N.
bool parseSegmentName(const string& path, string& outBase, uint64_t& outSegment) {
  string name = path;
  if (isCompressed(name)) {
    name.resize(name.size() - strlen(kCompressedExtension));
  }
  const size_t kLogExtSize = 4; // ".log"
  if (!helpers::endsWith(name, ".log") || name.size() <= kLogExtSize) {
    return false;
  }
  name.resize(name.size() - kLogExtSize);
  size_t dot = name.rfind('.');
  if (dot == string::npos || !helpers::readUInt64(name.substr(dot + 1), outSegment)) {
    return false;
  }
  outBase = name.substr(0, dot);
  return !os::getFilename(outBase).empty();
}

struct StreamStats {
  uint64_t count{};
  int64_t rtFirst{};
  int64_t rtLast{};
  int64_t lgFirst{};
  int64_t lgLast{};
};

map<uint16_t, StreamStats> getStreamStats(const LogFile& file) {
  map<uint16_t, StreamStats> stats;
  for (const DataBlockInfo& block : file.getDataBlocks()) {
    StreamStats& s = stats[block.streamIndex];
    if (s.count++ == 0) {
      s.rtFirst = block.realTime;
      s.lgFirst = block.logicalTime;
    }
    s.rtLast = block.realTime;
    s.lgLast = block.logicalTime;
  }
  return stats;
}

} // namespace

string Stream::getMetadata(const string& key) const {
  auto iter = metadata.find(key);
  return iter != metadata.end() ? iter->second : string();
}

string Stream::getTaskName() const {
  return getMetadata(kTaskNameKey);
}

string Stream::getTaskObjectName() const {
  return getMetadata(kTaskObjectNameKey);
}

void Stream::append(
    uint64_t count,
    int64_t rtBegin,
    int64_t rtEnd,
    int64_t lgBegin,
    int64_t lgEnd) {
  if (count == 0) {
    return;
  }
  if (sampleCount == 0) {
    rtFirst = rtBegin;
    lgFirst = lgBegin;
  }
  rtLast = rtEnd;
  lgLast = lgEnd;
  sampleCount += count;
}

string normalizedFilename(const string& streamName, const map<string, string>& metadata) {
  auto task = metadata.find(kTaskNameKey);
  auto object = metadata.find(kTaskObjectNameKey);
  string name;
  if (task != metadata.end() && object != metadata.end()) {
    name = task->second + "::" + object->second;
  } else {
    name = streamName;
  }
  if (!name.empty() && name.front() == '/') {
    name.erase(0, 1);
  }
  replace(name.begin(), name.end(), '/', ':');
  return name;
}

void sanitizeMetadata(const string& streamName, map<string, string>& metadata, Reporter& reporter) {
  auto model = metadata.find(kTaskModelKey);
  if (model != metadata.end() && model->second.empty()) {
    reporter.warn(
        fmt::format("removing empty metadata property '{}' from {}", kTaskModelKey, streamName));
    metadata.erase(model);
  }
  auto task = metadata.find(kTaskNameKey);
  if (task != metadata.end()) {
    size_t slash = task->second.rfind('/');
    if (slash != string::npos) {
      task->second = task->second.substr(slash + 1);
    }
  }
}

vector<string> logfilesInDir(const string& dir) {
  vector<string> files;
  vector<string> logFiles;
  if (os::getFilesAndFolders(dir, files) != 0) {
    return logFiles;
  }
  string base;
  uint64_t segment = 0;
  for (string& file : files) {
    if (parseSegmentName(file, base, segment)) {
      logFiles.push_back(std::move(file));
    }
  }
  return logFiles;
}

vector<vector<string>> makeFileGroups(const vector<string>& files) {
  map<string, map<uint64_t, string>> segmentsPerBase;
  string base;
  uint64_t segment = 0;
  for (const string& file : files) {
    if (!parseSegmentName(file, base, segment)) {
      segmentsPerBase[file][0] = file;
      continue;
    }
    string& slot = segmentsPerBase[base][segment];
    // prefer plain files over their compressed version
    if (slot.empty() || isCompressed(slot)) {
      slot = file;
    }
  }
  vector<vector<string>> groups;
  groups.reserve(segmentsPerBase.size());
  for (const auto& segments : segmentsPerBase) {
    vector<string> group;
    for (const auto& segmentFile : segments.second) {
      group.push_back(segmentFile.second);
    }
    groups.push_back(std::move(group));
  }
  return groups;
}

string TaskStreams::getTaskName() const {
  return streams_.empty() ? string() : streams_.front().getTaskName();
}

const Stream* TaskStreams::findObjectStream(const string& objectName) const {
  for (const Stream& stream : streams_) {
    if (stream.getTaskObjectName() == objectName) {
      return &stream;
    }
  }
  return nullptr;
}

int Streams::fromDir(const string& dir, Streams& outStreams, Reporter& reporter) {
  outStreams = Streams();
  return outStreams.addDir(dir, reporter);
}

int Streams::addDir(const string& dir, Reporter& reporter) {
  vector<string> plainFiles;
  for (string& file : logfilesInDir(dir)) {
    if (!isCompressed(file)) {
      plainFiles.push_back(std::move(file));
    }
  }
  for (const vector<string>& group : makeFileGroups(plainFiles)) {
    IF_ERROR_RETURN(addFileGroup(group, reporter));
  }
  return SUCCESS;
}

int Streams::addFileGroup(const vector<string>& files, Reporter& reporter) {
  vector<Stream> groupStreams;
  for (const string& path : files) {
    LogFile file;
    int error = file.open(path, &reporter);
    if (error != 0) {
      PDS_LOGE("Can't open {}: {}", path, errorCodeToMessage(error));
      return error;
    }
    map<uint16_t, StreamStats> stats = getStreamStats(file);
    for (const StreamDeclaration& declaration : file.getStreams()) {
      auto existing =
          find_if(groupStreams.begin(), groupStreams.end(), [&declaration](const Stream& s) {
            return s.name == declaration.name;
          });
      if (existing == groupStreams.end()) {
        Stream stream;
        stream.name = declaration.name;
        stream.typeName = declaration.typeName;
        stream.metadata = declaration.metadata;
        groupStreams.push_back(std::move(stream));
        existing = groupStreams.end() - 1;
      } else if (existing->typeName != declaration.typeName) {
        PDS_LOGE(
            "Stream {} in {} has type {}, but {} in previous segments",
            declaration.name,
            path,
            declaration.typeName,
            existing->typeName);
        return INVALID_FOLLOWUP_STREAM;
      }
      if (existing->files.empty() || existing->files.back() != path) {
        existing->files.push_back(path);
      }
      const StreamStats& s = stats[declaration.index];
      existing->append(s.count, s.rtFirst, s.rtLast, s.lgFirst, s.lgLast);
    }
  }
  for (Stream& stream : groupStreams) {
    IF_ERROR_RETURN(addStream(std::move(stream), reporter));
  }
  return SUCCESS;
}

int Streams::addStream(Stream stream, Reporter& reporter) {
  sanitizeMetadata(stream.name, stream.metadata, reporter);
  const string taskName = stream.getTaskName();
  if (!taskName.empty()) {
    const string objectName = stream.getTaskObjectName();
    for (const Stream& other : streams_) {
      if (other.getTaskName() == taskName && other.getTaskObjectName() == objectName &&
          other.typeName == stream.typeName) {
        PDS_LOGE(
            "Stream {} duplicates {}: same task '{}', object '{}' and type '{}'",
            stream.name,
            other.name,
            taskName,
            objectName,
            stream.typeName);
        return DUPLICATE_STREAM;
      }
    }
  }
  streams_.push_back(std::move(stream));
  return SUCCESS;
}

vector<Stream> Streams::findAllStreams(const function<bool(const Stream&)>& predicate) const {
  vector<Stream> found;
  for (const Stream& stream : streams_) {
    if (predicate(stream)) {
      found.push_back(stream);
    }
  }
  return found;
}

bool Streams::findTaskByName(const string& taskName, TaskStreams& outTask) const {
  vector<Stream> streams =
      findAllStreams([&taskName](const Stream& s) { return s.getTaskName() == taskName; });
  if (streams.empty()) {
    return false;
  }
  outTask = TaskStreams(std::move(streams));
  return true;
}

void Streams::eachTask(const function<void(const TaskStreams&)>& callback) const {
  map<string, vector<Stream>> streamsPerTask;
  for (const Stream& stream : streams_) {
    const string taskName = stream.getTaskName();
    if (!taskName.empty() && !stream.getMetadata(kTaskModelKey).empty()) {
      streamsPerTask[taskName].push_back(stream);
    }
  }
  for (auto& task : streamsPerTask) {
    callback(TaskStreams(std::move(task.second)));
  }
}

double Streams::logicalDuration() const {
  int64_t first = numeric_limits<int64_t>::max();
  int64_t last = numeric_limits<int64_t>::min();
  for (const Stream& stream : streams_) {
    if (!stream.isEmpty()) {
      first = min(first, stream.lgFirst);
      last = max(last, stream.lgLast);
    }
  }
  return last >= first ? static_cast<double>(last - first) / 1000000 : 0;
}

} // namespace pocolog
} // namespace pocods
