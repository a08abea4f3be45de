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

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace pocods {

class Reporter;

namespace pocolog {

using std::map;
using std::string;
using std::vector;

/// Description of one data stream, possibly spread over multiple log files.
struct Stream {
  string name;
  string typeName;
  map<string, string> metadata;
  /// Log files backing the stream, in segment order.
  vector<string> files;
  uint64_t sampleCount{};
  int64_t rtFirst{};
  int64_t rtLast{};
  int64_t lgFirst{};
  int64_t lgLast{};

  bool isEmpty() const {
    return sampleCount == 0;
  }
  string getMetadata(const string& key) const;
  string getTaskName() const;
  string getTaskObjectName() const;
  /// Extend this stream with the samples of a follow-up segment.
  void append(uint64_t count, int64_t rtBegin, int64_t rtEnd, int64_t lgBegin, int64_t lgEnd);
};

/// Basename of the normalized file of a stream: <task>::<object>, with '/' replaced by ':'.
/// Streams without task metadata use their own name.
string normalizedFilename(const string& streamName, const map<string, string>& metadata);

/// Remove an empty task model & strip the namespace of the task name.
void sanitizeMetadata(const string& streamName, map<string, string>& metadata, Reporter& reporter);

/// Find the pocolog log files in a directory, named <base>.<N>.log or <base>.<N>.log.zst.
/// @return The files' paths, sorted.
vector<string> logfilesInDir(const string& dir);

/// Group the files of a list that are segments of the same logical log file, <base>.<N>.log.
/// Each group is sorted by segment number. Compressed files are grouped on their plain name.
/// Files that don't follow that naming scheme form a group of their own.
/// @return The groups, ordered by base name.
vector<vector<string>> makeFileGroups(const vector<string>& files);

/// \brief All the streams of a task.
class TaskStreams {
 public:
  TaskStreams() = default;
  explicit TaskStreams(vector<Stream> streams) : streams_{std::move(streams)} {}

  string getTaskName() const;
  const vector<Stream>& getStreams() const {
    return streams_;
  }
  /// Find the stream of a port or property, by its object name.
  const Stream* findObjectStream(const string& objectName) const;

 private:
  vector<Stream> streams_;
};

/// \brief A set of log streams.
///
/// In a set, a stream's identity (task name, object name and type) must be unique.
/// To mix streams with the same identity, load them in separate sets.
class Streams {
 public:
  /// Load all the plain log files of a directory.
  static int fromDir(const string& dir, Streams& outStreams, Reporter& reporter);

  /// Load all the plain log files of a directory.
  int addDir(const string& dir, Reporter& reporter);
  /// Load the streams of a group of files, which are segments of the same log file.
  int addFileGroup(const vector<string>& files, Reporter& reporter);
  /// Add a stream, after sanitizing its metadata.
  /// @return 0 on success, DUPLICATE_STREAM if a stream with the same identity exists.
  int addStream(Stream stream, Reporter& reporter);

  size_t numStreams() const {
    return streams_.size();
  }
  const vector<Stream>& getStreams() const {
    return streams_;
  }

  vector<Stream> findAllStreams(const std::function<bool(const Stream&)>& predicate) const;
  /// Find all the streams of a task.
  /// @return True if at least one stream belongs to that task.
  bool findTaskByName(const string& taskName, TaskStreams& outTask) const;
  /// Enumerate the streams grouped per task, for the streams that have a task name & model.
  void eachTask(const std::function<void(const TaskStreams&)>& callback) const;

  /// Logical time span covered by all the streams, in seconds.
  /// @return Last logical time minus first logical time, or 0 if there are no samples.
  double logicalDuration() const;

 private:
  vector<Stream> streams_;
};

} // namespace pocolog
} // namespace pocods
