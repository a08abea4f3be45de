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

#include <pocods/Reporter.h>
#include <pocods/roby/EventLog.h>

namespace pocods {
namespace test {

using std::map;
using std::string;
using std::vector;

// Shared infra to create the log files used in different tests

constexpr const char* kTestTaskModel = "test::Task";
constexpr const char* kTestTypeName = "/int32_t";

struct TestSample {
  int64_t realTime; ///< microseconds
  int64_t logicalTime; ///< microseconds
  int32_t value;
};

struct TestStream {
  string name;
  string typeName{kTestTypeName};
  map<string, string> metadata;
  vector<TestSample> samples;
};

/// Stream of a task's port, with the metadata the Rock logger writes.
TestStream makeTaskStream(
    const string& taskName,
    const string& objectName,
    const vector<TestSample>& samples = {},
    const string& typeName = kTestTypeName);

/// Create a pocolog file, with its streams' samples interleaved in logical time order.
int createPocologFile(const string& path, const vector<TestStream>& streams);

/// Create a Roby event log, with one chunk per string.
int createRobyEventLog(
    const string& path,
    uint32_t formatVersion = roby::kEventLogFormatVersion,
    const vector<string>& chunks = {"chunk0", "chunk1"});

/// Create a text file, and its parent folders.
int createTextFile(const string& path, const string& content);

/// Create a new & empty folder in the temp folder.
string makeTestFolder(const string& name);

/// Reporter recording messages, to verify what an operation reports.
class RecordingReporter : public NullReporter {
 public:
  void info(const string& message) override {
    infos.push_back(message);
  }
  void warn(const string& message) override {
    warnings.push_back(message);
  }
  void error(const string& message) override {
    errors.push_back(message);
  }
  bool hasWarning(const string& message) const;

  vector<string> infos;
  vector<string> warnings;
  vector<string> errors;
};

} // namespace test
} // namespace pocods
