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


#include <gtest/gtest.h>

#include <vector>

#include <pocods/Reporter.h>

using namespace std;
using namespace pocods;

namespace {

struct ReporterTest : testing::Test {};

// Negative delay: every advance passes the throttling
class ProgressRecorder : public NullReporter {
 public:
  ProgressRecorder() {
    updateDelay_ = -1;
  }
  vector<pair<uint64_t, uint64_t>> updates;

 protected:
  void logProgress(const string&, uint64_t progress, uint64_t total) override {
    updates.emplace_back(progress, total);
  }
};

} // namespace

TEST_F(ReporterTest, progress) {
  ProgressRecorder reporter;
  reporter.resetProgress("Copying", 100);
  EXPECT_EQ(reporter.getProgress(), 0);
  EXPECT_EQ(reporter.getProgressTotal(), 100);
  reporter.advanceProgress(30);
  reporter.advanceProgress(20);
  EXPECT_EQ(reporter.getProgress(), 50);
  ASSERT_EQ(reporter.updates.size(), 2);
  EXPECT_EQ(reporter.updates[1].first, 50);
  EXPECT_EQ(reporter.updates[1].second, 100);
  reporter.finishProgress();

  reporter.resetProgress("Indexing", 0);
  EXPECT_EQ(reporter.getProgress(), 0);
  EXPECT_EQ(reporter.getProgressTotal(), 0);
}

TEST_F(ReporterTest, throttling) {
  NullReporter reporter;
  reporter.resetProgress("Copying", 10);
  reporter.advanceProgress(4);
  reporter.advanceProgress(6);
  EXPECT_EQ(reporter.getProgress(), 10);
}
