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

namespace pocods {

using std::string;

/// \brief Reporter class to be notified of messages and progress of long operations.
///
/// A reporter is passed explicitly down the call chain, so that each operation can report
/// warnings and progress without relying on global state.
/// By default, messages are logged using the "Reporter" log channel, and progress updates are
/// throttled, but this class can be overridden to report anywhere.
class Reporter {
 public:
  static constexpr double kDefaultUpdateDelay = 2;
  /// @param updateDelay: minimum time in seconds between two progress updates.
  explicit Reporter(double updateDelay = kDefaultUpdateDelay);
  virtual ~Reporter();

  virtual void info(const string& message);
  virtual void warn(const string& message);
  virtual void error(const string& message);

  /// Start reporting progress of a new operation.
  /// @param title: text describing the operation.
  /// @param total: total amount of work, typically in bytes. 0 if unknown.
  virtual void resetProgress(const string& title, uint64_t total);
  /// Report that some more work was done.
  /// @param amount: the amount of work done since the last call, in the same unit as total.
  virtual void advanceProgress(uint64_t amount);
  /// Report that the current operation is complete.
  virtual void finishProgress();

  uint64_t getProgress() const {
    return progress_;
  }
  uint64_t getProgressTotal() const {
    return total_;
  }

 protected:
  /// Called when a progress update passed the throttling.
  virtual void logProgress(const string& title, uint64_t progress, uint64_t total);

  double updateDelay_;
  double nextProgressTime_{};
  string title_;
  uint64_t progress_{};
  uint64_t total_{};
};

/// \brief Reporter to ignore all messages & progress notifications.
class NullReporter : public Reporter {
 public:
  ~NullReporter() override;
  void info(const string&) override {}
  void warn(const string&) override {}
  void error(const string&) override {}

 protected:
  void logProgress(const string&, uint64_t, uint64_t) override {}
};

} // namespace pocods
