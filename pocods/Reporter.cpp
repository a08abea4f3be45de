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


#include "Reporter.h"

#define DEFAULT_LOG_CHANNEL "Reporter"
#include <logging/Log.h>

#include <pocods/helpers/Strings.h>
#include <pocods/os/Time.h>

using namespace std;

namespace pocods {

Reporter::Reporter(double updateDelay) : updateDelay_{updateDelay} {}

Reporter::~Reporter() = default;

void Reporter::info(const string& message) {
  PDS_LOGI("{}", message);
}

void Reporter::warn(const string& message) {
  PDS_LOGW("{}", message);
}

void Reporter::error(const string& message) {
  PDS_LOGE("{}", message);
}

void Reporter::resetProgress(const string& title, uint64_t total) {
  title_ = title;
  progress_ = 0;
  total_ = total;
  nextProgressTime_ = os::getTimestampSec() + updateDelay_;
}

void Reporter::advanceProgress(uint64_t amount) {
  progress_ += amount;
  if (os::getTimestampSec() > nextProgressTime_) {
    logProgress(title_, progress_, total_);
    nextProgressTime_ = os::getTimestampSec() + updateDelay_;
  }
}

void Reporter::finishProgress() {
  if (!title_.empty()) {
    PDS_LOGD(
        "{} complete, {}.",
        title_,
        helpers::humanReadableFileSize(static_cast<int64_t>(progress_)));
  }
  title_.clear();
}

void Reporter::logProgress(const string& title, uint64_t progress, uint64_t total) {
  if (total > 0 && total >= progress) {
    PDS_LOGI("{} {}%...", title, progress * 100 / total);
  } else {
    PDS_LOGI("{} {}...", title, helpers::humanReadableFileSize(static_cast<int64_t>(progress)));
  }
}

NullReporter::~NullReporter() = default;

} // namespace pocods
