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

namespace pocods {
namespace os {

/// Time in seconds since some unspecified point in time, which might be the last boot time.
/// This time is guaranteed to be monotonous throughout the run of the app.
double getTimestampSec();

/// Epoch time may be adjusted at any point in time, it is NOT a monotonic clock.
/// Use it only when the time needs to be persisted, like in import records.
int64_t getCurrentTimeSecSinceEpoch();

} // namespace os
} // namespace pocods
