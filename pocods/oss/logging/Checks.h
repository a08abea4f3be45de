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

#include <string>

#include <fmt/core.h>

namespace pocods {
namespace logging {

void logAndAbort(const char* condition, const std::string& message = {});

} // namespace logging
} // namespace pocods

//
// Check Macros.
// Only for conditions that can only fail because of a programming error.
//

#define PDS_CHECK_FORMAT(condition, fmtstr, ...) \
  ((condition)                                   \
       ? 0                                       \
       : ((pocods::logging::logAndAbort(#condition, fmt::format(fmtstr, ##__VA_ARGS__))), 0))

#define PDS_CHECK(condition, ...) PDS_CHECK_FORMAT(condition, "" __VA_ARGS__)

#define PDS_CHECK_EQ(val1, val2, ...) PDS_CHECK((val1) == (val2), ##__VA_ARGS__)

#define PDS_CHECK_NE(val1, val2, ...) PDS_CHECK((val1) != (val2), ##__VA_ARGS__)

#define PDS_CHECK_GE(val1, val2, ...) PDS_CHECK((val1) >= (val2), ##__VA_ARGS__)

#define PDS_CHECK_LE(val1, val2, ...) PDS_CHECK((val1) <= (val2), ##__VA_ARGS__)

#define PDS_CHECK_NOTNULL(val, ...) PDS_CHECK((val) != nullptr, ##__VA_ARGS__)
