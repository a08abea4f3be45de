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
#include <string_view>

#include <pocods/os/Platform.h>

#if !IS_WINDOWS_PLATFORM()
#include <strings.h>
#endif

/*
 * Compatibility helpers along with non-fully standardized string utilities.
 */
namespace pocods {
namespace helpers {

// strncasecmp is named _strnicmp on Windows...
#if IS_WINDOWS_PLATFORM()
inline int strncasecmp(const char* first, const char* second, size_t size) {
  return _strnicmp(first, second, size);
}
#else
inline int strncasecmp(const char* first, const char* second, size_t size) {
  return ::strncasecmp(first, second, size);
}
#endif

/// Compare strings, as you'd expect in a modern desktop OS (Explorer/Finder), treating digit
/// sections as numbers, so that "task.2.log" is before "task.10.log".
/// Note: This is not a total order, since beforeFileName("image1.png", "image01.png") and
/// beforeFileName("image01.png", "image1.png") are both false!
bool beforeFileName(const char* left, const char* right);

/// Tell if a text string ends with the provided suffix.
/// @return True if text ends with suffix. Case insensitive.
bool endsWith(const std::string_view& text, const std::string_view& suffix);

/// Helper method to parse a string containing an uint64 value strictly.
/// @param str: the string that needs to be parsed.
/// @param outValue: the parsed value.
/// @return True if the string was parsed successfully and the string was a number only.
bool readUInt64(const std::string& str, uint64_t& outValue);

/// Helper method to print a file size in a human readable way,
/// using B, KB, MB, GB, TB...
std::string humanReadableFileSize(int64_t bytes);

} // namespace helpers
} // namespace pocods
