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

#include "Strings.h"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstring>

#include <algorithm>

#include <fmt/format.h>

namespace pocods {
namespace helpers {

using namespace std;

bool endsWith(const string_view& text, const string_view& suffix) {
  return text.length() >= suffix.length() &&
      helpers::strncasecmp(
          text.data() + text.length() - suffix.length(), suffix.data(), suffix.length()) == 0;
}

inline bool isdigit(char c) {
  return std::isdigit(static_cast<uint8_t>(c));
}

static uint32_t lastDigitIndex(const char* str, uint32_t index) {
  while (isdigit(str[index + 1])) {
    index++;
  }
  return index;
}

inline char paddedChar(const char* str, uint32_t pos, uint32_t pad, uint32_t index) {
  return index < pad ? '0' : str[pos + index - pad];
}

bool beforeFileName(const char* left, const char* right) {
  uint32_t leftPos = 0;
  uint32_t rightPos = 0;
  bool bothDigits = false;
  while ((bothDigits = (isdigit(left[leftPos]) && isdigit(right[rightPos]))) ||
         (left[leftPos] == right[rightPos] && left[leftPos] != 0)) {
    if (bothDigits) {
      uint32_t leftDigitLength = lastDigitIndex(left, leftPos) - leftPos;
      uint32_t rightDigitLength = lastDigitIndex(right, rightPos) - rightPos;
      uint32_t leftPad =
          leftDigitLength < rightDigitLength ? rightDigitLength - leftDigitLength : 0;
      uint32_t rightPad =
          rightDigitLength < leftDigitLength ? leftDigitLength - rightDigitLength : 0;
      uint32_t lastDigitIndex = max<uint32_t>(leftDigitLength, rightDigitLength);
      for (uint32_t digitIndex = 0; digitIndex <= lastDigitIndex; digitIndex++) {
        char lc = paddedChar(left, leftPos, leftPad, digitIndex);
        char rc = paddedChar(right, rightPos, rightPad, digitIndex);
        if (lc != rc) {
          return lc < rc;
        }
      }
      leftPos += leftDigitLength;
      rightPos += rightDigitLength;
    }
    leftPos++, rightPos++;
  }
  if (left[leftPos] == 0) {
    return right[rightPos] != 0;
  }
  return left[leftPos] < right[rightPos];
}

string humanReadableFileSize(int64_t bytes) {
  const char* sign = "";
  if (bytes < 0) {
    sign = "-";
    bytes = -bytes;
  }
  uint64_t ubytes = static_cast<uint64_t>(bytes);
  const uint64_t kB = 1 << 10; // aka 1024
  if (ubytes < kB) {
    return fmt::format("{}{} B", sign, ubytes);
  }
  const char* unitFactor = "KMGTPE";
  const uint64_t unitFactorsLimit = strlen(unitFactor) - 1;
  uint64_t factor = kB;
  uint64_t e = 0;
  while (e < unitFactorsLimit && ubytes >= (factor << 10)) {
    e++;
    factor <<= 10;
  }
  char pre = unitFactor[e];
  uint64_t intPart = ubytes >> ((e + 1) * 10);
  if (intPart >= 100) {
    // avoid scientific notation switch for 100-1023...
    return fmt::format("{}{} {}iB", sign, intPart, pre);
  }
  double rest = double((ubytes % factor) >> e * 10) / kB;
  if (intPart >= 10) {
    double r = intPart + floor(rest * 16) / 16; // prevent rounding up when there are too many 9s
    return fmt::format("{}{:.1f} {}iB", sign, r, pre);
  }
  double r = intPart + floor(rest * 160) / 160; // prevent rounding up when there are too many 9s
  return fmt::format("{}{:.2f} {}iB", sign, r, pre);
}

bool readUInt64(const std::string& str, uint64_t& outValue) {
  if (!str.empty() && isdigit(str.front())) {
    char* next = nullptr;
    errno = 0;
    outValue = std::strtoull(str.c_str(), &next, 10);
    if (*next == 0 && (outValue != ULLONG_MAX || errno == 0)) {
      return true;
    }
  }
  outValue = 0;
  return false;
}

} // namespace helpers
} // namespace pocods
