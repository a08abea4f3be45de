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

namespace pocods {

using std::string;
using std::string_view;

/// Number of values in an enum, which must have a "COUNT" value after all the others.
template <class Enum>
constexpr uint32_t enumCount() {
  return static_cast<uint32_t>(Enum::COUNT);
}

template <typename T, size_t N>
inline constexpr size_t array_size(const T (&)[N]) {
  return N;
}

/*
 * Helper template class to convert enums to strings & back, in trivial cases.
 * Requirements:
 *  - the enum type must be cast-able to size_t
 *  - the enum values must map to a string_view static array of names
 *  - the first value is reserved for the uninitialized state, and is never matched by toEnum()
 *
 * Sample:
 *   enum class Command { None, Import, List, COUNT };
 *   static string_view sCommandNames[] = {"none", "import", "list"};
 *   ENUM_STRING_CONVERTER(Command, sCommandNames, Command::None);
 *
 *   CommandConverter::toString(Command::Import) -> "import"
 *   CommandConverter::toEnum("list") -> Command::List
 */
template <class E, const string_view NAMES[], size_t NAMES_COUNT, E DEFAULT_ENUM>
struct EnumStringConverter {
  static constexpr size_t cNamesCount = NAMES_COUNT;

  static string_view toStringView(E value) {
    const size_t index = static_cast<size_t>(value);
    return index < cNamesCount ? NAMES[index] : "<Invalid value>";
  }
  inline static string toString(E value) {
    return string(toStringView(value));
  }

  // Case sensitive string to enum conversion
  static E toEnum(string_view name) {
    for (size_t k = 1; k < cNamesCount; k++) {
      if (name == NAMES[k]) {
        return static_cast<E>(k);
      }
    }
    return DEFAULT_ENUM;
  }
};

#define ENUM_STRING_CONVERTER(E, NAMES, DEFAULT_ENUM)                                           \
  struct E##Converter                                                                           \
      : public pocods::EnumStringConverter<E, NAMES, pocods::array_size(NAMES), DEFAULT_ENUM> { \
    static_assert(cNamesCount == pocods::enumCount<E>(), "Non-matching count of " #E " names"); \
  };

} // namespace pocods
