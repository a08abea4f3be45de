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

/// Writing headers to disk, you must control endianness and have no padding so that you can read a
/// file written by any system, using any other system.
///
/// The LittleEndian<T> template allows the definition of types stored locally in a endian defined
/// way. Pocolog & Roby log files, as well as their index files, are all little endian.

namespace pocods {
namespace FileFormat {
#pragma pack(push, 1)

/// \brief Placeholder layer for endianness support, if we ever need it.
///
/// All it currently does is enforce that we read & write native types through get & set methods.
template <class T>
class LittleEndian final {
 public:
  LittleEndian() = default;
  explicit LittleEndian(T value) {
    set(value);
  }

  /// @return Value in host's endianness.
  T get() const {
    return value_;
  }
  /// @param value: Value in host's endianness.
  void set(T value) {
    value_ = value;
  }

 private:
  T value_{};
};

#pragma pack(pop)

/// Convert a (seconds, microseconds) pair into a single microseconds count.
inline int64_t toMicroseconds(uint32_t sec, uint32_t usec) {
  return static_cast<int64_t>(sec) * 1000000 + usec;
}

} // namespace FileFormat
} // namespace pocods
