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

#include <cstdio>

#include <string>
#include <type_traits>

namespace pocods {

using std::string;

/// Buffered read or write access to a single disk file.
/// All int return values are 0 on success, or an error code, as described in ErrorCode.h.
class DiskFile {
 public:
  DiskFile() = default;
  DiskFile(DiskFile&& other) noexcept;
  DiskFile(const DiskFile&) = delete;
  DiskFile& operator=(const DiskFile&) = delete;
  ~DiskFile();

  /// Open a file in read-only mode.
  int open(const string& path);
  /// Create a new file, or truncate an existing one, and open it for writing.
  int create(const string& path);
  /// Open an existing file to append data at its end.
  int openForAppend(const string& path);
  bool isOpened() const {
    return file_ != nullptr;
  }
  int close();

  /// Read exactly length bytes, or fail with DISKFILE_NOT_ENOUGH_DATA at the end of the file.
  int read(void* buffer, size_t length);
  template <typename T, std::enable_if_t<std::is_trivially_copyable<T>::value, int> = 0>
  int read(T& object) {
    return read(&object, sizeof(object));
  }
  int write(const void* data, size_t dataSize);
  template <typename T, std::enable_if_t<std::is_trivially_copyable<T>::value, int> = 0>
  int write(const T& object) {
    return write(&object, sizeof(object));
  }
  int flush();

  int setPos(int64_t offset);
  int64_t getPos() const;
  /// Size of the file when opened, plus what was written since.
  int64_t getTotalSize() const {
    return totalSize_;
  }
  bool isEof() const;
  /// Number of bytes transfered by the last read or write operation.
  size_t getLastRWSize() const {
    return lastRWSize_;
  }
  const string& getPath() const {
    return path_;
  }

  /// Read a whole (small) file into a string.
  static int readTextFile(const string& path, string& outText);
  /// Write a string as the whole content of a file.
  static int writeTextFile(const string& path, const string& text);

 private:
  std::FILE* file_{};
  string path_;
  int64_t totalSize_{};
  size_t lastRWSize_{};
};

} // namespace pocods
