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

#include <memory>
#include <string>

#include <boost/interprocess/sync/file_lock.hpp>

namespace pocods {
namespace os {

/// Exclusive advisory lock on a file, shared between processes.
/// The lock is owned by the process, not the thread: it does not exclude threads of the same
/// process from each other.
class FileLock {
 public:
  FileLock() = default;
  ~FileLock();
  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;

  /// Block until the lock is acquired. Creates the lock file if needed.
  /// @return 0 on success, or an errno value.
  int lock(const std::string& path);
  int unlock();
  bool isLocked() const {
    return lock_ != nullptr;
  }

 private:
  std::unique_ptr<boost::interprocess::file_lock> lock_;
};

} // namespace os
} // namespace pocods
