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

#include <pocods/os/FileLock.h>

#include <cerrno>
#include <cstdio>

#include <boost/interprocess/exceptions.hpp>

#define DEFAULT_LOG_CHANNEL "FileLock"
#include <logging/Log.h>

#include <pocods/os/Utils.h>

using namespace std;

namespace pocods {
namespace os {

FileLock::~FileLock() {
  unlock();
}

int FileLock::lock(const string& path) {
  if (lock_) {
    return 0;
  }
  if (!isFile(path)) {
    FILE* file = fileOpen(path, "ab");
    if (file == nullptr) {
      return errno;
    }
    fileClose(file);
  }
  try {
    auto fileLock = make_unique<boost::interprocess::file_lock>(path.c_str());
    fileLock->lock();
    lock_ = std::move(fileLock);
  } catch (const boost::interprocess::interprocess_exception& e) {
    PDS_LOGE("Can't lock '{}': {}", path, e.what());
    return e.get_native_error() != 0 ? e.get_native_error() : EIO;
  }
  return 0;
}

int FileLock::unlock() {
  if (!lock_) {
    return 0;
  }
  int error = 0;
  try {
    lock_->unlock();
  } catch (const boost::interprocess::interprocess_exception& e) {
    PDS_LOGE("Unlock failed: {}", e.what());
    error = e.get_native_error() != 0 ? e.get_native_error() : EIO;
  }
  lock_.reset();
  return error;
}

} // namespace os
} // namespace pocods
