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


#include <pocods/DiskFile.h>

#include <cerrno>

#define DEFAULT_LOG_CHANNEL "DiskFile"
#include <logging/Log.h>
#include <logging/Verify.h>

#include <pocods/ErrorCode.h>
#include <pocods/helpers/FileMacros.h>
#include <pocods/os/Utils.h>

using namespace std;

namespace pocods {

namespace {
const int64_t kMaxReasonableTextFileSize = 50 * 1024 * 1024; // 50 MB is a huge text file...
}

DiskFile::DiskFile(DiskFile&& other) noexcept
    : file_{other.file_},
      path_{std::move(other.path_)},
      totalSize_{other.totalSize_},
      lastRWSize_{other.lastRWSize_} {
  other.file_ = nullptr;
  other.totalSize_ = 0;
  other.lastRWSize_ = 0;
}

DiskFile::~DiskFile() {
  close();
}

int DiskFile::open(const string& path) {
  close();
  if (!os::isFile(path)) {
    return DISKFILE_FILE_NOT_FOUND;
  }
  file_ = os::fileOpen(path, "rb");
  if (file_ == nullptr) {
    return errno;
  }
  path_ = path;
  totalSize_ = os::getFileSize(path);
  lastRWSize_ = 0;
  return SUCCESS;
}

int DiskFile::create(const string& path) {
  close();
  file_ = os::fileOpen(path, "wb");
  if (file_ == nullptr) {
    return errno;
  }
  path_ = path;
  totalSize_ = 0;
  lastRWSize_ = 0;
  return SUCCESS;
}

int DiskFile::openForAppend(const string& path) {
  close();
  if (!os::isFile(path)) {
    return DISKFILE_FILE_NOT_FOUND;
  }
  file_ = os::fileOpen(path, "ab");
  if (file_ == nullptr) {
    return errno;
  }
  path_ = path;
  totalSize_ = os::getFileSize(path);
  lastRWSize_ = 0;
  return SUCCESS;
}

int DiskFile::close() {
  int error = SUCCESS;
  if (file_ != nullptr) {
    error = os::fileClose(file_) != 0 ? errno : SUCCESS;
    file_ = nullptr;
  }
  return error;
}

int DiskFile::read(void* buffer, size_t length) {
  lastRWSize_ = 0;
  if (file_ == nullptr) {
    return DISKFILE_NOT_OPEN;
  }
  if (length == 0) {
    return SUCCESS;
  }
  lastRWSize_ = ::fread(buffer, 1, length, file_);
  return length == lastRWSize_ ? SUCCESS : ::ferror(file_) ? errno : DISKFILE_NOT_ENOUGH_DATA;
}

int DiskFile::write(const void* data, size_t dataSize) {
  lastRWSize_ = 0;
  if (file_ == nullptr) {
    return DISKFILE_NOT_OPEN;
  }
  if (dataSize == 0) {
    return SUCCESS;
  }
  lastRWSize_ = ::fwrite(data, 1, dataSize, file_);
  totalSize_ += static_cast<int64_t>(lastRWSize_);
  return dataSize == lastRWSize_ ? SUCCESS
      : ::ferror(file_)          ? errno
                                 : DISKFILE_PARTIAL_WRITE_ERROR;
}

int DiskFile::flush() {
  if (file_ == nullptr) {
    return DISKFILE_NOT_OPEN;
  }
  return ::fflush(file_) != 0 ? errno : SUCCESS;
}

int DiskFile::setPos(int64_t offset) {
  if (file_ == nullptr) {
    return DISKFILE_NOT_OPEN;
  }
  return os::fileSeek(file_, offset, SEEK_SET) != 0 ? errno : SUCCESS;
}

int64_t DiskFile::getPos() const {
  return file_ != nullptr ? os::fileTell(file_) : -1;
}

bool DiskFile::isEof() const {
  return file_ == nullptr || getPos() >= totalSize_;
}

int DiskFile::readTextFile(const string& path, string& outText) {
  outText.clear();
  DiskFile file;
  IF_ERROR_RETURN(file.open(path));
  int64_t size = file.getTotalSize();
  if (!PDS_VERIFY(size < kMaxReasonableTextFileSize)) {
    return INVALID_PARAMETER;
  }
  if (size > 0) {
    outText.resize(static_cast<size_t>(size));
    int error = file.read(&outText[0], outText.size());
    if (error != 0) {
      outText.clear();
      return error;
    }
  }
  return SUCCESS;
}

int DiskFile::writeTextFile(const string& path, const string& text) {
  DiskFile file;
  IF_ERROR_LOG_AND_RETURN(file.create(path));
  WRITE_OR_LOG_AND_RETURN(file, text.data(), text.size());
  return file.close();
}

} // namespace pocods
