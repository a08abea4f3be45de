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

#include <pocods/os/Utils.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>

#if IS_WINDOWS_PLATFORM()
#include <windows.h>
#else
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#if IS_APPLE_PLATFORM()
#include <mach-o/dyld.h>
#endif

#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;
using fs_error_code = boost::system::error_code;
constexpr auto kNotFoundFileType = boost::filesystem::file_type::file_not_found;
constexpr auto kRegularFileType = boost::filesystem::file_type::regular_file;

using std::string;

namespace pocods::os {

FILE* fileOpen(const string& path, const char* modes) {
  return ::fopen(path.c_str(), modes);
}

int fileClose(FILE* file) {
  return ::fclose(file);
}

int64_t fileTell(FILE* file) {
#if IS_WINDOWS_PLATFORM()
  return ::_ftelli64(file);
#else
  return ::ftello(file);
#endif
}

int fileSeek(FILE* file, int64_t offset, int origin) {
#if IS_WINDOWS_PLATFORM()
  return ::_fseeki64(file, offset, origin);
#else
  if (ferror(file)) {
    ::rewind(file);
  }
  return ::fseeko(file, offset, origin);
#endif
}

int getLastFileError() {
  return errno;
}

int remove(const string& path) {
  return ::remove(path.c_str()) == 0 ? 0 : errno;
}

int removeRecursively(const string& path) {
  fs_error_code ec;
  fs::remove_all(fs::path(path), ec);
  return ec.value();
}

int rename(const string& originalName, const string& newName) {
  return ::rename(originalName.c_str(), newName.c_str()) == 0 ? 0 : errno;
}

int copyFile(const string& sourcePath, const string& targetPath) {
  fs_error_code ec;
  fs::copy_file(
      fs::path(sourcePath), fs::path(targetPath), fs::copy_options::overwrite_existing, ec);
  return ec.value();
}

int copyRecursively(const string& sourcePath, const string& targetPath) {
  fs_error_code ec;
  fs::path source(sourcePath);
  if (!fs::is_directory(source, ec)) {
    return ec ? ec.value() : copyFile(sourcePath, targetPath);
  }
  if (!fs::create_directory(fs::path(targetPath), ec) && ec) {
    return ec.value();
  }
  for (fs::directory_iterator it(source, ec), eit; it != eit; it.increment(ec)) {
    if (ec) {
      return ec.value();
    }
    const fs::path& entry = it->path();
    int status =
        copyRecursively(entry.string(), (fs::path(targetPath) / entry.filename()).string());
    if (status != 0) {
      return status;
    }
  }
  return ec.value();
}

string fileErrorToString(int errnum) {
  return strerror(errnum);
}

// we can't use boost::unique_path, because std::file system doesn't have it.
string randomName(int length) {
  auto randchar = []() -> char {
    const char charset[] =
        "0123456789_"
        "abcdefghijklmnopqrstuvwxyz";
    const size_t max_index = (sizeof(charset) - 1);
    return charset[static_cast<size_t>(rand()) % max_index];
  };
  string str(length, 0);
  std::generate_n(str.begin(), length, randchar);
  return str;
}

const string& getTempFolder() {
  static string sUniqueFolderName = [] {
    fs::path tempDir = fs::temp_directory_path();
    string processName = getFilename(getCurrentExecutablePath());
    const size_t maxLength = 40;
    if (processName.length() > maxLength) {
      processName.resize(maxLength);
    }
    processName += '-';
    string uniqueFolderName;
    do {
      uniqueFolderName = (tempDir / (processName + randomName(10))).string();
    } while (pathExists(uniqueFolderName) || makeNewDir(uniqueFolderName) != 0);
    uniqueFolderName += '/';
    return uniqueFolderName;
  }();
  return sUniqueFolderName;
}

string getUniquePath(const string& baseName, size_t randomSuffixLength) {
  string uniqueName;
  uniqueName.reserve(baseName.size() + 1 + randomSuffixLength);
  uniqueName = baseName + '~';
  do {
    uniqueName.resize(baseName.size() + 1);
    uniqueName += randomName(static_cast<int>(randomSuffixLength));
  } while (os::pathExists(uniqueName));
  return uniqueName;
}

string pathJoin(const string& a, const string& b) {
  return (fs::path(a) / b).generic_string();
}

string pathJoin(const string& a, const string& b, const string& c) {
  return (fs::path(a) / b / c).generic_string();
}

int makeDir(const string& dir) {
  fs_error_code code;
  return fs::create_directory(fs::path(dir), code) ? 0 : code.value();
}

int makeNewDir(const string& dir) {
#if IS_WINDOWS_PLATFORM()
  return ::_mkdir(dir.c_str()) == 0 ? 0 : errno;
#else
  return ::mkdir(dir.c_str(), 0777) == 0 ? 0 : errno;
#endif
}

int makeDirectories(const string& dir) {
  fs_error_code code;
  return fs::create_directories(dir, code) ? 0 : code.value();
}

bool isDir(const string& path) {
  fs_error_code ec;
  return fs::is_directory(fs::path(path), ec);
}

bool isFile(const string& path) {
  fs_error_code ec;
  auto type = fs::status(fs::path(path), ec).type(); // This will traverse symlinks
  if (ec) { // Underlying OS API error - we cannot access it.
    return false;
  }
  return type == kRegularFileType; // Not supporting block-, character-, socket files
}

bool pathExists(const string& path) {
  fs_error_code ec;
  auto type = fs::status(fs::path(path), ec).type(); // This will traverse symlinks
  if (ec) {
    return false; // Underlying OS API error - we cannot access it.
  }
  return type != kNotFoundFileType;
}

int64_t getFileSize(const string& path) {
  fs_error_code ec;
  auto size = fs::file_size(fs::path(path), ec);
  if (ec) {
    return -1;
  }
  return static_cast<int64_t>(size);
}

int getModificationTimeNs(const string& path, int64_t& outTimeNs) {
  outTimeNs = 0;
#if IS_WINDOWS_PLATFORM()
  fs_error_code ec;
  std::time_t t = fs::last_write_time(fs::path(path), ec);
  if (ec) {
    return ec.value();
  }
  outTimeNs = static_cast<int64_t>(t) * 1000000000;
#else
  struct stat fileStat {};
  if (::stat(path.c_str(), &fileStat) != 0) {
    return errno;
  }
#if IS_APPLE_PLATFORM()
  const struct timespec& mtime = fileStat.st_mtimespec;
#else
  const struct timespec& mtime = fileStat.st_mtim;
#endif
  outTimeNs = static_cast<int64_t>(mtime.tv_sec) * 1000000000 + mtime.tv_nsec;
#endif
  return 0;
}

// make 'path/to/folder' and 'path/to/folder/' mean the same thing
static fs::path getCleanedPath(const string& path) {
  fs::path fspath;
  if (path.empty() || (path.back() != '/' && path.back() != '\\')) {
    fspath = path;
  } else {
    string p{path};
    do {
      p.pop_back();
    } while (!p.empty() && (p.back() == '/' || p.back() == '\\'));
    fspath = p;
  }
  return fspath;
}

string getFilename(const string& path) {
  return getCleanedPath(path).filename().generic_string();
}

string getParentFolder(const string& path) {
  return getCleanedPath(path).parent_path().generic_string();
}

string getRelativePath(const string& path, const string& base) {
  return getCleanedPath(path).lexically_relative(getCleanedPath(base)).generic_string();
}

string getAbsolutePath(const string& path) {
  return fs::absolute(getCleanedPath(path)).lexically_normal().generic_string();
}

bool isSamePath(const string& a, const string& b) {
  return getAbsolutePath(a) == getAbsolutePath(b);
}

string getCurrentExecutablePath() {
#if IS_WINDOWS_PLATFORM()
  const size_t kMaxPath = 1024;
  char exePath[kMaxPath];
  if (::GetModuleFileNameA(NULL, exePath, kMaxPath) <= 0) {
    exePath[0] = '\0';
  }
  return exePath;
#elif IS_APPLE_PLATFORM()
  char exePath[PATH_MAX];
  uint32_t len = PATH_MAX;
  if (_NSGetExecutablePath(exePath, &len) != 0) {
    exePath[0] = '\0'; // buffer too small (!)
  }
  return exePath;
#else
  char exePath[PATH_MAX];
  ssize_t readlinkLen = ::readlink("/proc/self/exe", exePath, PATH_MAX - 1);
  size_t len = readlinkLen < 0 ? 0 : static_cast<size_t>(readlinkLen);
  exePath[len] = '\0';
  return exePath;
#endif
}

} // namespace pocods::os
