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
#include <cstdio>
#include <string>
#include <vector>

#include <pocods/os/Platform.h>

/// Mini-OS abstraction layer.
/// Enables the encapsulation of file system implementations, without exposing boost::filesystem.
/// Unless specified otherwise, int return values are 0 on success, or an errno value.

namespace pocods {
namespace os {

/// FILE helpers
std::FILE* fileOpen(const std::string& path, const char* modes);
int fileClose(std::FILE* file);
int64_t fileTell(std::FILE* file);
int fileSeek(std::FILE* file, int64_t offset, int origin);

/// Misc helpers
int remove(const std::string& path); // file or empty folder
int removeRecursively(const std::string& path); // file or folder, with its content
int rename(const std::string& originalName, const std::string& newName); // file or folder
int copyFile(const std::string& sourcePath, const std::string& targetPath); // overwrites
int copyRecursively(const std::string& sourcePath, const std::string& targetPath);
std::string randomName(int length);
const std::string& getTempFolder();
std::string getUniquePath(const std::string& baseName, size_t randomSuffixLength = 5);

/// Error helpers
int getLastFileError();
std::string fileErrorToString(int errnum);

/// Path joining helpers
std::string pathJoin(const std::string& a, const std::string& b);
std::string pathJoin(const std::string& a, const std::string& b, const std::string& c);
template <class... Args>
std::string
pathJoin(const std::string& a, const std::string& b, const std::string& c, Args... args) {
  return pocods::os::pathJoin(pocods::os::pathJoin(a, b, c), args...);
}

/// Directory making helpers
int makeDir(const std::string& dir); // succeeds if the directory exists already
int makeNewDir(const std::string& dir); // fails with EEXIST if the path exists already
int makeDirectories(const std::string& dir);

/// File path helpers
bool isDir(const std::string& path);
bool isFile(const std::string& path);
bool pathExists(const std::string& path);
int64_t getFileSize(const std::string& path);
int getModificationTimeNs(const std::string& path, int64_t& outTimeNs);
std::string getFilename(const std::string& path);
std::string getParentFolder(const std::string& path);
/// Path of path relative to base, using '/' separators.
std::string getRelativePath(const std::string& path, const std::string& base);
std::string getAbsolutePath(const std::string& path);
/// Tell if two paths designate the same location, without accessing the file system.
bool isSamePath(const std::string& a, const std::string& b);

/// For testing and other tools
std::string getCurrentExecutablePath();

} // namespace os
} // namespace pocods
