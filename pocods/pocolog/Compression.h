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

#include <string>

namespace pocods {
namespace pocolog {

using std::string;

constexpr const char* kCompressedExtension = ".zst";

/// Tell if a file is zstd compressed, based on its name.
bool isCompressed(const string& path);

/// Path where the decompressed version of a compressed file goes in a cache directory.
/// Plain files are their own decompressed version.
string decompressedPath(const string& path, const string& cacheDir);

/// Find the decompressed version of a log file, without creating it.
/// @param outPath: set to the path of the plain file, if it exists.
/// @return True if a plain version of the file exists.
bool findDecompressed(const string& path, const string& cacheDir, string& outPath);

/// Get the decompressed version of a log file, decompressing it in the cache directory if needed.
/// Decompression goes through a temporary file, so that a partially decompressed file is never
/// visible.
/// @param outPath: set to the path of the plain file.
/// @return 0 on success, or an error code.
int decompressed(const string& path, const string& cacheDir, string& outPath);

} // namespace pocolog
} // namespace pocods
