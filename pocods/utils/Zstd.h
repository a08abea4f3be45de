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
namespace utils {

/// Decompress a whole zstd compressed file, streaming, into another file.
/// The target file is overwritten if it exists, and left incomplete on error.
/// @return 0 on success, or an error code (errno, DiskFile or zstd domain errors).
int decompressFile(const std::string& sourcePath, const std::string& targetPath);

/// Compress a whole file with zstd, streaming, into another file.
/// @param compressionLevel: zstd compression level.
/// @return 0 on success, or an error code (errno, DiskFile or zstd domain errors).
int compressFile(
    const std::string& sourcePath,
    const std::string& targetPath,
    int compressionLevel = 3);

} // namespace utils
} // namespace pocods
