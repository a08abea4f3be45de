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

#include <map>
#include <string>
#include <vector>

namespace pocods {

class Reporter;

namespace datastore {

using std::map;
using std::string;
using std::vector;

/// Rewrite pocolog log files into one log file per stream.
///
/// Files that are segments of the same log file (<base>.<N>.log) are processed as a group, in
/// segment order. Compressed files are decompressed in indexDir first, or in a temporary folder
/// removed afterwards if indexDir is outputDir.
/// Each stream is written in outputDir/<task>::<object>.0.log, with its declaration and data blocks
/// copied verbatim. A stream found again in another group or segment is appended to the same
/// output file, if its declaration is identical.
/// An index is built in indexDir for each output file.
/// @param files: the pocolog log files to normalize.
/// @param outputDir: where to write the normalized files. Created if needed.
/// @param indexDir: where to write the index files & decompressed files. Created if needed.
/// @param computeDigest: compute the SHA-256 digest of each output file.
/// @param reporter: to report progress, in bytes.
/// @param outDigests: if provided, set to the SHA-256 of each output file, per path.
/// @return 0 on success, INVALID_FOLLOWUP_STREAM if a stream's declarations differ, or an error
/// code.
int normalize(
    const vector<string>& files,
    const string& outputDir,
    const string& indexDir,
    bool computeDigest,
    Reporter& reporter,
    map<string, string>* outDigests = nullptr);

} // namespace datastore
} // namespace pocods
