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
#include <vector>

#include <pocods/datastore/AutoImport.h>

namespace pocodscli {
void printHelp(const std::string& appName);
void printSamples(const std::string& appName);

enum class Command {
  None,
  Help,
  Import,
  AutoImport,
  Normalize,
  Index,
  List,

  COUNT
};

struct PocodsCommand {
  bool parseCommand(const std::string& appName, const char* cmdName);

  /// Parse a "logical" command line argument, which may have one or more parts.
  /// Options with a value accept both "--option=value" and "--option value".
  /// @param appName: Name of the application binary for error messages
  /// @param argn: First argument to look at. Might be updated to "process" additional parameters.
  /// @param argc: Max argument count.
  /// @param argv: All the command line arguments: the argument to parse is argv[argn]
  /// @param outStatusCode: Set on exit, if some error occurred, untouched otherwise.
  /// @return False if the parameter was not recognized (argn & outStatusCode were not changed).
  /// Returns true if the argument was recognized, which doesn't mean there was no error.
  bool
  parseArgument(const std::string& appName, int& argn, int argc, char** argv, int& outStatusCode);

  /// Handle a parameter not recognized by parseArgument.
  /// Unrecognized arguments are the datastore path, followed by input paths or digests.
  bool processUnrecognizedArgument(const std::string& appName, const std::string& arg);

  /// Run the command requested using the member variables below
  /// @return 0, if no error should be signaled back to the caller of the tool,
  /// or some non-zero value if an error should be signaled.
  int runCommands();

  int doImport();
  int doAutoImport();
  int doNormalize();
  int doIndex();
  int doList();

  /// Main operation
  Command cmd = Command::None;

  /// Force showing the tool's help documentation
  bool showHelp = false;

  /// Path of the datastore, for the commands that use one
  std::string storePath;
  /// Input directories, files or dataset digests, depending on the command
  std::vector<std::string> paths;
  /// Output directory of the normalize command, specified with the '--out' option
  std::string outputPath;

  pocods::datastore::AutoImportOptions autoImportOptions;
  bool force = false;
  bool silent = false;
};

} // namespace pocodscli
