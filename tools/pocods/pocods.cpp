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


#include "PocodsCommand.h"

#include <pocods/os/Utils.h>

using namespace std;
using namespace pocodscli;

int main(int argc, char** argv) {
  const string& appName = pocods::os::getFilename(argv[0]);
  if (argc == 1) {
    printHelp(appName);
    printSamples(appName);
    return EXIT_FAILURE;
  }
  PocodsCommand pocodsCommand;
  if (!pocodsCommand.parseCommand(appName, argv[1])) {
    printHelp(appName);
    printSamples(appName);
    return EXIT_FAILURE;
  }
  int statusCode = EXIT_SUCCESS;
  int argn = 1;
  while (++argn < argc && statusCode == EXIT_SUCCESS) {
    string arg = argv[argn];
    if (!pocodsCommand.parseArgument(appName, argn, argc, argv, statusCode) &&
        !pocodsCommand.processUnrecognizedArgument(appName, arg)) {
      statusCode = EXIT_FAILURE;
    }
  }
  if (pocodsCommand.showHelp) {
    printHelp(appName);
    printSamples(appName);
  } else if (statusCode == EXIT_SUCCESS) {
    statusCode = pocodsCommand.runCommands();
  }

  return statusCode;
}
