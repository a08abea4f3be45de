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

#include <cstdlib>

#include <iostream>
#include <string>

#include <fmt/format.h>

#define DEFAULT_LOG_CHANNEL "PocodsCommand"
#include <logging/Log.h>

#include <pocods/ErrorCode.h>
#include <pocods/Reporter.h>
#include <pocods/datastore/Datastore.h>
#include <pocods/datastore/Import.h>
#include <pocods/datastore/IndexBuild.h>
#include <pocods/datastore/Normalize.h>
#include <pocods/helpers/EnumStringConverter.h>
#include <pocods/os/Utils.h>
#include <pocods/pocolog/Streams.h>

using namespace std;
using namespace pocods;
using namespace pocods::datastore;

namespace {

using namespace pocodscli;

string_view sCommands[] = {
    "none",
    "help",
    "import",
    "auto-import",
    "normalize",
    "index",
    "list",
};
ENUM_STRING_CONVERTER(Command, sCommands, Command::None);

// Exit code of the import command when the dataset is in the store already
const int kAlreadyImportedExitCode = 2;

// Split "--option=value" in its option & value parts, or get the value from the next argument.
bool getOptionValue(
    const string& appName,
    const string& option,
    const string& arg,
    int& argn,
    int argc,
    char** argv,
    int& outStatusCode,
    string& outValue) {
  if (arg == option) {
    if (++argn < argc) {
      outValue = argv[argn];
      return true;
    }
  } else if (arg.size() > option.size() + 1 && arg[option.size()] == '=' &&
             arg.compare(0, option.size(), option) == 0) {
    outValue = arg.substr(option.size() + 1);
    return true;
  } else {
    return false;
  }
  cerr << appName << ": error. '" << option << "' requires a value.\n";
  outStatusCode = EXIT_FAILURE;
  return true;
}

bool isOption(const string& arg, const string& option) {
  return arg == option ||
      (arg.size() > option.size() && arg[option.size()] == '=' &&
       arg.compare(0, option.size(), option) == 0);
}

bool usesDatastore(Command cmd) {
  return cmd == Command::Import || cmd == Command::AutoImport || cmd == Command::Index ||
      cmd == Command::List;
}

} // namespace

#define CMD(H, C) H ":\n  " << appName << " " C "\n"

namespace pocodscli {

void printHelp(const string& appName) {
  cout << CMD("Command format", "<command> [ arguments ]*")

       << "\n"
       << CMD("Show this documentation", "help")

       << "\n"
       << CMD("Import directories of a log session as a single dataset",
              "import <datastore> <dir>+ [--force] [--silent]")
       << CMD("Import every log session found in directory trees, one dataset per directory",
              "auto-import <datastore> <root>+ [--min-duration=<seconds>] [--force] [--silent]")
       << CMD("Normalize pocolog files, without importing them",
              "normalize <dir|file>+ --out=<dir> [--silent]")
       << CMD("Rebuild the indexes of datasets, all of them by default",
              "index <datastore> [digest]* [--force] [--silent]")
       << CMD("List the datasets of a datastore, with their metadata", "list <datastore>")

       << "\n"
       << "Options:\n"
       << "  --force: import datasets again, or rebuild indexes even if they are valid.\n"
       << "  --min-duration=<seconds>: ignore log sessions shorter than that, "
       << fmt::format("{}s by default.\n", AutoImportOptions::kDefaultMinDuration)
       << "  --out=<dir>: output directory of the normalize command.\n"
       << "  --silent: only report warnings & errors.\n";
}

#define SP(x) "  " << appName << " " x "\n"

void printSamples(const string& appName) {
  cout << "\n"
       << "Examples:\n"
       << "Import a log session recorded in two directories:\n"
       << SP("import /data/store logs/20240105-1012 logs/20240105-1012-extra")

       << "Import all the sessions of a disk, if they last at least 2 minutes:\n"
       << SP("auto-import /data/store /media/robot --min-duration=120")

       << "Normalize the pocolog files of a directory:\n"
       << SP("normalize logs/20240105-1012 --out=normalized")

       << "\n";
}

bool PocodsCommand::parseCommand(const std::string& appName, const char* cmdName) {
  cmd = CommandConverter::toEnum(cmdName);
  if (cmd != Command::None) {
    return true;
  }
  cerr << appName << ": '" << cmdName << "' is not a known command name.\n";
  return false;
}

bool PocodsCommand::parseArgument(
    const string& appName,
    int& argn,
    int argc,
    char** argv,
    int& outStatusCode) {
  string arg = argv[argn];
  string value;
  if (arg == "-h" || arg == "--help") {
    showHelp = true;
  } else if (arg == "--force") {
    force = true;
  } else if (arg == "--silent") {
    silent = true;
  } else if (isOption(arg, "--out")) {
    getOptionValue(appName, "--out", arg, argn, argc, argv, outStatusCode, outputPath);
  } else if (isOption(arg, "--min-duration")) {
    if (getOptionValue(
            appName, "--min-duration", arg, argn, argc, argv, outStatusCode, value) &&
        outStatusCode == EXIT_SUCCESS) {
      char* end = nullptr;
      double minDuration = strtod(value.c_str(), &end);
      if (value.empty() || *end != 0 || minDuration < 0) {
        cerr << appName << ": error. Invalid --min-duration value '" << value << "'.\n";
        outStatusCode = EXIT_FAILURE;
      } else {
        autoImportOptions.minDuration = minDuration;
      }
    }
  } else {
    return false;
  }
  return true;
}

bool PocodsCommand::processUnrecognizedArgument(const string& appName, const string& arg) {
  if (!arg.empty() && arg.front() == '-') {
    cerr << appName << ": Invalid argument: '" << arg << "'\n";
    return false;
  }
  if (usesDatastore(cmd) && storePath.empty()) {
    storePath = arg;
  } else {
    paths.push_back(arg);
  }
  return true;
}

int PocodsCommand::runCommands() {
  if (silent) {
    logging::setGlobalLogLevel(logging::Level::Warning);
  }
  if (usesDatastore(cmd) && storePath.empty()) {
    cerr << "A datastore path is required.\n";
    return EXIT_FAILURE;
  }
  switch (cmd) {
    case Command::None:
    case Command::COUNT:
      PDS_LOGE("Unexpected command {}", CommandConverter::toString(cmd));
      return EXIT_FAILURE;
    case Command::Help:
      printHelp("pocods");
      printSamples("pocods");
      return EXIT_SUCCESS;
    case Command::Import:
      return doImport();
    case Command::AutoImport:
      return doAutoImport();
    case Command::Normalize:
      return doNormalize();
    case Command::Index:
      return doIndex();
    case Command::List:
      return doList();
  }
  return EXIT_FAILURE;
}

int PocodsCommand::doImport() {
  if (paths.empty()) {
    cerr << "No directory to import.\n";
    return EXIT_FAILURE;
  }
  int error = Datastore::create(storePath);
  if (error != 0) {
    cerr << "Can't create datastore " << storePath << ": " << errorCodeToMessage(error) << "\n";
    return EXIT_FAILURE;
  }
  Datastore datastore(storePath);
  Import import(datastore);
  Reporter reporter;
  Dataset dataset;
  error = import.import(paths, force, reporter, dataset);
  if (error == DATASET_ALREADY_EXISTS) {
    cerr << "A dataset identical to " << paths.front()
         << " already exists in the store (digest is " << dataset.getDigest()
         << "). Give --force to import again. The normalized dataset was left in "
         << dataset.getCorePath() << "\n";
    return kAlreadyImportedExitCode;
  }
  if (error != 0) {
    cerr << "Import failed: " << errorCodeToMessage(error) << "\n";
    return EXIT_FAILURE;
  }
  cout << dataset.getDigest() << "\n";
  return EXIT_SUCCESS;
}

int PocodsCommand::doAutoImport() {
  if (paths.empty()) {
    cerr << "No directory to search.\n";
    return EXIT_FAILURE;
  }
  int error = Datastore::create(storePath);
  if (error != 0) {
    cerr << "Can't create datastore " << storePath << ": " << errorCodeToMessage(error) << "\n";
    return EXIT_FAILURE;
  }
  Datastore datastore(storePath);
  Import import(datastore);
  autoImportOptions.force = force;
  AutoImport autoImport(datastore, import, autoImportOptions);
  Reporter reporter;
  return autoImport.run(paths, reporter) == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

int PocodsCommand::doNormalize() {
  if (outputPath.empty()) {
    cerr << "The normalize command requires an output directory, set with --out.\n";
    return EXIT_FAILURE;
  }
  vector<string> files;
  for (const string& path : paths) {
    if (os::isDir(path)) {
      for (const string& file : pocolog::logfilesInDir(path)) {
        files.push_back(file);
      }
    } else if (os::isFile(path)) {
      files.push_back(path);
    } else {
      cerr << "Can't find " << path << "\n";
      return EXIT_FAILURE;
    }
  }
  if (files.empty()) {
    cerr << "No pocolog file to normalize.\n";
    return EXIT_FAILURE;
  }
  Reporter reporter;
  int error = normalize(files, outputPath, outputPath, false, reporter);
  if (error != 0) {
    cerr << "Normalization failed: " << errorCodeToMessage(error) << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

int PocodsCommand::doIndex() {
  Datastore datastore(storePath);
  vector<string> digests = paths;
  if (digests.empty()) {
    int error = datastore.listDigests(digests);
    if (error != 0) {
      cerr << "Can't list the datasets of " << storePath << ": " << errorCodeToMessage(error)
           << "\n";
      return EXIT_FAILURE;
    }
  }
  int statusCode = EXIT_SUCCESS;
  Reporter reporter;
  for (const string& digest : digests) {
    Dataset dataset;
    int error = datastore.getDataset(digest, dataset);
    if (error == 0) {
      reporter.info(fmt::format("Indexing dataset {}", digest));
      error = IndexBuild(dataset).rebuildAll(force, reporter);
    }
    if (error != 0) {
      cerr << "Can't index dataset " << digest << ": " << errorCodeToMessage(error) << "\n";
      statusCode = EXIT_FAILURE;
    }
  }
  return statusCode;
}

int PocodsCommand::doList() {
  Datastore datastore(storePath);
  vector<string> digests;
  int error = datastore.listDigests(digests);
  if (error != 0) {
    cerr << "Can't list the datasets of " << storePath << ": " << errorCodeToMessage(error)
         << "\n";
    return EXIT_FAILURE;
  }
  int statusCode = EXIT_SUCCESS;
  for (const string& digest : digests) {
    Dataset dataset;
    error = datastore.getDataset(digest, dataset);
    if (error != 0) {
      cerr << digest << ": " << errorCodeToMessage(error) << "\n";
      statusCode = EXIT_FAILURE;
      continue;
    }
    cout << digest << " (" << dataset.getStreams().size() << " streams)\n";
    for (const auto& entry : dataset.getMetadata()) {
      cout << "  " << entry.first << ": " << fmt::format("{}", fmt::join(entry.second, ", "))
           << "\n";
    }
  }
  return statusCode;
}

} // namespace pocodscli
