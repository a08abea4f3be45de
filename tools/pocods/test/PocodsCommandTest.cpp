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


#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <pocods/os/Utils.h>
#include <pocods/test/helpers/PocodsTestsHelpers.h>

#include <pocods/PocodsCommand.h>

using namespace std;
using namespace pocods;
using namespace pocods::test;
using namespace pocodscli;

struct PocodsCommandTest : testing::Test {};

bool parse(PocodsCommand& command, vector<string>& args, int& argn, int& outStatusCode) {
  argn = 0;
  outStatusCode = EXIT_SUCCESS;
  vector<char*> argvs(args.size());
  for (size_t index = 0; index < args.size(); index++) {
    argvs[index] = const_cast<char*>(args[index].c_str());
  }
  if (!command.parseCommand(args[0], argvs[++argn])) {
    return false;
  }
  const string appName{args[0]};
  while (++argn < static_cast<int>(argvs.size())) {
    if (!command.parseArgument(
            appName, argn, static_cast<int>(argvs.size()), argvs.data(), outStatusCode) &&
        !command.processUnrecognizedArgument(appName, argvs[argn])) {
      outStatusCode = EXIT_FAILURE;
    }
    if (outStatusCode != EXIT_SUCCESS) {
      return false;
    }
  }
  return true;
}

TEST_F(PocodsCommandTest, importCommands) {
  int argn = 1;
  int statusCode = EXIT_SUCCESS;
  {
    vector<string> args = {"pocods", "import", "store", "logs/a", "logs/b", "--force"};
    PocodsCommand command;
    EXPECT_TRUE(parse(command, args, argn, statusCode));
    EXPECT_EQ(argn, 6);
    EXPECT_EQ(statusCode, EXIT_SUCCESS);
    EXPECT_EQ(command.cmd, Command::Import);
    EXPECT_EQ(command.storePath, "store");
    EXPECT_EQ(command.paths, (vector<string>{"logs/a", "logs/b"}));
    EXPECT_TRUE(command.force);
    EXPECT_FALSE(command.silent);
  }
  {
    vector<string> args = {
        "pocods", "auto-import", "--silent", "store", "/media", "--min-duration=120"};
    PocodsCommand command;
    EXPECT_TRUE(parse(command, args, argn, statusCode));
    EXPECT_EQ(command.cmd, Command::AutoImport);
    EXPECT_EQ(command.storePath, "store");
    EXPECT_EQ(command.paths, vector<string>{"/media"});
    EXPECT_DOUBLE_EQ(command.autoImportOptions.minDuration, 120);
    EXPECT_TRUE(command.silent);
    EXPECT_FALSE(command.force);
  }
  {
    vector<string> args = {"pocods", "auto-import", "store", "/media", "--min-duration", "0.5"};
    PocodsCommand command;
    EXPECT_TRUE(parse(command, args, argn, statusCode));
    EXPECT_EQ(argn, 6);
    EXPECT_DOUBLE_EQ(command.autoImportOptions.minDuration, 0.5);
  }
  {
    vector<string> args = {"pocods", "auto-import", "store", "/media"};
    PocodsCommand command;
    EXPECT_TRUE(parse(command, args, argn, statusCode));
    EXPECT_DOUBLE_EQ(
        command.autoImportOptions.minDuration,
        datastore::AutoImportOptions::kDefaultMinDuration);
  }
}

TEST_F(PocodsCommandTest, otherCommands) {
  int argn = 1;
  int statusCode = EXIT_SUCCESS;
  {
    vector<string> args = {"pocods", "normalize", "logs/a", "logs/b/task.0.log", "--out=norm"};
    PocodsCommand command;
    EXPECT_TRUE(parse(command, args, argn, statusCode));
    EXPECT_EQ(command.cmd, Command::Normalize);
    EXPECT_TRUE(command.storePath.empty());
    EXPECT_EQ(command.paths, (vector<string>{"logs/a", "logs/b/task.0.log"}));
    EXPECT_EQ(command.outputPath, "norm");
  }
  {
    vector<string> args = {"pocods", "index", "store", "abc", "def"};
    PocodsCommand command;
    EXPECT_TRUE(parse(command, args, argn, statusCode));
    EXPECT_EQ(command.cmd, Command::Index);
    EXPECT_EQ(command.storePath, "store");
    EXPECT_EQ(command.paths, (vector<string>{"abc", "def"}));
  }
  {
    vector<string> args = {"pocods", "list", "store"};
    PocodsCommand command;
    EXPECT_TRUE(parse(command, args, argn, statusCode));
    EXPECT_EQ(command.cmd, Command::List);
    EXPECT_EQ(command.storePath, "store");
    EXPECT_TRUE(command.paths.empty());
  }
  {
    vector<string> args = {"pocods", "help"};
    PocodsCommand command;
    EXPECT_TRUE(parse(command, args, argn, statusCode));
    EXPECT_EQ(command.cmd, Command::Help);
  }
}

TEST_F(PocodsCommandTest, badArguments) {
  int argn = 1;
  int statusCode = EXIT_SUCCESS;
  {
    vector<string> args = {"pocods", "export", "store"};
    PocodsCommand command;
    EXPECT_FALSE(parse(command, args, argn, statusCode));
  }
  {
    vector<string> args = {"pocods", "import", "store", "--bogus"};
    PocodsCommand command;
    EXPECT_FALSE(parse(command, args, argn, statusCode));
    EXPECT_EQ(statusCode, EXIT_FAILURE);
  }
  {
    vector<string> args = {"pocods", "normalize", "logs", "--out"};
    PocodsCommand command;
    EXPECT_FALSE(parse(command, args, argn, statusCode));
    EXPECT_EQ(statusCode, EXIT_FAILURE);
  }
  {
    vector<string> args = {"pocods", "auto-import", "store", "logs", "--min-duration=abc"};
    PocodsCommand command;
    EXPECT_FALSE(parse(command, args, argn, statusCode));
    EXPECT_EQ(statusCode, EXIT_FAILURE);
  }
  {
    vector<string> args = {"pocods", "auto-import", "store", "logs", "--min-duration=-1"};
    PocodsCommand command;
    EXPECT_FALSE(parse(command, args, argn, statusCode));
    EXPECT_EQ(statusCode, EXIT_FAILURE);
  }
}

TEST_F(PocodsCommandTest, runCommands) {
  const string folder = makeTestFolder("pocods_command_test");
  const string session = os::pathJoin(folder, "session");
  ASSERT_EQ(
      createPocologFile(
          os::pathJoin(session, "task.0.log"), {makeTaskStream("task", "a", {{1, 1, 1}})}),
      0);
  int argn = 1;
  int statusCode = EXIT_SUCCESS;
  const string store = os::pathJoin(folder, "store");
  {
    vector<string> args = {"pocods", "import", store, session, "--silent"};
    PocodsCommand command;
    ASSERT_TRUE(parse(command, args, argn, statusCode));
    EXPECT_EQ(command.runCommands(), EXIT_SUCCESS);
    // the same data again
    EXPECT_EQ(command.runCommands(), 2);
  }
  {
    vector<string> args = {"pocods", "index", store, "--force"};
    PocodsCommand command;
    ASSERT_TRUE(parse(command, args, argn, statusCode));
    EXPECT_EQ(command.runCommands(), EXIT_SUCCESS);
  }
  {
    vector<string> args = {"pocods", "list", store};
    PocodsCommand command;
    ASSERT_TRUE(parse(command, args, argn, statusCode));
    EXPECT_EQ(command.runCommands(), EXIT_SUCCESS);
  }
  {
    vector<string> args = {"pocods", "index", store, "unknown-digest"};
    PocodsCommand command;
    ASSERT_TRUE(parse(command, args, argn, statusCode));
    EXPECT_EQ(command.runCommands(), EXIT_FAILURE);
  }
  {
    vector<string> args = {"pocods", "normalize", session};
    PocodsCommand command;
    ASSERT_TRUE(parse(command, args, argn, statusCode));
    EXPECT_EQ(command.runCommands(), EXIT_FAILURE);
  }
  {
    const string out = os::pathJoin(folder, "normalized");
    vector<string> args = {"pocods", "normalize", session, "--out", out};
    PocodsCommand command;
    ASSERT_TRUE(parse(command, args, argn, statusCode));
    EXPECT_EQ(command.runCommands(), EXIT_SUCCESS);
    EXPECT_TRUE(os::isFile(os::pathJoin(out, "task::a.0.log")));
  }
  {
    vector<string> args = {"pocods", "list"};
    PocodsCommand command;
    ASSERT_TRUE(parse(command, args, argn, statusCode));
    EXPECT_EQ(command.runCommands(), EXIT_FAILURE);
  }
}
