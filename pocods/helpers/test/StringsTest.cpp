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


#include <gtest/gtest.h>

#include <pocods/helpers/EnumStringConverter.h>
#include <pocods/helpers/Strings.h>

struct StringsHelpersTester : testing::Test {};

using namespace std;
using namespace pocods;

TEST_F(StringsHelpersTester, strncasecmpTest) {
  EXPECT_EQ(helpers::strncasecmp("hello", "HELLO", 5), 0);
  EXPECT_EQ(helpers::strncasecmp("hello New-York", "Hello Paris", 6), 0);
  EXPECT_LT(helpers::strncasecmp("hello New-York", "Hello Paris", 7), 0);
}

TEST_F(StringsHelpersTester, endsWith) {
  using namespace pocods::helpers;
  EXPECT_TRUE(endsWith("task.0.log", ".log"));
  EXPECT_TRUE(endsWith("task.0.LOG", ".log"));
  EXPECT_TRUE(endsWith("session-events.log", "-events.log"));
  EXPECT_FALSE(endsWith("task.0.log.zst", ".log"));
  EXPECT_FALSE(endsWith("", "a"));
}

TEST_F(StringsHelpersTester, beforeFileName) {
  using namespace pocods::helpers;
  EXPECT_TRUE(beforeFileName("task.2.log", "task.10.log"));
  EXPECT_FALSE(beforeFileName("task.10.log", "task.2.log"));
  EXPECT_TRUE(beforeFileName("a.0.log", "b.0.log"));
  EXPECT_FALSE(beforeFileName("a.0.log", "a.0.log"));
}

TEST_F(StringsHelpersTester, readUInt64) {
  uint64_t value = 0;
  EXPECT_TRUE(helpers::readUInt64("1234567890", value));
  EXPECT_EQ(value, 1234567890);
  EXPECT_FALSE(helpers::readUInt64("12a", value));
  EXPECT_FALSE(helpers::readUInt64("", value));
}

TEST_F(StringsHelpersTester, humanReadableFileSize) {
  EXPECT_EQ(helpers::humanReadableFileSize(0), "0 B");
  EXPECT_EQ(helpers::humanReadableFileSize(1023), "1023 B");
  EXPECT_EQ(helpers::humanReadableFileSize(100 * 1024), "100 KiB");
  EXPECT_EQ(helpers::humanReadableFileSize(-1023), "-1023 B");
}

namespace {
enum class Fruit { Unknown, Apple, Pear, COUNT };
string_view sFruitNames[] = {"unknown", "apple", "pear"};
ENUM_STRING_CONVERTER(Fruit, sFruitNames, Fruit::Unknown);
} // namespace

TEST_F(StringsHelpersTester, enumStringConverter) {
  EXPECT_EQ(FruitConverter::toString(Fruit::Pear), "pear");
  EXPECT_EQ(FruitConverter::toEnum("apple"), Fruit::Apple);
  EXPECT_EQ(FruitConverter::toEnum("unknown"), Fruit::Unknown);
  EXPECT_EQ(FruitConverter::toEnum("banana"), Fruit::Unknown);
  EXPECT_EQ(FruitConverter::toString(Fruit::COUNT), "<Invalid value>");
}
