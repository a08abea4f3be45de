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

#include <pocods/os/Platform.h>

#include <pocods/ErrorCode.h>

using namespace pocods;

namespace {

struct ErrorCodeTest : testing::Test {};

} // namespace

TEST_F(ErrorCodeTest, testErrorCode) {
  EXPECT_EQ(ErrorCode::SUCCESS, 0);

#if IS_LINUX_PLATFORM()
  EXPECT_EQ(ErrorCode::FAILURE, 1000);
#endif

  const char* errorMessage = "test error message";

  int errorCode = domainErrorCode(ErrorDomain::ZstdDecompressionErrorDomain, 42, errorMessage);
  EXPECT_EQ(errorCode, errorDomainToErrorCodeStart(ErrorDomain::ZstdDecompressionErrorDomain) + 1);
  EXPECT_EQ(errorCodeToMessage(errorCode), "ZSTD Decompression error 42: test error message");

  // The same error gets the same code
  EXPECT_EQ(
      domainErrorCode(ErrorDomain::ZstdDecompressionErrorDomain, 42, errorMessage), errorCode);

  errorCode = domainErrorCode(ErrorDomain::ZstdCompressionErrorDomain, 7, "bad level");
  EXPECT_EQ(errorCode, errorDomainToErrorCodeStart(ErrorDomain::ZstdCompressionErrorDomain) + 1);
  EXPECT_EQ(errorCodeToMessage(errorCode), "ZSTD Compression error 7: bad level");
}

TEST_F(ErrorCodeTest, testErrorMessages) {
  EXPECT_EQ(errorCodeToMessage(SUCCESS), "Success");
  EXPECT_NE(errorCodeToMessage(MULTIPLE_EVENT_LOGS).find("event log"), std::string::npos);
  EXPECT_NE(errorCodeToMessage(DATASET_ALREADY_EXISTS), errorCodeToMessage(DATASET_NOT_FOUND));
}
