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

/// Resolve unambiguously what platform the code is compiling for
///
/// IS_LINUX_PLATFORM()
/// -> are we compiling for the Linux platform?
/// IS_APPLE_PLATFORM()
/// -> are we compiling for an "Apple" platform of some kind?
/// IS_WINDOWS_PLATFORM()
/// -> are we compiling for the Windows desktop platform?

#if defined(__linux__)

#define IS_LINUX_PLATFORM() 1
#define IS_APPLE_PLATFORM() 0
#define IS_WINDOWS_PLATFORM() 0

#elif defined(__APPLE__)

#define IS_LINUX_PLATFORM() 0
#define IS_APPLE_PLATFORM() 1
#define IS_WINDOWS_PLATFORM() 0

#elif defined(_WIN32) || defined(_WIN64)

#define IS_LINUX_PLATFORM() 0
#define IS_APPLE_PLATFORM() 0
#define IS_WINDOWS_PLATFORM() 1

#else

#error "Unsupported/unrecognized platform"

#endif
