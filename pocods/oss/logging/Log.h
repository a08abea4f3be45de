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

#include <fmt/core.h>

namespace pocods {
namespace logging {

enum class Level {
  Error = 0,
  Warning = 1,
  Info = 2,
  Debug = 3,
};

/// Logging backend: redirect where you need, depending on the log level and your preferences.
void log(Level level, const char* channel, const std::string& message);

/// Set the most verbose level that will be printed, for all channels. Default: Info.
void setGlobalLogLevel(Level level);
Level getGlobalLogLevel();

} // namespace logging
} // namespace pocods

#ifdef DEFAULT_LOG_CHANNEL
#define PDS_LOG_DEFAULT(level, ...) \
  pocods::logging::log(level, DEFAULT_LOG_CHANNEL, fmt::format(__VA_ARGS__))

#define PDS_LOGD(...) PDS_LOG_DEFAULT(pocods::logging::Level::Debug, __VA_ARGS__)
#define PDS_LOGI(...) PDS_LOG_DEFAULT(pocods::logging::Level::Info, __VA_ARGS__)
#define PDS_LOGW(...) PDS_LOG_DEFAULT(pocods::logging::Level::Warning, __VA_ARGS__)
#define PDS_LOGE(...) PDS_LOG_DEFAULT(pocods::logging::Level::Error, __VA_ARGS__)
#endif

#define PDS_LOG_CHANNEL(level, channel, ...) \
  pocods::logging::log(level, channel, fmt::format(__VA_ARGS__))

#define PDS_LOGCD(CHANNEL, ...) \
  PDS_LOG_CHANNEL(pocods::logging::Level::Debug, CHANNEL, __VA_ARGS__)
#define PDS_LOGCI(CHANNEL, ...) PDS_LOG_CHANNEL(pocods::logging::Level::Info, CHANNEL, __VA_ARGS__)
#define PDS_LOGCW(CHANNEL, ...) \
  PDS_LOG_CHANNEL(pocods::logging::Level::Warning, CHANNEL, __VA_ARGS__)
#define PDS_LOGCE(CHANNEL, ...) \
  PDS_LOG_CHANNEL(pocods::logging::Level::Error, CHANNEL, __VA_ARGS__)
