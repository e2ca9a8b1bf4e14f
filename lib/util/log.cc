// Copyright 2025 Google LLC.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "util/log.h"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace relayer {

namespace {
std::atomic<int> current_level{INFO};
std::mutex log_mutex;
std::chrono::steady_clock::time_point last_time =
    std::chrono::steady_clock::now();

const char* level_tag(LogLevel l) {
  switch (l) {
    case ERROR:
      return "E";
    case WARNING:
      return "W";
    case INFO:
      return "I";
    case DEBUG:
      return "D";
  }
  return "?";
}
}  // namespace

void set_log_level(LogLevel l) { current_level = l; }

LogLevel log_level() { return static_cast<LogLevel>(current_level.load()); }

void log(LogLevel l, const char* format, ...) {
  if (static_cast<int>(l) > current_level.load()) {
    return;
  }
  std::lock_guard<std::mutex> lock(log_mutex);
  auto now = std::chrono::steady_clock::now();
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                now - last_time)
                .count();
  last_time = now;

  va_list ap;
  va_start(ap, format);
  fprintf(stderr, "%s %10lldus ", level_tag(l), static_cast<long long>(us));
  vfprintf(stderr, format, ap);
  fprintf(stderr, "\n");
  va_end(ap);
}

}  // namespace relayer
