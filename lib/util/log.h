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

#ifndef RELAYER_LIB_UTIL_LOG_H_
#define RELAYER_LIB_UTIL_LOG_H_

namespace relayer {

enum LogLevel { ERROR = 0, WARNING = 1, INFO = 2, DEBUG = 3 };

// Messages above the current level are dropped.  The level affects only
// diagnostics, never any computed value.
void set_log_level(LogLevel l);
LogLevel log_level();

// printf-style logging to stderr.  Each line is prefixed with the time
// elapsed since the previous message and the level tag.
void log(LogLevel l, const char* format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

}  // namespace relayer

#endif  // RELAYER_LIB_UTIL_LOG_H_
