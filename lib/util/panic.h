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

#ifndef RELAYER_LIB_UTIL_PANIC_H_
#define RELAYER_LIB_UTIL_PANIC_H_

namespace relayer {

// Abort the process with a diagnostic.  Reserved for violated internal
// invariants; malformed caller input is reported through RelayerError.
[[noreturn]] void fail(const char* format, ...);

static inline void check(bool truth, const char* why) {
  if (!truth) {
    fail("%s", why);
  }
}

}  // namespace relayer

#endif  // RELAYER_LIB_UTIL_PANIC_H_
