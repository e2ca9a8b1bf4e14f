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

#ifndef RELAYER_LIB_UTIL_CEILDIV_H_
#define RELAYER_LIB_UTIL_CEILDIV_H_

namespace relayer {

// ceil(a / b) for nonnegative integers.
template <class T>
constexpr T ceildiv(T a, T b) {
  return (a + (b - 1)) / b;
}

// Smallest multiple of b that is >= a.
template <class T>
constexpr T round_up(T a, T b) {
  return ceildiv(a, b) * b;
}

}  // namespace relayer

#endif  // RELAYER_LIB_UTIL_CEILDIV_H_
