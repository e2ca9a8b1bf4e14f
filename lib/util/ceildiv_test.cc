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

#include "util/ceildiv.h"

#include <cstddef>
#include <cstdint>

#include "gtest/gtest.h"

namespace relayer {
namespace {

TEST(Ceildiv, SmallValues) {
  for (uint64_t b = 1; b < 100; ++b) {
    for (uint64_t a = 0; a < 1000; ++a) {
      uint64_t q = ceildiv(a, b);
      EXPECT_GE(q * b, a);
      if (q > 0) {
        EXPECT_LT((q - 1) * b, a);
      }
    }
  }
}

TEST(Ceildiv, RoundUp) {
  EXPECT_EQ(round_up<size_t>(0, 64), 0u);
  EXPECT_EQ(round_up<size_t>(1, 64), 64u);
  EXPECT_EQ(round_up<size_t>(64, 64), 64u);
  EXPECT_EQ(round_up<size_t>(65, 64), 128u);
  EXPECT_EQ(ceildiv<size_t>(256, 31), 9u);
  EXPECT_EQ(ceildiv<size_t>(17 * 121, 8), 258u);
}

}  // namespace
}  // namespace relayer
