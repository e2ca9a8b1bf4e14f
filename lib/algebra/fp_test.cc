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

#include "algebra/fp_generic.h"

#include <cstddef>
#include <cstdint>

#include "algebra/fp_bn254.h"
#include "gtest/gtest.h"

namespace relayer {
namespace {

template <class Field>
typename Field::Elt ckadd(typename Field::Elt a, typename Field::Elt b,
                          const Field& F) {
  auto r = F.addf(a, b);
  EXPECT_EQ(r, F.addf(b, a));
  EXPECT_EQ(F.addf(r, F.two()), F.addf(F.addf(a, F.one()), F.addf(b, F.one())));
  EXPECT_EQ(a, F.subf(r, b));
  EXPECT_EQ(b, F.subf(r, a));
  return r;
}

template <class Field>
typename Field::Elt ckmul(typename Field::Elt a, typename Field::Elt b,
                          const Field& F) {
  auto r = F.mulf(a, b);
  EXPECT_EQ(r, F.mulf(b, a));
  EXPECT_EQ(r, F.mulf(F.negf(a), F.negf(b)));
  return r;
}

TEST(Fp254, Fibonacci) {
  const Fp254& F = bn254_scalar_field();
  auto a = F.one();
  auto b = F.one();
  for (size_t i = 0; i < 1000; i++) {
    a = ckadd(a, b, F);
    b = ckadd(b, a, F);
  }
  EXPECT_EQ(a, F.of_string("218681342267849808720455768075196130450666609395406"
                           "74877832007277627808987477"));
}

TEST(Fp254, Factorial) {
  const Fp254& F = bn254_scalar_field();
  auto p = F.one();
  auto fi = F.one();
  for (uint64_t i = 1; i <= 337; ++i) {
    p = ckmul(p, fi, F);
    fi = ckadd(fi, F.one(), F);
  }
  EXPECT_EQ(p, F.of_string("185230825663748383234459809869520237221487841329407"
                           "13003216119294985127872902"));
}

TEST(Fp254, Mult) {
  const Fp254& F = bn254_scalar_field();
  for (uint64_t i = 0; i < 10; ++i) {
    for (uint64_t j = 0; j < 10; ++j) {
      EXPECT_EQ(ckmul(F.of_scalar(i), F.of_scalar(j), F), F.of_scalar(i * j));
    }
  }
}

TEST(Fp254, Inverse) {
  const Fp254& F = bn254_scalar_field();
  for (uint64_t i = 0; i < 200; ++i) {
    auto x = F.of_scalar(i);
    F.invert(x);
    if (i == 0) {
      EXPECT_EQ(x, F.zero());
    } else {
      EXPECT_EQ(F.mulf(F.of_scalar(i), x), F.one());
    }
  }
}

TEST(Fp254, Neg) {
  const Fp254& F = bn254_scalar_field();
  for (uint64_t i = 0; i < 1000; ++i) {
    auto x = F.of_scalar(i);
    F.neg(x);
    EXPECT_EQ(F.addf(F.of_scalar(i), x), F.zero());
  }
  // -1 is m - 1 outside Montgomery form.
  Nat254 m1 = F.modulus();
  m1.sub(Nat254(1));
  EXPECT_EQ(F.from_montgomery(F.negf(F.one())), m1);
}

TEST(Fp254, MontgomeryRoundTrip) {
  const Fp254& F = bn254_scalar_field();
  Nat254 a = Nat254::of_string(
      "0x2a5d3c9d5a3f1e1b0c4d8e9f7a6b5c4d3e2f1a0b9c8d7e6f5a4b3c2d1e0f0a0b");
  EXPECT_EQ(F.from_montgomery(F.to_montgomery(a)), a);
  EXPECT_EQ(F.from_montgomery(F.one()), Nat254(1));
}

TEST(Fp254, UntrustedStrings) {
  const Fp254& F = bn254_scalar_field();
  EXPECT_FALSE(F.of_untrusted_string(kBn254ScalarModulus).has_value());
  EXPECT_TRUE(F.of_untrusted_string("12345").has_value());
  EXPECT_FALSE(F.of_untrusted_string("12x45").has_value());
}

}  // namespace
}  // namespace relayer
