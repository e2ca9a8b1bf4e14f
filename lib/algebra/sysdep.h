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

#ifndef RELAYER_LIB_ALGEBRA_SYSDEP_H_
#define RELAYER_LIB_ALGEBRA_SYSDEP_H_

#include <cstdint>

namespace relayer {

// Double-width helpers for multiprecision arithmetic.  They rely on the
// compiler's unsigned __int128, available on every 64-bit target we build
// for.
typedef unsigned __int128 uint128_t;

// a + b + carry_in, returning the low word and updating *carry.
static inline uint64_t addcarry(uint64_t a, uint64_t b, uint64_t* carry) {
  uint128_t s = static_cast<uint128_t>(a) + b + *carry;
  *carry = static_cast<uint64_t>(s >> 64);
  return static_cast<uint64_t>(s);
}

// a - b - borrow_in, returning the low word and updating *borrow.
static inline uint64_t subborrow(uint64_t a, uint64_t b, uint64_t* borrow) {
  uint128_t d = static_cast<uint128_t>(a) - b - *borrow;
  *borrow = static_cast<uint64_t>(d >> 64) & 1;
  return static_cast<uint64_t>(d);
}

// Full product a * b as (low, high).
static inline void mulhl(uint64_t a, uint64_t b, uint64_t* l, uint64_t* h) {
  uint128_t p = static_cast<uint128_t>(a) * b;
  *l = static_cast<uint64_t>(p);
  *h = static_cast<uint64_t>(p >> 64);
}

static inline void mulhl(uint32_t a, uint32_t b, uint32_t* l, uint32_t* h) {
  uint64_t p = static_cast<uint64_t>(a) * b;
  *l = static_cast<uint32_t>(p);
  *h = static_cast<uint32_t>(p >> 32);
}

}  // namespace relayer

#endif  // RELAYER_LIB_ALGEBRA_SYSDEP_H_
