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

#ifndef RELAYER_LIB_ALGEBRA_NAT_H_
#define RELAYER_LIB_ALGEBRA_NAT_H_

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>

#include "algebra/sysdep.h"
#include "util/panic.h"

namespace relayer {

// Inverse of odd a modulo 2^64 (or 2^32), by Newton iteration.
template <class limb_t>
limb_t inv_mod_b(limb_t a) {
  limb_t x = a;  // correct to 3 bits for odd a
  for (size_t i = 0; i < 6; ++i) {
    x = x * (2 - a * x);
  }
  return x;
}

// Value of a hex or decimal digit.  Dies on anything else.
static inline uint64_t digit(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  } else if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  } else if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  fail("bad char %c", c);
}

static inline bool is_digit(char c, uint64_t base) {
  if (c >= '0' && c <= '9') return static_cast<uint64_t>(c - '0') < base;
  if (base != 16) return false;
  return (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

// Fixed-width natural numbers of W 64-bit limbs, least significant first.
template <size_t W>
class Nat {
 public:
  using limb_t = uint64_t;
  static constexpr size_t kU64 = W;
  static constexpr size_t kLimbs = W;
  static constexpr size_t kBits = 64 * W;
  static constexpr size_t kBytes = 8 * W;

  std::array<limb_t, W> limb_;

  Nat() : limb_{} {}
  explicit Nat(uint64_t x) : limb_{} { limb_[0] = x; }
  explicit Nat(const std::array<uint64_t, W>& a) : limb_(a) {}

  // Little-endian bytes.
  static Nat of_bytes(const uint8_t a[/* kBytes */]) {
    Nat r;
    for (size_t i = 0; i < W; ++i) {
      limb_t l = 0;
      for (size_t j = 8; j-- > 0;) {
        l = (l << 8) | a[8 * i + j];
      }
      r.limb_[i] = l;
    }
    return r;
  }

  void to_bytes(uint8_t a[/* kBytes */]) const {
    for (size_t i = 0; i < W; ++i) {
      limb_t l = limb_[i];
      for (size_t j = 0; j < 8; ++j) {
        a[8 * i + j] = l & 0xff;
        l >>= 8;
      }
    }
  }

  // Parses decimal, or hex with a 0x prefix.  Returns nullopt on bad
  // digits, empty input, or overflow of kBits.
  static std::optional<Nat> of_untrusted_string(const char* s) {
    uint64_t base = 10;
    if (s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
      base = 16;
      s += 2;
    }
    if (*s == '\0') {
      return std::nullopt;
    }
    Nat r;
    for (; *s; ++s) {
      if (!is_digit(*s, base)) {
        return std::nullopt;
      }
      if (r.mul_small(base) != 0) {
        return std::nullopt;
      }
      if (r.add(Nat(digit(*s))) != 0) {
        return std::nullopt;
      }
    }
    return r;
  }

  // Like of_untrusted_string(), but for trusted constants.
  static Nat of_string(const char* s) {
    auto r = of_untrusted_string(s);
    check(r.has_value(), "bad constant in Nat::of_string");
    return r.value();
  }

  bool bit(size_t i) const { return (limb_[i / 64] >> (i % 64)) & 1; }

  void set_bit(size_t i) { limb_[i / 64] |= static_cast<limb_t>(1) << (i % 64); }

  bool is_zero() const {
    for (size_t i = 0; i < W; ++i) {
      if (limb_[i] != 0) return false;
    }
    return true;
  }

  // this += y, returning the carry out.
  limb_t add(const Nat& y) {
    limb_t c = 0;
    for (size_t i = 0; i < W; ++i) {
      limb_[i] = addcarry(limb_[i], y.limb_[i], &c);
    }
    return c;
  }

  // this -= y, returning the borrow out.
  limb_t sub(const Nat& y) {
    limb_t b = 0;
    for (size_t i = 0; i < W; ++i) {
      limb_[i] = subborrow(limb_[i], y.limb_[i], &b);
    }
    return b;
  }

  // this *= m, returning the high limb that did not fit.
  limb_t mul_small(uint64_t m) {
    limb_t c = 0;
    for (size_t i = 0; i < W; ++i) {
      uint64_t l, h;
      mulhl(limb_[i], m, &l, &h);
      limb_t cc = 0;
      limb_[i] = addcarry(l, c, &cc);
      c = h + cc;
    }
    return c;
  }

  // this /= d, returning the remainder.
  uint64_t divmod_small(uint64_t d) {
    uint128_t r = 0;
    for (size_t i = W; i-- > 0;) {
      uint128_t cur = (r << 64) | limb_[i];
      limb_[i] = static_cast<limb_t>(cur / d);
      r = cur % d;
    }
    return static_cast<uint64_t>(r);
  }

  void shr1() {
    for (size_t i = 0; i < W; ++i) {
      limb_[i] >>= 1;
      if (i + 1 < W) {
        limb_[i] |= limb_[i + 1] << 63;
      }
    }
  }

  std::string to_decimal() const {
    if (is_zero()) {
      return "0";
    }
    Nat t = *this;
    std::string s;
    while (!t.is_zero()) {
      s.push_back(static_cast<char>('0' + t.divmod_small(10)));
    }
    return std::string(s.rbegin(), s.rend());
  }

  bool operator==(const Nat& y) const { return limb_ == y.limb_; }
  bool operator!=(const Nat& y) const { return !(*this == y); }
  bool operator<(const Nat& y) const {
    for (size_t i = W; i-- > 0;) {
      if (limb_[i] != y.limb_[i]) return limb_[i] < y.limb_[i];
    }
    return false;
  }
  bool operator>=(const Nat& y) const { return !(*this < y); }
};

}  // namespace relayer

#endif  // RELAYER_LIB_ALGEBRA_NAT_H_
