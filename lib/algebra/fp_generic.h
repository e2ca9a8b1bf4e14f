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

#ifndef RELAYER_LIB_ALGEBRA_FP_GENERIC_H_
#define RELAYER_LIB_ALGEBRA_FP_GENERIC_H_

#include <cstddef>
#include <cstdint>
#include <optional>

#include "algebra/nat.h"
#include "algebra/sysdep.h"
#include "util/panic.h"

namespace relayer {

// Prime field Z/mZ for an odd modulus m of W limbs, with elements kept in
// Montgomery form x * 2^(64W) mod m.  The modulus must leave the top bit of
// the top limb clear.
template <size_t W>
class FpGeneric {
 public:
  using N = Nat<W>;
  using limb_t = uint64_t;
  static constexpr size_t kU64 = W;
  static constexpr size_t kBytes = N::kBytes;
  static constexpr size_t kBits = N::kBits;

  struct Elt {
    N n;
    bool operator==(const Elt& y) const { return n == y.n; }
    bool operator!=(const Elt& y) const { return !(n == y.n); }
  };

  explicit FpGeneric(const N& modulus) : m_(modulus) {
    check((m_.limb_[0] & 1) != 0, "even modulus");
    check((m_.limb_[W - 1] >> 63) == 0, "modulus too large");
    mprime_ = -inv_mod_b(m_.limb_[0]);

    // 2^(64W) mod m and 2^(128W) mod m by repeated doubling.
    N r(1);
    for (size_t i = 0; i < kBits; ++i) {
      double_mod(r);
    }
    N r2 = r;
    for (size_t i = 0; i < kBits; ++i) {
      double_mod(r2);
    }
    r2_ = r2;
    one_ = Elt{r};
    zero_ = Elt{N(0)};
    two_ = addf(one_, one_);

    mminus2_ = m_;
    mminus2_.sub(N(2));
  }

  explicit FpGeneric(const char* modulus) : FpGeneric(N::of_string(modulus)) {}

  FpGeneric(const FpGeneric&) = delete;
  FpGeneric& operator=(const FpGeneric&) = delete;

  const N& modulus() const { return m_; }

  const Elt& zero() const { return zero_; }
  const Elt& one() const { return one_; }
  const Elt& two() const { return two_; }

  bool in_field(const N& a) const { return a < m_; }

  Elt to_montgomery(const N& a) const {
    check(in_field(a), "to_montgomery: value not reduced");
    return Elt{mont_mul(a, r2_)};
  }

  N from_montgomery(const Elt& x) const { return mont_mul(x.n, N(1)); }

  Elt of_scalar(uint64_t a) const { return to_montgomery(N(a)); }

  // Trusted constants only; dies on malformed or unreduced input.
  Elt of_string(const char* s) const {
    N a = N::of_string(s);
    check(in_field(a), "of_string: value not reduced");
    return to_montgomery(a);
  }

  std::optional<Elt> of_untrusted_string(const char* s) const {
    auto a = N::of_untrusted_string(s);
    if (!a.has_value() || !in_field(a.value())) {
      return std::nullopt;
    }
    return to_montgomery(a.value());
  }

  Elt addf(const Elt& a, const Elt& b) const {
    N r = a.n;
    limb_t c = r.add(b.n);
    if (c != 0 || r >= m_) {
      r.sub(m_);
    }
    return Elt{r};
  }

  Elt subf(const Elt& a, const Elt& b) const {
    N r = a.n;
    if (r.sub(b.n) != 0) {
      r.add(m_);
    }
    return Elt{r};
  }

  Elt negf(const Elt& a) const { return subf(zero_, a); }

  Elt mulf(const Elt& a, const Elt& b) const {
    return Elt{mont_mul(a.n, b.n)};
  }

  // a^e for an ordinary (non-Montgomery) exponent.
  Elt powf(const Elt& a, const N& e) const {
    Elt r = one_;
    for (size_t i = kBits; i-- > 0;) {
      r = mulf(r, r);
      if (e.bit(i)) {
        r = mulf(r, a);
      }
    }
    return r;
  }

  // Inverse by Fermat.  Maps zero to zero.
  Elt invertf(const Elt& a) const { return powf(a, mminus2_); }

  void add(Elt& a, const Elt& b) const { a = addf(a, b); }
  void sub(Elt& a, const Elt& b) const { a = subf(a, b); }
  void mul(Elt& a, const Elt& b) const { a = mulf(a, b); }
  void neg(Elt& a) const { a = negf(a); }
  void invert(Elt& a) const { a = invertf(a); }

 private:
  void double_mod(N& r) const {
    limb_t c = r.add(r);
    if (c != 0 || r >= m_) {
      r.sub(m_);
    }
  }

  // Coarsely integrated operand scanning Montgomery product a * b / 2^(64W).
  N mont_mul(const N& a, const N& b) const {
    limb_t t[W + 2] = {};
    for (size_t i = 0; i < W; ++i) {
      limb_t c = 0;
      for (size_t j = 0; j < W; ++j) {
        uint128_t s = static_cast<uint128_t>(a.limb_[j]) * b.limb_[i] + t[j] + c;
        t[j] = static_cast<limb_t>(s);
        c = static_cast<limb_t>(s >> 64);
      }
      uint128_t s = static_cast<uint128_t>(t[W]) + c;
      t[W] = static_cast<limb_t>(s);
      t[W + 1] = static_cast<limb_t>(s >> 64);

      limb_t q = t[0] * mprime_;
      s = static_cast<uint128_t>(q) * m_.limb_[0] + t[0];
      c = static_cast<limb_t>(s >> 64);
      for (size_t j = 1; j < W; ++j) {
        s = static_cast<uint128_t>(q) * m_.limb_[j] + t[j] + c;
        t[j - 1] = static_cast<limb_t>(s);
        c = static_cast<limb_t>(s >> 64);
      }
      s = static_cast<uint128_t>(t[W]) + c;
      t[W - 1] = static_cast<limb_t>(s);
      t[W] = t[W + 1] + static_cast<limb_t>(s >> 64);
    }
    N r;
    for (size_t i = 0; i < W; ++i) {
      r.limb_[i] = t[i];
    }
    if (t[W] != 0 || r >= m_) {
      r.sub(m_);
    }
    return r;
  }

  N m_;
  N r2_;
  N mminus2_;
  limb_t mprime_;
  Elt zero_, one_, two_;
};

}  // namespace relayer

#endif  // RELAYER_LIB_ALGEBRA_FP_GENERIC_H_
