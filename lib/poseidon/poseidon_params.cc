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

#include "poseidon/poseidon_params.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "algebra/fp_bn254.h"
#include "util/panic.h"

namespace relayer {

namespace {

constexpr size_t kPartialRounds[kPoseidonMaxWidth - 1] = {
    56, 57, 56, 60, 60, 63, 64, 63, 60, 66, 60, 65, 70, 60, 64, 68};

constexpr size_t kFieldBits = 254;

// The 80-bit Grain LFSR of the Poseidon reference parameter script.
class GrainLfsr {
 public:
  GrainLfsr(size_t t, size_t rounds_f, size_t rounds_p) : head_(0) {
    size_t pos = 0;
    auto append = [&](uint64_t v, size_t nbits) {
      for (size_t i = nbits; i-- > 0;) {
        state_[pos++] = (v >> i) & 1;
      }
    };
    append(1, 2);  // prime field
    append(0, 4);  // x^alpha s-box
    append(kFieldBits, 12);
    append(t, 12);
    append(rounds_f, 10);
    append(rounds_p, 10);
    while (pos < 80) {
      state_[pos++] = 1;
    }
    for (size_t i = 0; i < 160; ++i) {
      step();
    }
  }

  // A kFieldBits-bit integer, most significant bit first.
  Nat254 random_nat() {
    Nat254 r;
    for (size_t i = kFieldBits; i-- > 0;) {
      if (filtered_bit()) {
        r.set_bit(i);
      }
    }
    return r;
  }

 private:
  uint8_t at(size_t i) const { return state_[(head_ + i) % 80]; }

  uint8_t step() {
    uint8_t b = at(62) ^ at(51) ^ at(38) ^ at(23) ^ at(13) ^ at(0);
    state_[head_] = b;
    head_ = (head_ + 1) % 80;
    return b;
  }

  // Self-shrinking: emit the second bit of each pair whose first bit is 1.
  uint8_t filtered_bit() {
    for (;;) {
      uint8_t a = step();
      uint8_t b = step();
      if (a == 1) {
        return b;
      }
    }
  }

  std::array<uint8_t, 80> state_;
  size_t head_;
};

std::vector<PoseidonParams> all_params() {
  std::vector<PoseidonParams> v;
  for (size_t t = kPoseidonMinWidth; t <= kPoseidonMaxWidth; ++t) {
    v.push_back(generate_poseidon_params(t, kPoseidonFullRounds,
                                         poseidon_partial_rounds(t)));
  }
  return v;
}

}  // namespace

size_t poseidon_partial_rounds(size_t t) {
  check(t >= kPoseidonMinWidth && t <= kPoseidonMaxWidth,
        "unsupported poseidon width");
  return kPartialRounds[t - kPoseidonMinWidth];
}

PoseidonParams generate_poseidon_params(size_t t, size_t rounds_f,
                                        size_t rounds_p) {
  const Fp254& F = bn254_scalar_field();
  GrainLfsr grain(t, rounds_f, rounds_p);

  PoseidonParams params;
  params.t = t;
  params.rounds_f = rounds_f;
  params.rounds_p = rounds_p;

  // Round constants by rejection sampling.
  const size_t nc = (rounds_f + rounds_p) * t;
  while (params.c.size() < nc) {
    Nat254 r = grain.random_nat();
    if (F.in_field(r)) {
      params.c.push_back(F.to_montgomery(r));
    }
  }

  // Cauchy matrix 1/(x_i + y_j) from 2t distinct values reduced mod p.
  std::vector<Nat254> xy;
  for (;;) {
    xy.clear();
    for (size_t i = 0; i < 2 * t; ++i) {
      Nat254 r = grain.random_nat();
      while (!F.in_field(r)) {
        r.sub(F.modulus());
      }
      xy.push_back(r);
    }
    bool distinct = true;
    for (size_t i = 0; i < 2 * t && distinct; ++i) {
      for (size_t j = i + 1; j < 2 * t; ++j) {
        if (xy[i] == xy[j]) {
          distinct = false;
          break;
        }
      }
    }
    if (distinct) break;
  }

  params.m.assign(t, std::vector<Fp254Elt>(t));
  for (size_t i = 0; i < t; ++i) {
    Fp254Elt x = F.to_montgomery(xy[i]);
    for (size_t j = 0; j < t; ++j) {
      Fp254Elt y = F.to_montgomery(xy[t + j]);
      params.m[i][j] = F.invertf(F.addf(x, y));
    }
  }
  return params;
}

const PoseidonParams& poseidon_params(size_t t) {
  static const std::vector<PoseidonParams> table = all_params();
  check(t >= kPoseidonMinWidth && t <= kPoseidonMaxWidth,
        "unsupported poseidon width");
  return table[t - kPoseidonMinWidth];
}

}  // namespace relayer
