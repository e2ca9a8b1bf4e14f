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

#ifndef RELAYER_LIB_POSEIDON_POSEIDON_PARAMS_H_
#define RELAYER_LIB_POSEIDON_POSEIDON_PARAMS_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "algebra/fp_bn254.h"

namespace relayer {

constexpr size_t kPoseidonFullRounds = 8;
constexpr size_t kPoseidonMinWidth = 2;
constexpr size_t kPoseidonMaxWidth = 17;

// Round constants and MDS matrix for one Poseidon width t over the BN254
// scalar field.  These agree with the circomlib tables.
struct PoseidonParams {
  size_t t;
  size_t rounds_f;
  size_t rounds_p;
  std::vector<Fp254Elt> c;               // (rounds_f + rounds_p) * t
  std::vector<std::vector<Fp254Elt>> m;  // t x t
};

// Partial round count for width t, 2 <= t <= 17.
size_t poseidon_partial_rounds(size_t t);

// Parameters for width t, 2 <= t <= 17.  The tables are derived once, on
// first use, and are immutable afterwards.
const PoseidonParams& poseidon_params(size_t t);

// Derives the parameters from the Grain LFSR seeded with
// (field=prime, sbox=x^5, n=254, t, R_F, R_P).
PoseidonParams generate_poseidon_params(size_t t, size_t rounds_f,
                                        size_t rounds_p);

}  // namespace relayer

#endif  // RELAYER_LIB_POSEIDON_POSEIDON_PARAMS_H_
