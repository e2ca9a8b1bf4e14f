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

#include "poseidon/poseidon.h"

#include <cstddef>
#include <string>
#include <vector>

#include "algebra/fp_bn254.h"
#include "poseidon/poseidon_params.h"
#include "util/status.h"

namespace relayer {

namespace {

Fp254Elt pow5(const Fp254& F, const Fp254Elt& x) {
  Fp254Elt x2 = F.mulf(x, x);
  Fp254Elt x4 = F.mulf(x2, x2);
  return F.mulf(x4, x);
}

}  // namespace

bool poseidon_hash(const std::vector<Fp254Elt>& inputs, Fp254Elt* out,
                   RelayerError* err) {
  if (inputs.empty() || inputs.size() > kMaxPoseidonInputs) {
    return set_error(err, RELAYER_INVALID_INPUT_LENGTH,
                     "Encoding error: poseidon takes 1 to 16 inputs, got " +
                         std::to_string(inputs.size()));
  }
  const Fp254& F = bn254_scalar_field();
  const PoseidonParams& P = poseidon_params(inputs.size() + 1);
  const size_t t = P.t;
  const size_t half_f = P.rounds_f / 2;
  const size_t nrounds = P.rounds_f + P.rounds_p;

  std::vector<Fp254Elt> state(t), tmp(t);
  state[0] = F.zero();
  for (size_t i = 0; i < inputs.size(); ++i) {
    state[i + 1] = inputs[i];
  }

  for (size_t r = 0; r < nrounds; ++r) {
    for (size_t j = 0; j < t; ++j) {
      F.add(state[j], P.c[r * t + j]);
    }
    if (r < half_f || r >= half_f + P.rounds_p) {
      for (size_t j = 0; j < t; ++j) {
        state[j] = pow5(F, state[j]);
      }
    } else {
      state[0] = pow5(F, state[0]);
    }
    for (size_t i = 0; i < t; ++i) {
      Fp254Elt acc = F.zero();
      for (size_t j = 0; j < t; ++j) {
        F.add(acc, F.mulf(P.m[i][j], state[j]));
      }
      tmp[i] = acc;
    }
    state.swap(tmp);
  }
  *out = state[0];
  return true;
}

}  // namespace relayer
