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

#ifndef RELAYER_LIB_POSEIDON_POSEIDON_H_
#define RELAYER_LIB_POSEIDON_POSEIDON_H_

#include <cstddef>
#include <vector>

#include "algebra/fp_bn254.h"
#include "util/status.h"

namespace relayer {

constexpr size_t kMaxPoseidonInputs = 16;

// circomlib Poseidon over the BN254 scalar field: width t = n + 1, initial
// state [0, inputs...], x^5 s-box, output state[0].
//
// Fails with RELAYER_INVALID_INPUT_LENGTH for 0 or more than
// kMaxPoseidonInputs inputs.
bool poseidon_hash(const std::vector<Fp254Elt>& inputs, Fp254Elt* out,
                   RelayerError* err = nullptr);

}  // namespace relayer

#endif  // RELAYER_LIB_POSEIDON_POSEIDON_H_
