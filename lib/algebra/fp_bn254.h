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

#ifndef RELAYER_LIB_ALGEBRA_FP_BN254_H_
#define RELAYER_LIB_ALGEBRA_FP_BN254_H_

#include "algebra/fp_generic.h"

namespace relayer {

// Scalar field of the BN254 (alt_bn128) curve, the native field of the
// email circuits.
using Fp254 = FpGeneric<4>;
using Fp254Elt = Fp254::Elt;
using Nat254 = Fp254::N;

static constexpr char kBn254ScalarModulus[] =
    "21888242871839275222246405745257275088548364400416034343698204186575808495"
    "617";

// Process-wide instance, constructed on first use.
const Fp254& bn254_scalar_field();

}  // namespace relayer

#endif  // RELAYER_LIB_ALGEBRA_FP_BN254_H_
