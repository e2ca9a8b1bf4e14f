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

#ifndef RELAYER_LIB_CIRCUITS_EMAIL_EMAIL_CONSTANTS_H_
#define RELAYER_LIB_CIRCUITS_EMAIL_EMAIL_CONSTANTS_H_

#include <cstddef>

namespace relayer {

// Buffer sizes of the email-auth circuit.
constexpr size_t kMaxHeaderPaddedBytes = 1024;
constexpr size_t kMaxBodyPaddedBytes = 1536;

// RSA-2048 values travel as 17 limbs of 121 bits; two limbs share a field
// element when hashed.
constexpr size_t kCircomBigintN = 121;
constexpr size_t kCircomBigintK = 17;
constexpr size_t kLimbsPerField = 2;

// Email addresses are zero-padded to this many bytes before hashing.
constexpr size_t kMaxEmailAddrBytes = 256;

}  // namespace relayer

#endif  // RELAYER_LIB_CIRCUITS_EMAIL_EMAIL_CONSTANTS_H_
