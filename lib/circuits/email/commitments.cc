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

#include "circuits/email/commitments.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "algebra/fp_bn254.h"
#include "circuits/email/email_constants.h"
#include "codec/field_codec.h"
#include "poseidon/poseidon.h"
#include "util/crypto.h"
#include "util/status.h"

namespace relayer {
namespace {

constexpr int kAccountCodeAttempts = 64;

bool limb_fields(const std::vector<uint8_t>& le, std::vector<Fp254Elt>* out,
                 RelayerError* err) {
  return bytes_chunk_fields(le, kCircomBigintN, kLimbsPerField,
                            kCircomBigintK, out, err);
}

}  // namespace

bool PaddedEmailAddr::FromEmailAddr(const std::string& email_addr,
                                    PaddedEmailAddr* out, RelayerError* err) {
  if (!pad_string(email_addr, kMaxEmailAddrBytes, &out->padded_bytes_, err)) {
    return false;
  }
  out->email_addr_ = email_addr;
  return true;
}

std::vector<Fp254Elt> PaddedEmailAddr::ToFields() const {
  return bytes_to_fields(padded_bytes_);
}

bool PaddedEmailAddr::ToCommitment(const Fp254Elt& rand, Fp254Elt* out,
                                   RelayerError* err) const {
  std::vector<Fp254Elt> in = {rand};
  std::vector<Fp254Elt> f = ToFields();
  in.insert(in.end(), f.begin(), f.end());
  return poseidon_hash(in, out, err);
}

bool PaddedEmailAddr::ToCommitmentWithSignature(
    const std::vector<uint8_t>& signature, Fp254Elt* out,
    RelayerError* err) const {
  Fp254Elt rand;
  return extract_rand_from_signature(signature, &rand, err) &&
         ToCommitment(rand, out, err);
}

bool public_key_hash(const std::vector<uint8_t>& public_key, Fp254Elt* out,
                     RelayerError* err) {
  std::vector<Fp254Elt> limbs;
  return limb_fields(public_key, &limbs, err) &&
         poseidon_hash(limbs, out, err);
}

bool email_nullifier(const std::vector<uint8_t>& signature, Fp254Elt* out,
                     RelayerError* err) {
  std::vector<Fp254Elt> limbs;
  Fp254Elt inner;
  return limb_fields(signature, &limbs, err) &&
         poseidon_hash(limbs, &inner, err) &&
         poseidon_hash({inner}, out, err);
}

bool extract_rand_from_signature(const std::vector<uint8_t>& signature,
                                 Fp254Elt* out, RelayerError* err) {
  std::vector<uint8_t> le(signature.rbegin(), signature.rend());
  std::vector<Fp254Elt> in;
  if (!limb_fields(le, &in, err)) {
    return false;
  }
  in.push_back(bn254_scalar_field().one());
  return poseidon_hash(in, out, err);
}

bool email_addr_commit(const std::string& email_addr, const Fp254Elt& rand,
                       Fp254Elt* out, RelayerError* err) {
  PaddedEmailAddr addr;
  return PaddedEmailAddr::FromEmailAddr(email_addr, &addr, err) &&
         addr.ToCommitment(rand, out, err);
}

bool email_addr_commit_with_signature(const std::string& email_addr,
                                      const std::vector<uint8_t>& signature,
                                      Fp254Elt* out, RelayerError* err) {
  PaddedEmailAddr addr;
  return PaddedEmailAddr::FromEmailAddr(email_addr, &addr, err) &&
         addr.ToCommitmentWithSignature(signature, out, err);
}

bool generate_account_salt(const std::string& email_addr,
                           const std::string& account_code, Fp254Elt* out,
                           RelayerError* err) {
  PaddedEmailAddr addr;
  Fp254Elt code;
  if (!PaddedEmailAddr::FromEmailAddr(email_addr, &addr, err) ||
      !hex_to_field(account_code, &code, err)) {
    return false;
  }
  std::vector<Fp254Elt> in = addr.ToFields();
  in.push_back(code);
  in.push_back(bn254_scalar_field().zero());
  return poseidon_hash(in, out, err);
}

bool account_salt_from_bytes(const std::vector<uint8_t>& bytes, Fp254Elt* out,
                             RelayerError* err) {
  std::vector<Fp254Elt> in = bytes_to_fields(bytes);
  in.push_back(bn254_scalar_field().zero());
  return poseidon_hash(in, out, err);
}

bool generate_account_code(Fp254Elt* out, RelayerError* err) {
  const Fp254& F = bn254_scalar_field();
  for (int attempt = 0; attempt < kAccountCodeAttempts; ++attempt) {
    std::vector<uint8_t> le(Nat254::kBytes);
    if (!rand_bytes(le.data(), le.size())) {
      return set_error(err, RELAYER_RANDOMNESS_FAILURE,
                       "Encoding error: system random source failed");
    }
    // r < 2^254, so about a quarter of the masked draws are rejected.
    le.back() &= 0x3f;
    Fp254Elt x;
    if (field_of_bytes_le(le, &x) && x != F.zero()) {
      *out = x;
      return true;
    }
  }
  return set_error(err, RELAYER_RANDOMNESS_FAILURE,
                   "Encoding error: no field element after " +
                       std::to_string(kAccountCodeAttempts) + " draws");
}

bool relayer_rand_from_seed(const std::vector<uint8_t>& seed, Fp254Elt* out,
                            RelayerError* err) {
  return poseidon_hash(bytes_to_fields(seed), out, err);
}

bool relayer_rand_hash(const Fp254Elt& rand, Fp254Elt* out,
                       RelayerError* err) {
  return poseidon_hash({rand}, out, err);
}

bool account_code_commit(const Fp254Elt& account_code,
                         const std::string& email_addr,
                         const Fp254Elt& rand_hash, Fp254Elt* out,
                         RelayerError* err) {
  PaddedEmailAddr addr;
  if (!PaddedEmailAddr::FromEmailAddr(email_addr, &addr, err)) {
    return false;
  }
  std::vector<Fp254Elt> in = {account_code};
  std::vector<Fp254Elt> f = addr.ToFields();
  in.insert(in.end(), f.begin(), f.end());
  in.push_back(rand_hash);
  return poseidon_hash(in, out, err);
}

std::vector<std::string> bytes_to_fields_hex(
    const std::vector<uint8_t>& bytes) {
  std::vector<std::string> out;
  for (const Fp254Elt& f : bytes_to_fields(bytes)) {
    out.push_back(field_to_hex(f));
  }
  return out;
}

}  // namespace relayer
