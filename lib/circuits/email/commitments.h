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

#ifndef RELAYER_LIB_CIRCUITS_EMAIL_COMMITMENTS_H_
#define RELAYER_LIB_CIRCUITS_EMAIL_COMMITMENTS_H_

// Poseidon commitments and nullifiers derived from an email address, the
// DKIM key and the DKIM signature.  RSA values are passed little-endian.

#include <cstdint>
#include <string>
#include <vector>

#include "algebra/fp_bn254.h"
#include "util/status.h"

namespace relayer {

// An email address zero-padded to kMaxEmailAddrBytes.
class PaddedEmailAddr {
 public:
  // Fails with RELAYER_MAX_LENGTH_EXCEEDED for addresses that do not fit.
  static bool FromEmailAddr(const std::string& email_addr,
                            PaddedEmailAddr* out, RelayerError* err);

  const std::string& email_addr() const { return email_addr_; }
  const std::vector<uint8_t>& padded_bytes() const { return padded_bytes_; }

  // The padded bytes in 31-byte little-endian chunks.
  std::vector<Fp254Elt> ToFields() const;

  // H([rand] ++ ToFields()).
  bool ToCommitment(const Fp254Elt& rand, Fp254Elt* out,
                    RelayerError* err) const;

  // ToCommitment() with extract_rand_from_signature(signature).
  bool ToCommitmentWithSignature(const std::vector<uint8_t>& signature,
                                 Fp254Elt* out, RelayerError* err) const;

 private:
  std::string email_addr_;
  std::vector<uint8_t> padded_bytes_;
};

// Hash of the RSA modulus in 121-bit limbs packed two per element.
bool public_key_hash(const std::vector<uint8_t>& public_key,
                     Fp254Elt* out, RelayerError* err);

// H([H(limbs(signature))]).
bool email_nullifier(const std::vector<uint8_t>& signature, Fp254Elt* out,
                     RelayerError* err);

// H(limbs(reverse(signature)) ++ [1]).  The reversal turns the big-endian
// signature of the DKIM header into the little-endian form.
bool extract_rand_from_signature(const std::vector<uint8_t>& signature,
                                 Fp254Elt* out, RelayerError* err);

bool email_addr_commit(const std::string& email_addr, const Fp254Elt& rand,
                       Fp254Elt* out, RelayerError* err);

bool email_addr_commit_with_signature(const std::string& email_addr,
                                      const std::vector<uint8_t>& signature,
                                      Fp254Elt* out, RelayerError* err);

// H(fields(email_addr) ++ [account_code, 0]).  account_code is hex with or
// without "0x".
bool generate_account_salt(const std::string& email_addr,
                           const std::string& account_code, Fp254Elt* out,
                           RelayerError* err);

// H(bytes_to_fields(bytes) ++ [0]), a salt keyed by raw bytes instead of
// an address and account code.
bool account_salt_from_bytes(const std::vector<uint8_t>& bytes, Fp254Elt* out,
                             RelayerError* err);

// Uniformly random non-zero field element from the system source.
bool generate_account_code(Fp254Elt* out, RelayerError* err);

// Deterministic relayer randomness H(bytes_to_fields(seed)).  The seed
// must be 1..496 bytes so that it packs into at most 16 elements.
bool relayer_rand_from_seed(const std::vector<uint8_t>& seed, Fp254Elt* out,
                            RelayerError* err);

// H([rand]), the public image of a relayer's secret randomness.
bool relayer_rand_hash(const Fp254Elt& rand, Fp254Elt* out,
                       RelayerError* err);

// H([account_code] ++ fields(email_addr) ++ [relayer_rand_hash]).
bool account_code_commit(const Fp254Elt& account_code,
                         const std::string& email_addr,
                         const Fp254Elt& rand_hash, Fp254Elt* out,
                         RelayerError* err);

// bytes_to_fields() rendered with field_to_hex().
std::vector<std::string> bytes_to_fields_hex(const std::vector<uint8_t>& bytes);

}  // namespace relayer

#endif  // RELAYER_LIB_CIRCUITS_EMAIL_COMMITMENTS_H_
