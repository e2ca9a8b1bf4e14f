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

#ifndef RELAYER_LIB_CIRCUITS_EMAIL_CIRCUIT_INPUT_H_
#define RELAYER_LIB_CIRCUITS_EMAIL_CIRCUIT_INPUT_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "algebra/fp_bn254.h"
#include "circuits/email/email_constants.h"
#include "email/parsed_email.h"
#include "regex/decomposed_regex.h"
#include "util/status.h"

namespace relayer {

// A private circuit input that does not come from the email.  An empty
// value is encoded as all-zero signals.
struct ExternalInput {
  std::string name;
  std::string value;
  size_t max_length = 0;
};

struct CircuitInputParams {
  size_t max_header_length = kMaxHeaderPaddedBytes;
  size_t max_body_length = kMaxBodyPaddedBytes;
  bool ignore_body_hash_check = false;
  bool remove_soft_line_breaks = false;
  // Regex whose first match marks where in-circuit body hashing starts;
  // empty hashes the whole body in the circuit.
  std::string sha_precompute_selector;
  // Hex address bound into the proof; empty means "0".
  std::string prover_eth_address;
};

struct CircuitInputs {
  std::vector<uint8_t> email_header;  // SHA-padded to max_header_length
  size_t email_header_length = 0;     // padded length in bytes
  uint64_t email_header_bit_length = 0;
  std::vector<std::string> pubkey;     // kCircomBigintK decimal limbs
  std::vector<std::string> signature;  // kCircomBigintK decimal limbs

  // Set unless the body hash check is ignored.
  bool has_body = false;
  size_t body_hash_index = 0;
  std::vector<uint8_t> precomputed_sha;
  std::vector<uint8_t> email_body;  // remainder after the precomputed part
  size_t email_body_length = 0;

  // email_body without quoted-printable soft breaks, when requested.
  std::vector<uint8_t> decoded_email_body;

  // (config name, start of its first public range); the circuit signal is
  // "<name>RegexIdx".
  std::vector<std::pair<std::string, size_t>> regex_idxes;
  // (input name, decimal signals).
  std::vector<std::pair<std::string, std::vector<std::string>>>
      external_inputs;
  std::string prover_eth_address = "0";  // decimal
};

// Header, key, signature and body inputs shared by every email circuit.
bool generate_circuit_inputs(const ParsedEmail& email,
                             const CircuitInputParams& params,
                             CircuitInputs* out, RelayerError* err);

// Parses and verifies raw_email, then adds the start index of every
// decomposed regex and the signals of every external input.  The body hash
// check follows params.ignore_body_hash_check.  A config with a non-zero
// max_length fails with RELAYER_MAX_LENGTH_EXCEEDED when its public match
// is longer.
bool generate_circuit_inputs_with_decomposed_regexes_and_external_inputs(
    const std::string& raw_email, const DkimOptions& dkim,
    const std::vector<DecomposedRegexConfig>& decomposed_regexes,
    const std::vector<ExternalInput>& external_inputs,
    const CircuitInputParams& params, CircuitInputs* out, RelayerError* err);

// Inputs of the email-auth circuit.  Missing optional fields have index 0.
struct EmailCircuitInput {
  std::vector<uint8_t> padded_header;
  size_t padded_header_len = 0;
  std::vector<std::string> public_key;
  std::vector<std::string> signature;
  std::string account_code;  // field hex

  bool has_body = false;
  std::vector<uint8_t> padded_body;
  size_t padded_body_len = 0;
  size_t body_hash_idx = 0;
  std::vector<uint8_t> precomputed_sha;
  std::vector<uint8_t> padded_cleaned_body;

  size_t from_addr_idx = 0;
  size_t domain_idx = 0;  // within the from address
  bool has_subject_idx = false;  // only when the body is not used
  size_t subject_idx = 0;
  size_t timestamp_idx = 0;
  size_t code_idx = 0;
  size_t command_idx = 0;
};

// With the body hash check ignored, the invitation code is searched in the
// header and the command is the subject.
bool generate_email_circuit_input(const std::string& raw_email,
                                  const DkimOptions& dkim,
                                  const Fp254Elt& account_code,
                                  const CircuitInputParams& params,
                                  EmailCircuitInput* out, RelayerError* err);

struct ClaimInput {
  std::vector<uint8_t> email_addr;  // padded to kMaxEmailAddrBytes
  std::string cm_rand;
  std::string account_code;
};

bool generate_claim_input(const std::string& email_addr,
                          const std::string& email_addr_rand,
                          const std::string& account_code, ClaimInput* out,
                          RelayerError* err);

// Decimal value of a "0x"-prefixed hex Ethereum address.
bool eth_address_to_decimal(const std::string& hex, std::string* out,
                            RelayerError* err);

}  // namespace relayer

#endif  // RELAYER_LIB_CIRCUITS_EMAIL_CIRCUIT_INPUT_H_
