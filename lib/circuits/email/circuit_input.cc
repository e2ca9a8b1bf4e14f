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

#include "circuits/email/circuit_input.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "algebra/fp_bn254.h"
#include "circuits/email/commitments.h"
#include "circuits/email/email_constants.h"
#include "circuits/sha/sha256_pad.h"
#include "codec/field_codec.h"
#include "email/parsed_email.h"
#include "regex/builtin_regexes.h"
#include "regex/decomposed_regex.h"
#include "util/crypto.h"
#include "util/log.h"
#include "util/status.h"

namespace relayer {
namespace {

std::string as_string(const std::vector<uint8_t>& v) {
  return std::string(v.begin(), v.end());
}

bool parse_verified(const std::string& raw_email, const DkimOptions& dkim,
                    const CircuitInputParams& params, ParsedEmail* email,
                    RelayerError* err) {
  DkimOptions options = dkim;
  options.ignore_body_hash_check = params.ignore_body_hash_check;
  return parse_email(raw_email, options, email, err);
}

// Start of the first public range, or 0 when the pattern does not match.
size_t idx_or_zero(bool (*fn)(const std::string&, std::vector<SubstrRange>*,
                              RelayerError*),
                   const char* what, const std::string& text) {
  std::vector<SubstrRange> r;
  if (!fn(text, &r, nullptr) || r.empty()) {
    log(INFO, "no %s found, using index 0", what);
    return 0;
  }
  return r[0].first;
}

size_t body_idx_or_zero(const std::vector<uint8_t>& body,
                        const std::string& needle, const char* what) {
  size_t idx;
  if (!find_index_in_body(body, needle, &idx)) {
    log(INFO, "no %s in the cleaned body, using index 0", what);
    return 0;
  }
  return idx;
}

}  // namespace

bool eth_address_to_decimal(const std::string& hex, std::string* out,
                            RelayerError* err) {
  Nat254 v;
  if (!hex_to_u256(hex, &v, err)) {
    return false;
  }
  *out = v.to_decimal();
  return true;
}

bool generate_circuit_inputs(const ParsedEmail& email,
                             const CircuitInputParams& params,
                             CircuitInputs* out, RelayerError* err) {
  Sha256Padded header;
  if (!sha256_pad(email.canonicalized_header, params.max_header_length,
                  &header, nullptr)) {
    return set_error(err, RELAYER_MAX_LENGTH_EXCEEDED,
                     "Length error: email header of " +
                         std::to_string(email.canonicalized_header.size()) +
                         " bytes does not fit max_header_length " +
                         std::to_string(params.max_header_length));
  }
  out->email_header = std::move(header.padded);
  out->email_header_length = header.padded_length;
  out->email_header_bit_length = header.bit_length;

  std::vector<uint8_t> pk_be(email.public_key.rbegin(),
                             email.public_key.rend());
  if (!to_circom_bigint_limbs(pk_be, kCircomBigintN, kCircomBigintK,
                              &out->pubkey, err) ||
      !to_circom_bigint_limbs(email.signature, kCircomBigintN, kCircomBigintK,
                              &out->signature, err)) {
    return false;
  }

  out->has_body = false;
  out->body_hash_index = 0;
  out->precomputed_sha.clear();
  out->email_body.clear();
  out->email_body_length = 0;
  out->decoded_email_body.clear();
  if (params.ignore_body_hash_check) {
    return true;
  }

  SubstrRange bh;
  if (!email.get_body_hash_idxes(&bh, err)) {
    return false;
  }

  const std::string& body = email.canonicalized_body;
  // Room for the SHA padding even when the body exceeds max_body_length,
  // so that the length check below names the remainder.
  size_t body_sha_length = ((body.size() + 63 + 65) / 64) * 64;
  Sha256Padded padded;
  if (!sha256_pad(body, std::max(params.max_body_length, body_sha_length),
                  &padded, err)) {
    return false;
  }
  PartialSha partial;
  if (!generate_partial_sha(padded.padded, padded.padded_length,
                            params.sha_precompute_selector,
                            params.max_body_length, &partial, err)) {
    return false;
  }

  out->has_body = true;
  out->body_hash_index = bh.first;
  out->precomputed_sha.assign(partial.precomputed_sha,
                              partial.precomputed_sha + kSHA256DigestSize);
  out->email_body = std::move(partial.remaining_body);
  out->email_body_length = partial.remaining_length;
  if (params.remove_soft_line_breaks) {
    out->decoded_email_body =
        remove_quoted_printable_soft_breaks(out->email_body);
  }
  return true;
}

bool generate_circuit_inputs_with_decomposed_regexes_and_external_inputs(
    const std::string& raw_email, const DkimOptions& dkim,
    const std::vector<DecomposedRegexConfig>& decomposed_regexes,
    const std::vector<ExternalInput>& external_inputs,
    const CircuitInputParams& params, CircuitInputs* out, RelayerError* err) {
  ParsedEmail email;
  if (!parse_verified(raw_email, dkim, params, &email, err) ||
      !generate_circuit_inputs(email, params, out, err)) {
    return false;
  }

  out->regex_idxes.clear();
  for (const DecomposedRegexConfig& config : decomposed_regexes) {
    std::string input;
    if (config.location == REGEX_LOCATION_HEADER) {
      input = as_string(out->email_header);
    } else if (params.remove_soft_line_breaks) {
      input = as_string(out->decoded_email_body);
    } else {
      input = as_string(out->email_body);
    }

    std::vector<SubstrRange> ranges;
    if (!extract_substr_idxes(input, config, false, &ranges, err)) {
      return false;
    }
    if (ranges.empty()) {
      return set_error(err, RELAYER_INVALID_REGEX,
                       "Regex error: " + config.name +
                           " has no public part");
    }
    size_t match_len = ranges.back().second - ranges.front().first;
    if (config.max_length != 0 && match_len > config.max_length) {
      return set_error(err, RELAYER_MAX_LENGTH_EXCEEDED,
                       "Length error: match of " + config.name + " is " +
                           std::to_string(match_len) +
                           " bytes, longer than max_length " +
                           std::to_string(config.max_length));
    }
    out->regex_idxes.emplace_back(config.name, ranges[0].first);
  }

  out->external_inputs.clear();
  for (const ExternalInput& input : external_inputs) {
    std::vector<std::string> signals;
    RelayerError sig_err;
    if (!string_to_signals(input.value, input.max_length, &signals,
                           &sig_err)) {
      return set_error(err, sig_err.code,
                       "Length error: external input " + input.name +
                           " is longer than " +
                           std::to_string(input.max_length) + " bytes");
    }
    out->external_inputs.emplace_back(input.name, std::move(signals));
  }

  out->prover_eth_address = "0";
  if (!params.prover_eth_address.empty() &&
      !eth_address_to_decimal(params.prover_eth_address,
                              &out->prover_eth_address, err)) {
    return false;
  }
  return true;
}

bool generate_email_circuit_input(const std::string& raw_email,
                                  const DkimOptions& dkim,
                                  const Fp254Elt& account_code,
                                  const CircuitInputParams& params,
                                  EmailCircuitInput* out, RelayerError* err) {
  ParsedEmail email;
  CircuitInputs base;
  if (!parse_verified(raw_email, dkim, params, &email, err) ||
      !generate_circuit_inputs(email, params, &base, err)) {
    return false;
  }

  SubstrRange from, domain;
  if (!email.get_from_addr_idxes(&from, err) ||
      !email.get_email_domain_idxes(&domain, err)) {
    return false;
  }

  out->padded_header = std::move(base.email_header);
  out->padded_header_len = base.email_header_length;
  out->public_key = std::move(base.pubkey);
  out->signature = std::move(base.signature);
  out->account_code = field_to_hex(account_code);
  out->has_body = base.has_body;
  out->padded_body = std::move(base.email_body);
  out->padded_body_len = base.email_body_length;
  out->body_hash_idx = base.body_hash_index;
  out->precomputed_sha = std::move(base.precomputed_sha);
  out->from_addr_idx = from.first;
  out->domain_idx = domain.first;

  const std::string& header = email.canonicalized_header;
  const bool ignore = params.ignore_body_hash_check;
  SubstrRange subject(0, 0);
  bool has_subject = email.get_subject_all_idxes(&subject, nullptr);
  out->has_subject_idx = !out->has_body;
  if (out->has_subject_idx) {
    if (!has_subject) {
      return set_error(err, RELAYER_NO_MATCH,
                       "Regex error: email has no subject");
    }
    out->subject_idx = subject.first;
  }

  out->timestamp_idx =
      idx_or_zero(extract_timestamp_idxes, "timestamp", header);
  out->code_idx = idx_or_zero(extract_invitation_code_idxes,
                              "invitation code",
                              ignore ? header : email.canonicalized_body);
  if (ignore) {
    out->command_idx = has_subject ? subject.first : 0;
  } else {
    out->command_idx =
        idx_or_zero(extract_command_idxes, "command",
                    email.canonicalized_body);
  }

  out->padded_cleaned_body.clear();
  if (out->has_body) {
    out->padded_cleaned_body =
        remove_quoted_printable_soft_breaks(out->padded_body);

    // Indices must point into the body the circuit sees.
    std::string code;
    if (!extract_first_substr(email.canonicalized_body,
                              invitation_code_regex(), &code, nullptr)) {
      code.clear();
    }
    std::string command;
    if (!extract_first_substr(email.canonicalized_body, command_regex(),
                              &command, nullptr)) {
      command.clear();
    }
    out->code_idx = body_idx_or_zero(out->padded_cleaned_body, code,
                                     "invitation code");
    out->command_idx =
        body_idx_or_zero(out->padded_cleaned_body, command, "command");
  }
  log(INFO, "email circuit input: header %zu bytes, body %zu bytes",
      out->padded_header_len, out->padded_body_len);
  return true;
}

bool generate_claim_input(const std::string& email_addr,
                          const std::string& email_addr_rand,
                          const std::string& account_code, ClaimInput* out,
                          RelayerError* err) {
  PaddedEmailAddr padded;
  if (!PaddedEmailAddr::FromEmailAddr(email_addr, &padded, err)) {
    return false;
  }
  out->email_addr = padded.padded_bytes();
  out->cm_rand = email_addr_rand;
  out->account_code = account_code;
  return true;
}

}  // namespace relayer
