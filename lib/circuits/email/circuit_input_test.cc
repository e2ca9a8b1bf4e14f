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

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "algebra/fp_bn254.h"
#include "circuits/email/email_constants.h"
#include "codec/field_codec.h"
#include "email/dkim_test_signer.h"
#include "email/parsed_email.h"
#include "regex/decomposed_regex.h"
#include "util/crypto.h"
#include "util/log.h"
#include "util/status.h"
#include "gtest/gtest.h"

namespace relayer {
namespace {

const DkimTestSigner& signer() {
  static const DkimTestSigner* s = new DkimTestSigner();
  return *s;
}

const std::vector<std::string> kHeaders = {
    "From: Alice <alice@example.com>",
    "To: bob@example.org",
    "Subject: Send 1 ETH to bob@example.org",
};

DkimOptions key_options() {
  DkimOptions o;
  o.public_key_der = signer().SpkiDer();
  return o;
}

std::string as_string(const std::vector<uint8_t>& v, size_t pos, size_t n) {
  return std::string(v.begin() + pos, v.begin() + pos + n);
}

DecomposedRegexConfig hi_regex() {
  DecomposedRegexConfig c;
  c.name = "hi";
  c.parts = {{"Hi", true}, {"!", true}};
  return c;
}

TEST(CircuitInputs, HeaderAndBody) {
  std::string body = "Hello\r\nYour code 0x1a2b3c\r\n";
  ParsedEmail e;
  ASSERT_TRUE(parse_email(signer().Sign(kHeaders, body), key_options(), &e,
                          nullptr));

  CircuitInputs in;
  RelayerError err;
  ASSERT_TRUE(generate_circuit_inputs(e, CircuitInputParams(), &in, &err))
      << err.message;

  const std::string& h = e.canonicalized_header;
  ASSERT_EQ(in.email_header.size(), kMaxHeaderPaddedBytes);
  EXPECT_EQ(as_string(in.email_header, 0, h.size()), h);
  EXPECT_EQ(in.email_header[h.size()], 0x80);
  EXPECT_EQ(in.email_header_length, ((h.size() + 9 + 63) / 64) * 64);
  EXPECT_EQ(in.email_header_bit_length, 8 * h.size());

  std::vector<std::string> limbs;
  ASSERT_TRUE(to_circom_bigint_limbs(signer().ModulusBE(), kCircomBigintN,
                                     kCircomBigintK, &limbs, nullptr));
  EXPECT_EQ(in.pubkey, limbs);
  ASSERT_TRUE(to_circom_bigint_limbs(e.signature, kCircomBigintN,
                                     kCircomBigintK, &limbs, nullptr));
  EXPECT_EQ(in.signature, limbs);
  EXPECT_EQ(in.signature.size(), kCircomBigintK);

  ASSERT_TRUE(in.has_body);
  std::string bh;
  ASSERT_TRUE(e.get_body_hash(&bh, nullptr));
  EXPECT_EQ(h.substr(in.body_hash_index, bh.size()), bh);

  // Without a selector nothing is precomputed.
  ASSERT_EQ(in.precomputed_sha.size(), kSHA256DigestSize);
  EXPECT_EQ(in.precomputed_sha[0], 0x6a);
  EXPECT_EQ(in.precomputed_sha[3], 0x67);
  ASSERT_EQ(in.email_body.size(), kMaxBodyPaddedBytes);
  EXPECT_EQ(as_string(in.email_body, 0, body.size()), body);
  EXPECT_EQ(in.email_body_length, 64u);
  EXPECT_TRUE(in.decoded_email_body.empty());
}

TEST(CircuitInputs, SelectorPrecompute) {
  std::string body = std::string(100, 'a') + "\r\nSELECTOR here\r\n";
  ParsedEmail e;
  ASSERT_TRUE(parse_email(signer().Sign(kHeaders, body), key_options(), &e,
                          nullptr));

  CircuitInputParams params;
  params.sha_precompute_selector = "SELECTOR";
  CircuitInputs in;
  ASSERT_TRUE(generate_circuit_inputs(e, params, &in, nullptr));

  SHA256 sha;
  sha.Update(reinterpret_cast<const uint8_t*>(body.data()), 64);
  uint8_t mid[kSHA256DigestSize];
  sha.Midstate(mid);
  ASSERT_EQ(in.precomputed_sha.size(), kSHA256DigestSize);
  EXPECT_EQ(0, memcmp(mid, in.precomputed_sha.data(), kSHA256DigestSize));
  EXPECT_EQ(in.email_body_length, 64u);
  EXPECT_EQ(as_string(in.email_body, 0, body.size() - 64), body.substr(64));

  RelayerError err;
  params.sha_precompute_selector = "NOWHERE";
  EXPECT_FALSE(generate_circuit_inputs(e, params, &in, &err));
  EXPECT_EQ(err.code, RELAYER_NO_MATCH);
}

TEST(CircuitInputs, LengthLimits) {
  std::string body = std::string(100, 'b') + "\r\n";
  ParsedEmail e;
  ASSERT_TRUE(parse_email(signer().Sign(kHeaders, body), key_options(), &e,
                          nullptr));
  CircuitInputs in;
  RelayerError err;

  CircuitInputParams params;
  params.max_body_length = 64;
  EXPECT_FALSE(generate_circuit_inputs(e, params, &in, &err));
  EXPECT_EQ(err.code, RELAYER_MAX_LENGTH_EXCEEDED);

  // The body limit does not apply when the body is not used.
  params.ignore_body_hash_check = true;
  EXPECT_TRUE(generate_circuit_inputs(e, params, &in, &err));
  EXPECT_FALSE(in.has_body);
  EXPECT_TRUE(in.email_body.empty());

  params = CircuitInputParams();
  params.max_header_length = 64;
  EXPECT_FALSE(generate_circuit_inputs(e, params, &in, &err));
  EXPECT_EQ(err.code, RELAYER_MAX_LENGTH_EXCEEDED);
  EXPECT_NE(err.message.find("email header"), std::string::npos);
}

TEST(CircuitInputs, DecomposedRegexesAndExternalInputs) {
  std::string raw = signer().Sign(kHeaders, "Hello there. Hi! bye\r\n");

  DecomposedRegexConfig subject;
  subject.name = "subject";
  subject.parts = {{"subject:", false}, {"Send [0-9]+ ETH", true}};
  subject.location = REGEX_LOCATION_HEADER;

  std::vector<ExternalInput> external = {{"recipient", "bob", 31}};
  CircuitInputParams params;
  params.prover_eth_address = "0x9401296121FC9B78F84fc856B1F8dC88f4415B2e";

  CircuitInputs in;
  RelayerError err;
  ASSERT_TRUE(
      generate_circuit_inputs_with_decomposed_regexes_and_external_inputs(
          raw, key_options(), {hi_regex(), subject}, external, params, &in,
          &err))
      << err.message;

  ASSERT_EQ(in.regex_idxes.size(), 2u);
  EXPECT_EQ(in.regex_idxes[0].first, "hi");
  EXPECT_EQ(in.regex_idxes[0].second, 13u);
  EXPECT_EQ(in.regex_idxes[1].first, "subject");
  EXPECT_EQ(as_string(in.email_header, in.regex_idxes[1].second, 10),
            "Send 1 ETH");

  std::vector<std::string> signals;
  ASSERT_TRUE(string_to_signals("bob", 31, &signals, nullptr));
  ASSERT_EQ(in.external_inputs.size(), 1u);
  EXPECT_EQ(in.external_inputs[0].first, "recipient");
  EXPECT_EQ(in.external_inputs[0].second, signals);

  EXPECT_EQ(in.prover_eth_address,
            "844956539483415709737760098896425774370514885422");

  params.prover_eth_address.clear();
  ASSERT_TRUE(
      generate_circuit_inputs_with_decomposed_regexes_and_external_inputs(
          raw, key_options(), {}, {}, params, &in, &err));
  EXPECT_EQ(in.prover_eth_address, "0");
  EXPECT_TRUE(in.regex_idxes.empty());
  EXPECT_TRUE(in.external_inputs.empty());
}

TEST(CircuitInputs, DecomposedErrors) {
  std::string raw = signer().Sign(kHeaders, "Hello there. Hi! bye\r\n");
  CircuitInputs in;
  RelayerError err;

  DecomposedRegexConfig tight = hi_regex();
  tight.max_length = 2;
  EXPECT_FALSE(
      generate_circuit_inputs_with_decomposed_regexes_and_external_inputs(
          raw, key_options(), {tight}, {}, CircuitInputParams(), &in, &err));
  EXPECT_EQ(err.code, RELAYER_MAX_LENGTH_EXCEEDED);
  EXPECT_NE(err.message.find("hi"), std::string::npos);

  DecomposedRegexConfig missing;
  missing.name = "missing";
  missing.parts = {{"Goodbye", true}};
  EXPECT_FALSE(
      generate_circuit_inputs_with_decomposed_regexes_and_external_inputs(
          raw, key_options(), {missing}, {}, CircuitInputParams(), &in,
          &err));
  EXPECT_EQ(err.code, RELAYER_NO_MATCH);

  std::vector<ExternalInput> external = {{"long", std::string(40, 'x'), 31}};
  EXPECT_FALSE(
      generate_circuit_inputs_with_decomposed_regexes_and_external_inputs(
          raw, key_options(), {}, external, CircuitInputParams(), &in, &err));
  EXPECT_EQ(err.code, RELAYER_MAX_LENGTH_EXCEEDED);
  EXPECT_NE(err.message.find("long"), std::string::npos);

  CircuitInputParams params;
  params.prover_eth_address = "0xnothex";
  EXPECT_FALSE(
      generate_circuit_inputs_with_decomposed_regexes_and_external_inputs(
          raw, key_options(), {}, {}, params, &in, &err));
  EXPECT_EQ(err.code, RELAYER_INVALID_HEX);

  EXPECT_FALSE(
      generate_circuit_inputs_with_decomposed_regexes_and_external_inputs(
          raw, DkimOptions(), {}, {}, CircuitInputParams(), &in, &err));
  EXPECT_EQ(err.code, RELAYER_KEY_NOT_FOUND);
}

TEST(CircuitInputs, SoftLineBreaks) {
  std::string raw = signer().Sign(kHeaders, "Hello=\r\nthere Hi!\r\n");
  CircuitInputParams params;
  CircuitInputs in;

  ASSERT_TRUE(
      generate_circuit_inputs_with_decomposed_regexes_and_external_inputs(
          raw, key_options(), {hi_regex()}, {}, params, &in, nullptr));
  EXPECT_EQ(in.regex_idxes[0].second, 14u);

  params.remove_soft_line_breaks = true;
  ASSERT_TRUE(
      generate_circuit_inputs_with_decomposed_regexes_and_external_inputs(
          raw, key_options(), {hi_regex()}, {}, params, &in, nullptr));
  EXPECT_EQ(in.regex_idxes[0].second, 11u);
  ASSERT_EQ(in.decoded_email_body.size(), in.email_body.size());
  EXPECT_EQ(as_string(in.decoded_email_body, 0, 16), "Hellothere Hi!\r\n");
}

TEST(EmailCircuitInput, WithBody) {
  std::string body =
      "Your code 0x1a2b3c\r\n"
      "<div id=3D\"zkemail\">Send 0.1 ETH to bob</div>\r\n";
  std::string raw = signer().Sign(kHeaders, body);

  Fp254Elt code = bn254_scalar_field().of_scalar(7);
  EmailCircuitInput in;
  RelayerError err;
  ASSERT_TRUE(generate_email_circuit_input(raw, key_options(), code,
                                           CircuitInputParams(), &in, &err))
      << err.message;

  EXPECT_EQ(in.padded_header.size(), kMaxHeaderPaddedBytes);
  EXPECT_EQ(in.public_key.size(), kCircomBigintK);
  EXPECT_EQ(in.signature.size(), kCircomBigintK);
  EXPECT_EQ(in.account_code, field_to_hex(code));
  ASSERT_TRUE(in.has_body);
  EXPECT_EQ(in.padded_body.size(), kMaxBodyPaddedBytes);
  EXPECT_EQ(in.precomputed_sha.size(), kSHA256DigestSize);
  EXPECT_EQ(in.padded_cleaned_body.size(), in.padded_body.size());

  EXPECT_EQ(as_string(in.padded_header, in.from_addr_idx, 17),
            "alice@example.com");
  EXPECT_EQ(in.domain_idx, 6u);
  EXPECT_EQ(as_string(in.padded_header, in.timestamp_idx, 10),
            "1694989812");
  EXPECT_FALSE(in.has_subject_idx);
  EXPECT_EQ(in.code_idx, 12u);
  EXPECT_EQ(as_string(in.padded_cleaned_body, in.code_idx, 6), "1a2b3c");
  EXPECT_EQ(in.command_idx, 40u);
  EXPECT_EQ(as_string(in.padded_cleaned_body, in.command_idx, 19),
            "Send 0.1 ETH to bob");
}

TEST(EmailCircuitInput, IgnoringBody) {
  std::string raw = signer().Sign(kHeaders, "no code here\r\n");
  CircuitInputParams params;
  params.ignore_body_hash_check = true;

  EmailCircuitInput in;
  ASSERT_TRUE(generate_email_circuit_input(
      raw, key_options(), bn254_scalar_field().one(), params, &in, nullptr));
  EXPECT_FALSE(in.has_body);
  EXPECT_TRUE(in.padded_body.empty());
  EXPECT_TRUE(in.padded_cleaned_body.empty());
  ASSERT_TRUE(in.has_subject_idx);
  EXPECT_EQ(as_string(in.padded_header, in.subject_idx, 10), "Send 1 ETH");
  EXPECT_EQ(in.command_idx, in.subject_idx);
  EXPECT_EQ(in.code_idx, 0u);
}

TEST(EmailCircuitInput, LogsIndexFallback) {
  std::string raw = signer().Sign(kHeaders, "no code here\r\n");
  CircuitInputParams params;
  params.ignore_body_hash_check = true;

  LogLevel saved = log_level();
  set_log_level(INFO);
  testing::internal::CaptureStderr();
  EmailCircuitInput in;
  bool ok = generate_email_circuit_input(
      raw, key_options(), bn254_scalar_field().one(), params, &in, nullptr);
  std::string logged = testing::internal::GetCapturedStderr();
  set_log_level(saved);

  ASSERT_TRUE(ok);
  EXPECT_EQ(in.code_idx, 0u);
  EXPECT_NE(logged.find("no invitation code found, using index 0"),
            std::string::npos)
      << logged;
}

TEST(ClaimInput, PadsAddress) {
  ClaimInput in;
  ASSERT_TRUE(generate_claim_input("alice@example.com", "0x01", "0x02", &in,
                                   nullptr));
  ASSERT_EQ(in.email_addr.size(), kMaxEmailAddrBytes);
  EXPECT_EQ(as_string(in.email_addr, 0, 17), "alice@example.com");
  EXPECT_EQ(in.email_addr[17], 0);
  EXPECT_EQ(in.cm_rand, "0x01");
  EXPECT_EQ(in.account_code, "0x02");

  RelayerError err;
  EXPECT_FALSE(generate_claim_input(std::string(300, 'a'), "0x01", "0x02",
                                    &in, &err));
  EXPECT_EQ(err.code, RELAYER_MAX_LENGTH_EXCEEDED);
}

TEST(EthAddress, ToDecimal) {
  std::string s;
  ASSERT_TRUE(eth_address_to_decimal("0x01", &s, nullptr));
  EXPECT_EQ(s, "1");
  RelayerError err;
  EXPECT_FALSE(eth_address_to_decimal("0x" + std::string(66, 'f'), &s, &err));
  EXPECT_EQ(err.code, RELAYER_INVALID_HEX);
}

}  // namespace
}  // namespace relayer
