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

#ifndef RELAYER_LIB_EMAIL_PARSED_EMAIL_H_
#define RELAYER_LIB_EMAIL_PARSED_EMAIL_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "email/dkim_key.h"
#include "regex/decomposed_regex.h"
#include "util/status.h"

namespace relayer {

// Where the verifying key comes from.  The first non-empty source wins:
// public_key_modulus, then public_key_der, then resolver.
struct DkimOptions {
  const DkimKeyResolver* resolver = nullptr;
  std::vector<uint8_t> public_key_der;      // SubjectPublicKeyInfo or PKCS#1
  std::vector<uint8_t> public_key_modulus;  // big-endian, e = 65537
  bool ignore_body_hash_check = false;
};

// A DKIM-verified email.  canonicalized_header is exactly the signed data:
// the h= headers followed by the DKIM-Signature field with an empty b= and
// no final CRLF.
struct ParsedEmail {
  std::string canonicalized_header;
  std::string canonicalized_body;
  std::vector<uint8_t> signature;   // big-endian, as carried in b=
  std::vector<uint8_t> public_key;  // RSA modulus, little-endian
  std::string selector;
  std::string domain;
  std::vector<std::pair<std::string, std::string>> header_map;
  uint64_t dkim_timestamp = 0;  // t= or 0

  bool has_body() const { return !canonicalized_body.empty(); }

  // "0x" followed by the big-endian hex of each value.
  std::string signature_string() const;
  std::string public_key_string() const;

  const std::string& get_body_text() const { return canonicalized_body; }

  // Ranges index canonicalized_header, except where noted.
  bool get_from_addr(std::string* out, RelayerError* err) const;
  bool get_from_addr_idxes(SubstrRange* out, RelayerError* err) const;
  bool get_to_addr(std::string* out, RelayerError* err) const;
  // Range within the from address.
  bool get_email_domain(std::string* out, RelayerError* err) const;
  bool get_email_domain_idxes(SubstrRange* out, RelayerError* err) const;
  bool get_subject_all(std::string* out, RelayerError* err) const;
  bool get_subject_all_idxes(SubstrRange* out, RelayerError* err) const;
  bool get_body_hash(std::string* out, RelayerError* err) const;
  bool get_body_hash_idxes(SubstrRange* out, RelayerError* err) const;
  bool get_timestamp(uint64_t* out, RelayerError* err) const;
  bool get_timestamp_idxes(SubstrRange* out, RelayerError* err) const;
  bool get_message_id(std::string* out, RelayerError* err) const;
  // Ranges within the subject.
  bool get_email_addr_in_subject(std::string* out, RelayerError* err) const;
  bool get_email_addr_in_subject_idxes(SubstrRange* out,
                                       RelayerError* err) const;
  // Ranges within canonicalized_body.
  bool get_invitation_code(std::string* out, RelayerError* err) const;
  bool get_invitation_code_idxes(SubstrRange* out, RelayerError* err) const;
  bool get_invitation_code_with_prefix(std::string* out,
                                       RelayerError* err) const;
  bool get_invitation_code_with_prefix_idxes(SubstrRange* out,
                                             RelayerError* err) const;
  bool get_command_idxes(SubstrRange* out, RelayerError* err) const;
};

// Parses and DKIM-verifies a raw RFC 5322 message.  Bare LF line endings are
// accepted and treated as CRLF.
bool parse_email(const std::string& raw, const DkimOptions& options,
                 ParsedEmail* out, RelayerError* err);

// Removes quoted-printable soft line breaks ("=\r\n") and zero-fills the
// tail so the result has the length of the input.
std::vector<uint8_t> remove_quoted_printable_soft_breaks(
    const std::vector<uint8_t>& body);

// Offset of the first occurrence of needle in body.
bool find_index_in_body(const std::vector<uint8_t>& body,
                        const std::string& needle, size_t* idx);

}  // namespace relayer

#endif  // RELAYER_LIB_EMAIL_PARSED_EMAIL_H_
