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

#include "email/parsed_email.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "email/dkim_canon.h"
#include "email/dkim_key.h"
#include "email/dkim_signature.h"
#include "email/mime.h"
#include "regex/builtin_regexes.h"
#include "regex/decomposed_regex.h"
#include "util/crypto.h"
#include "util/log.h"
#include "util/status.h"

namespace relayer {
namespace {

typedef bool (*RangeExtractor)(const std::string&, std::vector<SubstrRange>*,
                               RelayerError*);

bool first_range(RangeExtractor fn, const std::string& text, SubstrRange* out,
                 RelayerError* err) {
  std::vector<SubstrRange> r;
  if (!fn(text, &r, err)) return false;
  *out = r[0];
  return true;
}

bool first_substr(RangeExtractor fn, const std::string& text,
                  std::string* out, RelayerError* err) {
  SubstrRange r;
  if (!first_range(fn, text, &r, err)) return false;
  *out = text.substr(r.first, r.second - r.first);
  return true;
}

bool load_key(const DkimOptions& options, const DkimSignature& sig,
              RsaPublicKey* key, RelayerError* err) {
  if (!options.public_key_modulus.empty()) {
    if (!key->FromModulus(options.public_key_modulus)) {
      return set_error(err, RELAYER_PARSE_FAILURE,
                       "Failed to parse email: bad RSA modulus");
    }
    return true;
  }
  if (!options.public_key_der.empty()) {
    if (!key->ParseDer(options.public_key_der)) {
      return set_error(err, RELAYER_PARSE_FAILURE,
                       "Failed to parse email: bad DER public key");
    }
    return true;
  }
  std::string txt;
  if (options.resolver == nullptr ||
      !options.resolver->Lookup(sig.selector, sig.domain, &txt)) {
    return set_error(err, RELAYER_KEY_NOT_FOUND,
                     "Failed to parse email: no public key for " +
                         dkim_key_name(sig.selector, sig.domain));
  }
  return parse_dkim_key_record(txt, key, err);
}

std::string to_hex_be(const std::vector<uint8_t>& v) {
  return "0x" + hex_encode(v);
}

}  // namespace

bool parse_email(const std::string& raw, const DkimOptions& options,
                 ParsedEmail* out, RelayerError* err) {
  if (raw.empty()) {
    return set_error(err, RELAYER_EMPTY_INPUT,
                     "Invalid email: Email cannot be empty");
  }
  if (raw.find('@') == std::string::npos) {
    return set_error(err, RELAYER_MALFORMED_ADDRESS,
                     "Invalid email: Email must contain @ symbol");
  }

  std::vector<HeaderField> headers;
  std::string body;
  if (!split_message(normalize_line_endings(raw), &headers, &body, err)) {
    return false;
  }

  const HeaderField* from = nullptr;
  const HeaderField* dkim = nullptr;
  for (const HeaderField& h : headers) {
    std::string name = to_lower_ascii(h.name);
    if (from == nullptr && name == "from") from = &h;
    if (dkim == nullptr && name == "dkim-signature") dkim = &h;
  }
  if (from == nullptr || from->value.find('@') == std::string::npos) {
    return set_error(err, RELAYER_MALFORMED_ADDRESS,
                     "Invalid email: From header has no address");
  }
  if (dkim == nullptr) {
    return set_error(err, RELAYER_INVALID_DKIM_SIGNATURE,
                     "Failed to parse email: Invalid DKIM signature");
  }

  DkimSignature sig;
  if (!parse_dkim_signature(*dkim, &sig, err)) {
    return false;
  }

  RsaPublicKey key;
  if (!load_key(options, sig, &key, err)) {
    return false;
  }

  std::string canon_body = canonicalize_body(body, sig.body_canon);
  if (sig.has_body_length) {
    if (sig.body_length > canon_body.size()) {
      return set_error(err, RELAYER_INVALID_DKIM_SIGNATURE,
                       "Failed to parse email: Invalid DKIM signature "
                       "(l= exceeds the body)");
    }
    canon_body.resize(sig.body_length);
  }
  if (options.ignore_body_hash_check) {
    log(INFO, "skipping DKIM body hash check for d=%s", sig.domain.c_str());
  } else {
    uint8_t bh[kSHA256DigestSize];
    sha256(reinterpret_cast<const uint8_t*>(canon_body.data()),
           canon_body.size(), bh);
    if (!std::equal(bh, bh + kSHA256DigestSize, sig.body_hash.begin())) {
      return set_error(err, RELAYER_BODY_HASH_MISMATCH,
                       "Failed to parse email: body hash does not match "
                       "bh=");
    }
  }

  std::string signed_data;
  for (const HeaderField* h : select_signed_headers(headers,
                                                    sig.signed_headers)) {
    signed_data += canonicalize_header_field(*h, sig.header_canon);
  }
  std::string dkim_canon =
      canonicalize_header_field(strip_dkim_b_value(*dkim), sig.header_canon);
  dkim_canon.resize(dkim_canon.size() - 2);
  signed_data += dkim_canon;

  if (!key.Verify(reinterpret_cast<const uint8_t*>(signed_data.data()),
                  signed_data.size(), sig.signature.data(),
                  sig.signature.size())) {
    return set_error(err, RELAYER_SIGNATURE_VERIFICATION_FAILED,
                     "Failed to parse email: DKIM signature verification "
                     "failed for d=" + sig.domain);
  }

  out->canonicalized_header = signed_data;
  out->canonicalized_body = canon_body;
  out->signature = sig.signature;
  out->public_key = key.ModulusBE();
  std::reverse(out->public_key.begin(), out->public_key.end());
  out->selector = sig.selector;
  out->domain = sig.domain;
  out->dkim_timestamp = sig.has_timestamp ? sig.timestamp : 0;
  out->header_map.clear();
  for (const HeaderField& h : headers) {
    out->header_map.emplace_back(h.name, h.value);
  }
  log(INFO, "parsed email signed by %s", sig.domain.c_str());
  return true;
}

std::string ParsedEmail::signature_string() const {
  return to_hex_be(signature);
}

std::string ParsedEmail::public_key_string() const {
  std::vector<uint8_t> be(public_key.rbegin(), public_key.rend());
  return to_hex_be(be);
}

bool ParsedEmail::get_from_addr(std::string* out, RelayerError* err) const {
  return first_substr(extract_from_addr_idxes, canonicalized_header, out, err);
}

bool ParsedEmail::get_from_addr_idxes(SubstrRange* out,
                                      RelayerError* err) const {
  return first_range(extract_from_addr_idxes, canonicalized_header, out, err);
}

bool ParsedEmail::get_to_addr(std::string* out, RelayerError* err) const {
  return first_substr(extract_to_addr_idxes, canonicalized_header, out, err);
}

bool ParsedEmail::get_email_domain(std::string* out, RelayerError* err) const {
  std::string from;
  return get_from_addr(&from, err) &&
         first_substr(extract_email_domain_idxes, from, out, err);
}

bool ParsedEmail::get_email_domain_idxes(SubstrRange* out,
                                         RelayerError* err) const {
  std::string from;
  return get_from_addr(&from, err) &&
         first_range(extract_email_domain_idxes, from, out, err);
}

bool ParsedEmail::get_subject_all(std::string* out, RelayerError* err) const {
  return first_substr(extract_subject_all_idxes, canonicalized_header, out,
                      err);
}

bool ParsedEmail::get_subject_all_idxes(SubstrRange* out,
                                        RelayerError* err) const {
  return first_range(extract_subject_all_idxes, canonicalized_header, out,
                     err);
}

bool ParsedEmail::get_body_hash(std::string* out, RelayerError* err) const {
  return first_substr(extract_body_hash_idxes, canonicalized_header, out, err);
}

bool ParsedEmail::get_body_hash_idxes(SubstrRange* out,
                                      RelayerError* err) const {
  return first_range(extract_body_hash_idxes, canonicalized_header, out, err);
}

bool ParsedEmail::get_timestamp(uint64_t* out, RelayerError* err) const {
  std::string s;
  if (!first_substr(extract_timestamp_idxes, canonicalized_header, &s, err)) {
    return false;
  }
  if (s.size() > 19) {
    return set_error(err, RELAYER_PARSE_FAILURE,
                     "Failed to parse email: timestamp out of range");
  }
  uint64_t v = 0;
  for (char c : s) {
    v = v * 10 + static_cast<uint64_t>(c - '0');
  }
  *out = v;
  return true;
}

bool ParsedEmail::get_timestamp_idxes(SubstrRange* out,
                                      RelayerError* err) const {
  return first_range(extract_timestamp_idxes, canonicalized_header, out, err);
}

bool ParsedEmail::get_message_id(std::string* out, RelayerError* err) const {
  return first_substr(extract_message_id_idxes, canonicalized_header, out,
                      err);
}

bool ParsedEmail::get_email_addr_in_subject(std::string* out,
                                            RelayerError* err) const {
  std::string subject;
  return get_subject_all(&subject, err) &&
         first_substr(extract_email_addr_idxes, subject, out, err);
}

bool ParsedEmail::get_email_addr_in_subject_idxes(SubstrRange* out,
                                                  RelayerError* err) const {
  std::string subject;
  return get_subject_all(&subject, err) &&
         first_range(extract_email_addr_idxes, subject, out, err);
}

bool ParsedEmail::get_invitation_code(std::string* out,
                                      RelayerError* err) const {
  return first_substr(extract_invitation_code_idxes, canonicalized_body, out,
                      err);
}

bool ParsedEmail::get_invitation_code_idxes(SubstrRange* out,
                                            RelayerError* err) const {
  return first_range(extract_invitation_code_idxes, canonicalized_body, out,
                     err);
}

bool ParsedEmail::get_invitation_code_with_prefix(std::string* out,
                                                  RelayerError* err) const {
  return first_substr(extract_invitation_code_with_prefix_idxes,
                      canonicalized_body, out, err);
}

bool ParsedEmail::get_invitation_code_with_prefix_idxes(
    SubstrRange* out, RelayerError* err) const {
  return first_range(extract_invitation_code_with_prefix_idxes,
                     canonicalized_body, out, err);
}

bool ParsedEmail::get_command_idxes(SubstrRange* out,
                                    RelayerError* err) const {
  return first_range(extract_command_idxes, canonicalized_body, out, err);
}

std::vector<uint8_t> remove_quoted_printable_soft_breaks(
    const std::vector<uint8_t>& body) {
  std::vector<uint8_t> out;
  out.reserve(body.size());
  size_t i = 0;
  while (i < body.size()) {
    if (i + 2 < body.size() && body[i] == '=' && body[i + 1] == '\r' &&
        body[i + 2] == '\n') {
      i += 3;
      continue;
    }
    out.push_back(body[i]);
    ++i;
  }
  out.resize(body.size(), 0);
  return out;
}

bool find_index_in_body(const std::vector<uint8_t>& body,
                        const std::string& needle, size_t* idx) {
  if (needle.empty() || needle.size() > body.size()) return false;
  auto it = std::search(body.begin(), body.end(), needle.begin(), needle.end(),
                        [](uint8_t a, char b) {
                          return a == static_cast<uint8_t>(b);
                        });
  if (it == body.end()) return false;
  *idx = static_cast<size_t>(it - body.begin());
  return true;
}

}  // namespace relayer
