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

#ifndef RELAYER_LIB_EMAIL_DKIM_SIGNATURE_H_
#define RELAYER_LIB_EMAIL_DKIM_SIGNATURE_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "email/dkim_canon.h"
#include "email/mime.h"
#include "util/status.h"

namespace relayer {

typedef std::vector<std::pair<std::string, std::string>> DkimTagList;

// RFC 6376 section 3.2 tag=value list.  Tag names are kept as written and
// values have surrounding whitespace removed.  Fails on a missing '=', an
// invalid tag name, or a duplicate tag.
bool parse_dkim_tag_list(const std::string& text, DkimTagList* tags);

// Value of `name` in `tags`, or nullptr.
const std::string* find_dkim_tag(const DkimTagList& tags,
                                 const std::string& name);

struct DkimSignature {
  std::string algorithm;
  DkimCanonicalization header_canon = DKIM_CANON_SIMPLE;
  DkimCanonicalization body_canon = DKIM_CANON_SIMPLE;
  std::string domain;
  std::string selector;
  std::vector<std::string> signed_headers;  // lower case, in h= order
  std::vector<uint8_t> body_hash;
  std::vector<uint8_t> signature;
  bool has_body_length = false;
  size_t body_length = 0;  // l=
  bool has_timestamp = false;
  uint64_t timestamp = 0;  // t=
};

// Parses the value of a DKIM-Signature header.  Requires v=1, a=rsa-sha256
// and the c, d, s, h, bh and b tags; h must name "from".  All failures are
// RELAYER_INVALID_DKIM_SIGNATURE.
bool parse_dkim_signature(const HeaderField& header, DkimSignature* out,
                          RelayerError* err);

// The DKIM-Signature field with the value of its b= tag removed, which is
// the form that enters the signed data.
HeaderField strip_dkim_b_value(const HeaderField& header);

}  // namespace relayer

#endif  // RELAYER_LIB_EMAIL_DKIM_SIGNATURE_H_
