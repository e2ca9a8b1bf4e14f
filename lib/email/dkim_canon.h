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

#ifndef RELAYER_LIB_EMAIL_DKIM_CANON_H_
#define RELAYER_LIB_EMAIL_DKIM_CANON_H_

#include <string>
#include <vector>

#include "email/mime.h"

namespace relayer {

enum DkimCanonicalization { DKIM_CANON_SIMPLE, DKIM_CANON_RELAXED };

// Parses "simple" or "relaxed".
bool parse_dkim_canonicalization(const std::string& s,
                                 DkimCanonicalization* out);

// RFC 6376 section 3.4.  The result ends in CRLF.
std::string canonicalize_header_field(const HeaderField& h,
                                      DkimCanonicalization mode);

// RFC 6376 section 3.4.3 and 3.4.4.  An empty body canonicalizes to CRLF
// under simple and to the empty string under relaxed.
std::string canonicalize_body(const std::string& body,
                              DkimCanonicalization mode);

// Selects the header fields named in `signed_names` (lower case), taking
// the bottom-most unused instance for repeated names.  Names with no
// remaining instance contribute nothing.
std::vector<const HeaderField*> select_signed_headers(
    const std::vector<HeaderField>& headers,
    const std::vector<std::string>& signed_names);

}  // namespace relayer

#endif  // RELAYER_LIB_EMAIL_DKIM_CANON_H_
