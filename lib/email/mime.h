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

#ifndef RELAYER_LIB_EMAIL_MIME_H_
#define RELAYER_LIB_EMAIL_MIME_H_

#include <string>
#include <vector>

#include "util/status.h"

namespace relayer {

// One header field as it appears in the message.  raw includes the name,
// the colon, any folded continuation lines and the terminating CRLF.
struct HeaderField {
  std::string name;   // as written, without surrounding whitespace
  std::string value;  // everything after the colon, CRLF removed
  std::string raw;
};

// Rewrites bare LF and bare CR line endings as CRLF.
std::string normalize_line_endings(const std::string& raw);

// Splits an RFC 5322 message into its header fields, in order, and the body
// that follows the first empty line.  A message without an empty line has an
// empty body.  Expects CRLF line endings.
bool split_message(const std::string& message, std::vector<HeaderField>* headers,
                   std::string* body, RelayerError* err);

// ASCII lower-casing for header and tag names.
std::string to_lower_ascii(const std::string& s);

}  // namespace relayer

#endif  // RELAYER_LIB_EMAIL_MIME_H_
