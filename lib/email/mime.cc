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

#include "email/mime.h"

#include <cstddef>
#include <string>
#include <vector>

#include "util/status.h"

namespace relayer {

std::string normalize_line_endings(const std::string& raw) {
  std::string out;
  out.reserve(raw.size() + raw.size() / 32);
  for (size_t i = 0; i < raw.size(); ++i) {
    char c = raw[i];
    if (c == '\r') {
      out += "\r\n";
      if (i + 1 < raw.size() && raw[i + 1] == '\n') ++i;
    } else if (c == '\n') {
      out += "\r\n";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string to_lower_ascii(const std::string& s) {
  std::string out = s;
  for (char& c : out) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return out;
}

bool split_message(const std::string& message,
                   std::vector<HeaderField>* headers, std::string* body,
                   RelayerError* err) {
  headers->clear();
  body->clear();
  size_t pos = 0;
  const size_t n = message.size();
  while (pos < n) {
    size_t eol = message.find("\r\n", pos);
    if (eol == std::string::npos) eol = n;

    if (eol == pos) {
      // Empty line: the body starts after it.
      *body = message.substr(pos + 2 > n ? n : pos + 2);
      return true;
    }

    char first = message[pos];
    if (first == ' ' || first == '\t') {
      if (headers->empty()) {
        return set_error(err, RELAYER_PARSE_FAILURE,
                         "Failed to parse email: continuation line before "
                         "the first header");
      }
      HeaderField& h = headers->back();
      h.value += message.substr(pos, eol - pos);
      h.raw += message.substr(pos, eol - pos);
    } else {
      size_t colon = message.find(':', pos);
      if (colon == std::string::npos || colon >= eol) {
        return set_error(err, RELAYER_PARSE_FAILURE,
                         "Failed to parse email: header line without a "
                         "colon");
      }
      size_t name_end = colon;
      while (name_end > pos &&
             (message[name_end - 1] == ' ' || message[name_end - 1] == '\t')) {
        --name_end;
      }
      if (name_end == pos) {
        return set_error(err, RELAYER_PARSE_FAILURE,
                         "Failed to parse email: empty header name");
      }
      HeaderField h;
      h.name = message.substr(pos, name_end - pos);
      h.value = message.substr(colon + 1, eol - colon - 1);
      h.raw = message.substr(pos, eol - pos);
      headers->push_back(h);
    }
    if (eol < n) {
      headers->back().raw += "\r\n";
    }
    pos = eol + 2;
  }
  return true;
}

}  // namespace relayer
