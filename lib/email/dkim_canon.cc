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

#include "email/dkim_canon.h"

#include <cstddef>
#include <string>
#include <vector>

#include "email/mime.h"

namespace relayer {
namespace {

bool is_wsp(char c) { return c == ' ' || c == '\t'; }

// Collapses runs of WSP to one space and drops WSP at both ends.
std::string compress_wsp(const std::string& s) {
  std::string out;
  bool in_wsp = false;
  for (char c : s) {
    if (c == '\r' || c == '\n') continue;
    if (is_wsp(c)) {
      in_wsp = true;
      continue;
    }
    if (in_wsp && !out.empty()) out.push_back(' ');
    in_wsp = false;
    out.push_back(c);
  }
  return out;
}

}  // namespace

bool parse_dkim_canonicalization(const std::string& s,
                                 DkimCanonicalization* out) {
  if (s == "simple") {
    *out = DKIM_CANON_SIMPLE;
    return true;
  }
  if (s == "relaxed") {
    *out = DKIM_CANON_RELAXED;
    return true;
  }
  return false;
}

std::string canonicalize_header_field(const HeaderField& h,
                                      DkimCanonicalization mode) {
  if (mode == DKIM_CANON_SIMPLE) {
    std::string out = h.raw;
    if (out.size() < 2 || out.compare(out.size() - 2, 2, "\r\n") != 0) {
      out += "\r\n";
    }
    return out;
  }
  return to_lower_ascii(h.name) + ":" + compress_wsp(h.value) + "\r\n";
}

std::string canonicalize_body(const std::string& body,
                              DkimCanonicalization mode) {
  std::string out;
  if (mode == DKIM_CANON_SIMPLE) {
    out = body;
  } else {
    out.reserve(body.size());
    size_t pos = 0;
    while (pos < body.size()) {
      size_t eol = body.find("\r\n", pos);
      bool has_eol = eol != std::string::npos;
      if (!has_eol) eol = body.size();
      std::string line;
      bool in_wsp = false;
      for (size_t i = pos; i < eol; ++i) {
        char c = body[i];
        if (is_wsp(c)) {
          in_wsp = true;
          continue;
        }
        if (in_wsp) line.push_back(' ');
        in_wsp = false;
        line.push_back(c);
      }
      out += line;
      out += "\r\n";
      pos = has_eol ? eol + 2 : eol;
    }
  }

  // Strip all trailing empty lines.
  if (mode == DKIM_CANON_SIMPLE && !out.empty() &&
      (out.size() < 2 || out.compare(out.size() - 2, 2, "\r\n") != 0)) {
    out += "\r\n";
  }
  while (out.size() >= 4 && out.compare(out.size() - 4, 4, "\r\n\r\n") == 0) {
    out.resize(out.size() - 2);
  }
  if (out == "\r\n") {
    out.clear();
  }
  if (out.empty() && mode == DKIM_CANON_SIMPLE) {
    out = "\r\n";
  }
  return out;
}

std::vector<const HeaderField*> select_signed_headers(
    const std::vector<HeaderField>& headers,
    const std::vector<std::string>& signed_names) {
  std::vector<bool> used(headers.size(), false);
  std::vector<const HeaderField*> out;
  for (const std::string& name : signed_names) {
    for (size_t i = headers.size(); i-- > 0;) {
      if (!used[i] && to_lower_ascii(headers[i].name) == name) {
        used[i] = true;
        out.push_back(&headers[i]);
        break;
      }
    }
  }
  return out;
}

}  // namespace relayer
