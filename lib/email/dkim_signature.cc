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

#include "email/dkim_signature.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "email/dkim_canon.h"
#include "email/mime.h"
#include "util/crypto.h"
#include "util/status.h"

namespace relayer {
namespace {

bool is_fws(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::string trim_fws(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && is_fws(s[b])) ++b;
  while (e > b && is_fws(s[e - 1])) --e;
  return s.substr(b, e - b);
}

bool valid_tag_name(const std::string& name) {
  if (name.empty()) return false;
  char c0 = name[0];
  if (!((c0 >= 'a' && c0 <= 'z') || (c0 >= 'A' && c0 <= 'Z'))) return false;
  for (char c : name) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
              (c >= '0' && c <= '9') || c == '_';
    if (!ok) return false;
  }
  return true;
}

bool invalid(RelayerError* err, const std::string& detail) {
  return set_error(err, RELAYER_INVALID_DKIM_SIGNATURE,
                   "Failed to parse email: Invalid DKIM signature (" +
                       detail + ")");
}

bool parse_decimal(const std::string& s, uint64_t* out) {
  if (s.empty() || s.size() > 19) return false;
  uint64_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    v = v * 10 + static_cast<uint64_t>(c - '0');
  }
  *out = v;
  return true;
}

}  // namespace

bool parse_dkim_tag_list(const std::string& text, DkimTagList* tags) {
  tags->clear();
  size_t pos = 0;
  while (pos <= text.size()) {
    size_t semi = text.find(';', pos);
    if (semi == std::string::npos) semi = text.size();
    std::string tag_spec = text.substr(pos, semi - pos);
    pos = semi + 1;

    if (trim_fws(tag_spec).empty()) {
      // Only the element after the final ';' may be empty.
      if (pos > text.size()) break;
      return false;
    }
    size_t eq = tag_spec.find('=');
    if (eq == std::string::npos) return false;
    std::string name = trim_fws(tag_spec.substr(0, eq));
    if (!valid_tag_name(name)) return false;
    if (find_dkim_tag(*tags, name) != nullptr) return false;
    tags->emplace_back(name, trim_fws(tag_spec.substr(eq + 1)));
  }
  return true;
}

const std::string* find_dkim_tag(const DkimTagList& tags,
                                 const std::string& name) {
  for (const auto& t : tags) {
    if (t.first == name) return &t.second;
  }
  return nullptr;
}

bool parse_dkim_signature(const HeaderField& header, DkimSignature* out,
                          RelayerError* err) {
  DkimTagList tags;
  if (!parse_dkim_tag_list(header.value, &tags)) {
    return invalid(err, "malformed tag list");
  }
  static const char* const kRequired[] = {"v", "a", "c", "d",
                                          "s", "h", "bh", "b"};
  for (const char* name : kRequired) {
    if (find_dkim_tag(tags, name) == nullptr) {
      return invalid(err, std::string("missing tag ") + name);
    }
  }

  if (*find_dkim_tag(tags, "v") != "1") {
    return invalid(err, "unsupported version");
  }
  out->algorithm = to_lower_ascii(*find_dkim_tag(tags, "a"));
  if (out->algorithm != "rsa-sha256") {
    return invalid(err, "unsupported algorithm " + out->algorithm);
  }

  std::string c = to_lower_ascii(*find_dkim_tag(tags, "c"));
  size_t slash = c.find('/');
  std::string hc = slash == std::string::npos ? c : c.substr(0, slash);
  std::string bc = slash == std::string::npos ? "simple" : c.substr(slash + 1);
  if (!parse_dkim_canonicalization(hc, &out->header_canon) ||
      !parse_dkim_canonicalization(bc, &out->body_canon)) {
    return invalid(err, "unknown canonicalization " + c);
  }

  out->domain = to_lower_ascii(*find_dkim_tag(tags, "d"));
  out->selector = *find_dkim_tag(tags, "s");
  if (out->domain.empty() || out->selector.empty()) {
    return invalid(err, "empty domain or selector");
  }

  out->signed_headers.clear();
  const std::string& h = *find_dkim_tag(tags, "h");
  size_t pos = 0;
  while (pos <= h.size()) {
    size_t colon = h.find(':', pos);
    if (colon == std::string::npos) colon = h.size();
    std::string name = to_lower_ascii(trim_fws(h.substr(pos, colon - pos)));
    if (name.empty()) {
      return invalid(err, "empty name in h=");
    }
    out->signed_headers.push_back(name);
    pos = colon + 1;
  }
  bool signs_from = false;
  for (const std::string& name : out->signed_headers) {
    if (name == "from") signs_from = true;
  }
  if (!signs_from) {
    return invalid(err, "h= does not include from");
  }

  if (!base64_decode(*find_dkim_tag(tags, "bh"), out->body_hash) ||
      out->body_hash.size() != kSHA256DigestSize) {
    return invalid(err, "bad bh= value");
  }
  if (!base64_decode(*find_dkim_tag(tags, "b"), out->signature) ||
      out->signature.empty()) {
    return invalid(err, "bad b= value");
  }

  out->has_body_length = false;
  if (const std::string* l = find_dkim_tag(tags, "l")) {
    uint64_t v;
    if (!parse_decimal(*l, &v)) {
      return invalid(err, "bad l= value");
    }
    out->has_body_length = true;
    out->body_length = static_cast<size_t>(v);
  }
  out->has_timestamp = false;
  if (const std::string* t = find_dkim_tag(tags, "t")) {
    if (!parse_decimal(*t, &out->timestamp)) {
      return invalid(err, "bad t= value");
    }
    out->has_timestamp = true;
  }
  return true;
}

HeaderField strip_dkim_b_value(const HeaderField& header) {
  HeaderField out = header;
  const std::string& raw = header.raw;
  size_t colon = raw.find(':');
  if (colon == std::string::npos) return out;

  size_t pos = colon + 1;
  while (pos < raw.size()) {
    size_t semi = raw.find(';', pos);
    if (semi == std::string::npos) semi = raw.size();
    size_t eq = raw.find('=', pos);
    if (eq != std::string::npos && eq < semi &&
        trim_fws(raw.substr(pos, eq - pos)) == "b") {
      out.raw = raw.substr(0, eq + 1);
      if (semi < raw.size()) {
        out.raw += raw.substr(semi);
      } else if (raw.size() >= 2 &&
                 raw.compare(raw.size() - 2, 2, "\r\n") == 0) {
        out.raw += "\r\n";
      }
      out.value.clear();
      for (size_t i = colon + 1; i < out.raw.size(); ++i) {
        if (out.raw[i] != '\r' && out.raw[i] != '\n') {
          out.value.push_back(out.raw[i]);
        }
      }
      return out;
    }
    pos = semi + 1;
  }
  return out;
}

}  // namespace relayer
