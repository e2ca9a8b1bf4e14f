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

#include "regex/command_templates.h"

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

#include "algebra/fp_bn254.h"
#include "regex/decomposed_regex.h"
#include "util/log.h"
#include "util/status.h"

namespace relayer {
namespace {

const char kStringPattern[] = "\\S+";
const char kUintPattern[] = "\\d+";
const char kIntPattern[] = "-?\\d+";
const char kDecimalsPattern[] = "\\d+\\.\\d+";
const char kEthAddrPattern[] = "0x[a-fA-F0-9]{40}";
const size_t kEthAddrLength = 42;

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool is_hex(char c) {
  return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool is_alnum(char c) {
  return is_digit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool all_digits(const std::string& s, size_t from, size_t to) {
  if (from >= to) return false;
  for (size_t i = from; i < to; ++i) {
    if (!is_digit(s[i])) return false;
  }
  return true;
}

// Pattern of one template word: a placeholder's pattern, or the word
// itself with every non-alphanumeric byte written as \xNN.
std::string word_pattern(const std::string& word) {
  if (word == "{string}") return kStringPattern;
  if (word == "{uint}") return kUintPattern;
  if (word == "{int}") return kIntPattern;
  if (word == "{decimals}") return kDecimalsPattern;
  if (word == "{ethAddr}") return kEthAddrPattern;
  std::string p;
  for (char c : word) {
    if (is_alnum(c)) {
      p += c;
    } else {
      char buf[5];
      snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned char>(c));
      p += buf;
    }
  }
  return p;
}

std::vector<std::string> split_whitespace(const std::string& s) {
  std::vector<std::string> words;
  size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && is_space(s[i])) ++i;
    size_t j = i;
    while (j < s.size() && !is_space(s[j])) ++j;
    if (j > i) words.push_back(s.substr(i, j - i));
    i = j;
  }
  return words;
}

bool parse_u256(const std::string& digits, Nat254* out, RelayerError* err) {
  auto v = Nat254::of_untrusted_string(digits.c_str());
  if (!v.has_value()) {
    return set_error(err, RELAYER_INVALID_INPUT_LENGTH,
                     "Encoding error: " + digits +
                         " does not fit in 256 bits");
  }
  *out = v.value();
  return true;
}

bool bad_word(RelayerError* err, const std::string& word,
              const std::string& placeholder) {
  return set_error(err, RELAYER_NO_MATCH,
                   "Regex error: \"" + word + "\" is not a valid " +
                       placeholder);
}

}  // namespace

bool extract_template_vals_from_command(
    const std::string& input, const std::vector<std::string>& templates,
    std::vector<TemplateValue>* out, RelayerError* err) {
  if (templates.empty()) {
    return set_error(err, RELAYER_EMPTY_INPUT,
                     "Regex error: empty command template");
  }
  std::vector<DecomposedRegexPart> parts;
  for (size_t i = 0; i < templates.size(); ++i) {
    if (i > 0) {
      parts.push_back(DecomposedRegexPart{"\\s+", false});
    }
    parts.push_back(DecomposedRegexPart{word_pattern(templates[i]), true});
  }
  DecomposedRegex re;
  if (!re.Compile(parts, err)) {
    return false;
  }
  std::vector<SubstrRange> ranges;
  if (!re.Extract(input, false, &ranges, nullptr)) {
    return set_error(err, RELAYER_NO_MATCH,
                     "Regex error: Unable to match templates with input");
  }
  log(DEBUG, "command template matched at %zu", ranges[0].first);
  return extract_template_vals(input.substr(ranges[0].first), templates, out,
                               err);
}

bool extract_template_vals(const std::string& input,
                           const std::vector<std::string>& templates,
                           std::vector<TemplateValue>* out, RelayerError* err) {
  std::vector<std::string> words = split_whitespace(input);
  if (words.size() < templates.size()) {
    return set_error(err, RELAYER_NO_MATCH,
                     "Regex error: command has fewer words than its template");
  }
  out->clear();
  for (size_t i = 0; i < templates.size(); ++i) {
    const std::string& t = templates[i];
    const std::string& w = words[i];
    TemplateValue v;
    if (t == "{string}") {
      v.kind = TEMPLATE_STRING;
      v.text = w.substr(0, w.find("</div>"));
    } else if (t == "{uint}") {
      if (!all_digits(w, 0, w.size())) return bad_word(err, w, t);
      v.kind = TEMPLATE_UINT;
      v.text = w;
      if (!parse_u256(w, &v.value, err)) return false;
    } else if (t == "{int}") {
      size_t from = (!w.empty() && w[0] == '-') ? 1 : 0;
      if (!all_digits(w, from, w.size())) return bad_word(err, w, t);
      v.kind = TEMPLATE_INT;
      v.text = w;
      if (!parse_u256(w.substr(from), &v.value, err)) return false;
      v.negative = from == 1 && !v.value.is_zero();
      // Two's complement range: -2^255 .. 2^255 - 1.
      if (v.value.bit(255)) {
        Nat254 min;
        min.set_bit(255);
        if (!(v.negative && v.value == min)) {
          return set_error(err, RELAYER_INVALID_INPUT_LENGTH,
                           "Encoding error: " + w +
                               " does not fit in a 256-bit signed integer");
        }
      }
    } else if (t == "{decimals}") {
      size_t dot = w.find('.');
      if (dot == std::string::npos || !all_digits(w, 0, dot) ||
          !all_digits(w, dot + 1, w.size())) {
        return bad_word(err, w, t);
      }
      v.kind = TEMPLATE_DECIMALS;
      v.text = w;
    } else if (t == "{ethAddr}") {
      // Only the prefix must be an address; markup may follow it.
      if (w.size() < kEthAddrLength || w[0] != '0' || w[1] != 'x') {
        return bad_word(err, w, t);
      }
      for (size_t j = 2; j < kEthAddrLength; ++j) {
        if (!is_hex(w[j])) return bad_word(err, w, t);
      }
      v.kind = TEMPLATE_ETH_ADDR;
      v.text = w.substr(0, kEthAddrLength);
      if (!parse_u256(v.text, &v.value, err)) return false;
    } else {
      continue;
    }
    out->push_back(v);
  }
  return true;
}

bool decimals_str_to_uint(const std::string& s, size_t decimals, Nat254* out,
                          RelayerError* err) {
  size_t dot = s.find('.');
  std::string whole = s.substr(0, dot);
  std::string frac = dot == std::string::npos ? "" : s.substr(dot + 1);
  if (frac.size() > decimals) {
    return set_error(err, RELAYER_INVALID_INPUT_LENGTH,
                     "Encoding error: " + s + " has more than " +
                         std::to_string(decimals) + " decimal places");
  }
  std::string digits = whole + frac + std::string(decimals - frac.size(), '0');
  if (!all_digits(digits, 0, digits.size())) {
    return set_error(err, RELAYER_INVALID_INPUT_LENGTH,
                     "Encoding error: " + s + " is not a decimal number");
  }
  return parse_u256(digits, out, err);
}

std::string uint_to_decimal_string(const Nat254& x, size_t decimals) {
  std::string s = x.to_decimal();
  if (s.size() <= decimals) {
    s.insert(0, decimals + 1 - s.size(), '0');
  }
  std::string whole = s.substr(0, s.size() - decimals);
  std::string frac = s.substr(s.size() - decimals);
  size_t last = frac.find_last_not_of('0');
  if (last == std::string::npos) {
    return whole;
  }
  return whole + "." + frac.substr(0, last + 1);
}

}  // namespace relayer
