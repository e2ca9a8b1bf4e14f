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

#include "regex/regex_parser.h"

#include <bitset>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>

#include "util/status.h"

namespace relayer {

namespace {

std::bitset<256> byte_range(int lo, int hi) {
  std::bitset<256> s;
  for (int c = lo; c <= hi; ++c) {
    s.set(c);
  }
  return s;
}

std::bitset<256> digit_set() { return byte_range('0', '9'); }

std::bitset<256> word_set() {
  return byte_range('a', 'z') | byte_range('A', 'Z') | byte_range('0', '9') |
         byte_range('_', '_');
}

std::bitset<256> space_set() {
  std::bitset<256> s;
  for (char c : {' ', '\t', '\n', '\r', '\f', '\v'}) {
    s.set(static_cast<unsigned char>(c));
  }
  return s;
}

std::unique_ptr<RegexNode> make_node(RegexNodeKind kind) {
  std::unique_ptr<RegexNode> n(new RegexNode);
  n->kind = kind;
  return n;
}

std::unique_ptr<RegexNode> make_bytes(const std::bitset<256>& s) {
  auto n = make_node(REGEX_BYTES);
  n->bytes = s;
  return n;
}

class RegexParser {
 public:
  RegexParser(const std::string& pattern, RelayerError* err)
      : p_(pattern), pos_(0), err_(err) {}

  bool parse(std::unique_ptr<RegexNode>* out) {
    std::unique_ptr<RegexNode> n;
    if (!parse_alt(&n)) {
      return false;
    }
    if (pos_ != p_.size()) {
      return invalid("unbalanced ')'");
    }
    *out = std::move(n);
    return true;
  }

 private:
  bool at_end() const { return pos_ >= p_.size(); }
  char peek(size_t k = 0) const {
    return pos_ + k < p_.size() ? p_[pos_ + k] : '\0';
  }

  bool invalid(const std::string& why) {
    return set_error(err_, RELAYER_INVALID_REGEX,
                     "Regex error: " + why + " at offset " +
                         std::to_string(pos_) + " in " + p_);
  }
  bool unsupported(const std::string& what) {
    return set_error(err_, RELAYER_UNSUPPORTED_CONSTRUCT,
                     "Regex error: unsupported construct " + what + " in " +
                         p_);
  }

  bool parse_alt(std::unique_ptr<RegexNode>* out) {
    std::unique_ptr<RegexNode> first;
    if (!parse_concat(&first)) {
      return false;
    }
    if (peek() != '|') {
      *out = std::move(first);
      return true;
    }
    auto alt = make_node(REGEX_ALT);
    alt->children.push_back(std::move(first));
    while (peek() == '|') {
      ++pos_;
      std::unique_ptr<RegexNode> next;
      if (!parse_concat(&next)) {
        return false;
      }
      alt->children.push_back(std::move(next));
    }
    *out = std::move(alt);
    return true;
  }

  bool parse_concat(std::unique_ptr<RegexNode>* out) {
    auto cat = make_node(REGEX_CONCAT);
    while (!at_end() && peek() != '|' && peek() != ')') {
      std::unique_ptr<RegexNode> atom;
      if (!parse_repeat(&atom)) {
        return false;
      }
      cat->children.push_back(std::move(atom));
    }
    if (cat->children.empty()) {
      *out = make_node(REGEX_EMPTY);
    } else if (cat->children.size() == 1) {
      *out = std::move(cat->children[0]);
    } else {
      *out = std::move(cat);
    }
    return true;
  }

  // Parses {n}, {n,} or {n,m} at pos_.  Returns false without consuming
  // anything if the text there is not a counted repetition.
  bool parse_counted(int* min, int* max) {
    size_t save = pos_;
    ++pos_;  // '{'
    auto number = [&](int* v) {
      size_t start = pos_;
      long long x = 0;
      while (!at_end() && peek() >= '0' && peek() <= '9') {
        x = 10 * x + (peek() - '0');
        if (x > kRegexMaxRepeat) x = kRegexMaxRepeat + 1;
        ++pos_;
      }
      *v = static_cast<int>(x);
      return pos_ > start;
    };
    if (!number(min)) {
      pos_ = save;
      return false;
    }
    if (peek() == '}') {
      ++pos_;
      *max = *min;
      return true;
    }
    if (peek() != ',') {
      pos_ = save;
      return false;
    }
    ++pos_;
    if (peek() == '}') {
      ++pos_;
      *max = kRegexUnbounded;
      return true;
    }
    if (!number(max) || peek() != '}') {
      pos_ = save;
      return false;
    }
    ++pos_;
    return true;
  }

  bool parse_repeat(std::unique_ptr<RegexNode>* out) {
    std::unique_ptr<RegexNode> atom;
    if (!parse_atom(&atom)) {
      return false;
    }
    bool quantified = false;
    for (;;) {
      int min = 0, max = 0;
      char c = peek();
      if (c == '*') {
        min = 0, max = kRegexUnbounded;
        ++pos_;
      } else if (c == '+') {
        min = 1, max = kRegexUnbounded;
        ++pos_;
      } else if (c == '?') {
        min = 0, max = 1;
        ++pos_;
      } else if (c == '{' && parse_counted(&min, &max)) {
        // consumed
      } else {
        break;
      }
      if (quantified) {
        if (c == '?' || c == '+') {
          return unsupported("lazy or possessive quantifier");
        }
        return invalid("nested quantifier");
      }
      quantified = true;
      if (min > kRegexMaxRepeat || max > kRegexMaxRepeat) {
        return invalid("repetition count too large");
      }
      if (max != kRegexUnbounded && max < min) {
        return invalid("repetition range out of order");
      }
      auto rep = make_node(REGEX_REPEAT);
      rep->min = min;
      rep->max = max;
      rep->children.push_back(std::move(atom));
      atom = std::move(rep);
    }
    *out = std::move(atom);
    return true;
  }

  bool parse_atom(std::unique_ptr<RegexNode>* out) {
    char c = peek();
    switch (c) {
      case '(':
        return parse_group(out);
      case '[':
        return parse_class(out);
      case '.': {
        ++pos_;
        std::bitset<256> s;
        s.set();
        s.reset('\n');
        *out = make_bytes(s);
        return true;
      }
      case '^':
        ++pos_;
        *out = make_node(REGEX_BEGIN);
        return true;
      case '$':
        ++pos_;
        *out = make_node(REGEX_END);
        return true;
      case '\\':
        return parse_escape_atom(out);
      case '*':
      case '+':
      case '?':
        return invalid("quantifier without operand");
      default: {
        ++pos_;
        std::bitset<256> s;
        s.set(static_cast<unsigned char>(c));
        *out = make_bytes(s);
        return true;
      }
    }
  }

  bool parse_group(std::unique_ptr<RegexNode>* out) {
    ++pos_;  // '('
    if (peek() == '?') {
      if (peek(1) == ':') {
        pos_ += 2;
      } else if (peek(1) == '=' || peek(1) == '!') {
        return unsupported("look-ahead");
      } else if (peek(1) == '<' && (peek(2) == '=' || peek(2) == '!')) {
        return unsupported("look-behind");
      } else {
        return unsupported("group flags");
      }
    }
    std::unique_ptr<RegexNode> inner;
    if (!parse_alt(&inner)) {
      return false;
    }
    if (peek() != ')') {
      return invalid("missing ')'");
    }
    ++pos_;
    *out = std::move(inner);
    return true;
  }

  // Parses an escape after the backslash at pos_.  Sets *set to the bytes
  // it denotes and *single when it denotes exactly one byte.
  bool parse_escape(std::bitset<256>* set, bool* single, bool in_class) {
    ++pos_;  // '\\'
    if (at_end()) {
      return invalid("trailing backslash");
    }
    char c = p_[pos_++];
    *single = true;
    set->reset();
    switch (c) {
      case 'n':
        set->set('\n');
        return true;
      case 'r':
        set->set('\r');
        return true;
      case 't':
        set->set('\t');
        return true;
      case 'f':
        set->set('\f');
        return true;
      case 'v':
        set->set('\v');
        return true;
      case '0':
        set->set(0);
        return true;
      case 'x': {
        int v = 0;
        for (int i = 0; i < 2; ++i) {
          char h = peek();
          int d;
          if (h >= '0' && h <= '9') {
            d = h - '0';
          } else if (h >= 'a' && h <= 'f') {
            d = h - 'a' + 10;
          } else if (h >= 'A' && h <= 'F') {
            d = h - 'A' + 10;
          } else {
            return invalid("bad \\x escape");
          }
          v = 16 * v + d;
          ++pos_;
        }
        set->set(v);
        return true;
      }
      case 'd':
        *single = false;
        *set = digit_set();
        return true;
      case 'D':
        *single = false;
        *set = ~digit_set();
        return true;
      case 'w':
        *single = false;
        *set = word_set();
        return true;
      case 'W':
        *single = false;
        *set = ~word_set();
        return true;
      case 's':
        *single = false;
        *set = space_set();
        return true;
      case 'S':
        *single = false;
        *set = ~space_set();
        return true;
      case 'b':
      case 'B':
        return unsupported(in_class ? "\\b in class" : "word boundary");
      case 'p':
      case 'P':
        return unsupported("unicode class");
      case 'k':
        return unsupported("backreference");
      default:
        break;
    }
    if (c >= '1' && c <= '9') {
      return unsupported("backreference");
    }
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) {
      return invalid(std::string("unknown escape \\") + c);
    }
    set->set(static_cast<unsigned char>(c));
    return true;
  }

  bool parse_escape_atom(std::unique_ptr<RegexNode>* out) {
    if (peek(1) == 'A') {
      pos_ += 2;
      *out = make_node(REGEX_BEGIN);
      return true;
    }
    if (peek(1) == 'z') {
      pos_ += 2;
      *out = make_node(REGEX_END);
      return true;
    }
    std::bitset<256> s;
    bool single;
    if (!parse_escape(&s, &single, false)) {
      return false;
    }
    *out = make_bytes(s);
    return true;
  }

  // One class member that may serve as a range endpoint.
  bool parse_class_byte(std::bitset<256>* set, bool* single) {
    if (peek() == '\\') {
      return parse_escape(set, single, true);
    }
    set->reset();
    set->set(static_cast<unsigned char>(p_[pos_++]));
    *single = true;
    return true;
  }

  static int only_byte(const std::bitset<256>& s) {
    for (int c = 0; c < 256; ++c) {
      if (s.test(c)) return c;
    }
    return -1;
  }

  bool parse_class(std::unique_ptr<RegexNode>* out) {
    ++pos_;  // '['
    bool negate = false;
    if (peek() == '^') {
      negate = true;
      ++pos_;
    }
    std::bitset<256> acc;
    bool first = true;
    for (;;) {
      if (at_end()) {
        return invalid("missing ']'");
      }
      if (peek() == ']' && !first) {
        ++pos_;
        break;
      }
      first = false;
      std::bitset<256> lo;
      bool lo_single;
      if (!parse_class_byte(&lo, &lo_single)) {
        return false;
      }
      if (lo_single && peek() == '-' && peek(1) != ']' && pos_ + 1 < p_.size()) {
        ++pos_;  // '-'
        std::bitset<256> hi;
        bool hi_single;
        if (!parse_class_byte(&hi, &hi_single)) {
          return false;
        }
        if (!hi_single) {
          return invalid("class escape as range endpoint");
        }
        int a = only_byte(lo), b = only_byte(hi);
        if (a > b) {
          return invalid("class range out of order");
        }
        acc |= byte_range(a, b);
      } else {
        acc |= lo;
      }
    }
    if (negate) {
      acc = ~acc;
    }
    *out = make_bytes(acc);
    return true;
  }

  const std::string& p_;
  size_t pos_;
  RelayerError* err_;
};

}  // namespace

bool parse_regex(const std::string& pattern, std::unique_ptr<RegexNode>* out,
                 RelayerError* err) {
  RegexParser parser(pattern, err);
  return parser.parse(out);
}

}  // namespace relayer
