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

#ifndef RELAYER_LIB_REGEX_REGEX_PARSER_H_
#define RELAYER_LIB_REGEX_REGEX_PARSER_H_

#include <bitset>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "util/status.h"

namespace relayer {

// Syntax tree of the regex dialect accepted by the circuit compiler:
// literals, escapes, classes, '.', groups, alternation, the usual
// quantifiers and the text anchors '^' and '$'.  Patterns operate on bytes.
enum RegexNodeKind {
  REGEX_EMPTY,
  REGEX_BYTES,   // one byte out of `bytes`
  REGEX_CONCAT,  // children in sequence
  REGEX_ALT,     // one of the children
  REGEX_REPEAT,  // children[0] between min and max times
  REGEX_BEGIN,   // start of text
  REGEX_END,     // end of text
};

constexpr int kRegexUnbounded = -1;
constexpr int kRegexMaxRepeat = 1000;

struct RegexNode {
  RegexNodeKind kind = REGEX_EMPTY;
  std::bitset<256> bytes;
  std::vector<std::unique_ptr<RegexNode>> children;
  int min = 0;
  int max = 0;
};

// Parses pattern.  Look-around, backreferences, word boundaries, inline
// flags and lazy quantifiers fail with RELAYER_UNSUPPORTED_CONSTRUCT since
// they have no automaton the circuit can reproduce; other syntax errors
// fail with RELAYER_INVALID_REGEX.
bool parse_regex(const std::string& pattern, std::unique_ptr<RegexNode>* out,
                 RelayerError* err);

}  // namespace relayer

#endif  // RELAYER_LIB_REGEX_REGEX_PARSER_H_
