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

#ifndef RELAYER_LIB_REGEX_DECOMPOSED_REGEX_H_
#define RELAYER_LIB_REGEX_DECOMPOSED_REGEX_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "regex/nfa.h"
#include "regex/regex_parser.h"
#include "util/status.h"

namespace relayer {

struct DecomposedRegexPart {
  std::string pattern;
  bool is_public = false;
};

enum RegexLocation { REGEX_LOCATION_HEADER, REGEX_LOCATION_BODY };

// Parses "header" or "body".
bool parse_regex_location(const std::string& s, RegexLocation* out);

struct DecomposedRegexConfig {
  std::string name;
  std::vector<DecomposedRegexPart> parts;
  size_t max_length = 0;  // 0 means unchecked
  RegexLocation location = REGEX_LOCATION_BODY;
};

// Half-open byte range [first, second).
typedef std::pair<size_t, size_t> SubstrRange;

// A decomposed regex compiled once into a single automaton.  Matching is
// const and may run concurrently from several threads.
class DecomposedRegex {
 public:
  DecomposedRegex() = default;

  bool Compile(const std::vector<DecomposedRegexPart>& parts,
               RelayerError* err);

  // Finds the leftmost-longest match of the fragment sequence and returns
  // one range per fragment in order, or per public fragment only when
  // reveal_private is false.  Fails with RELAYER_NO_MATCH.
  bool Extract(const uint8_t text[/*n*/], size_t n, bool reveal_private,
               std::vector<SubstrRange>* out, RelayerError* err) const;

  bool Extract(const std::string& text, bool reveal_private,
               std::vector<SubstrRange>* out, RelayerError* err) const {
    return Extract(reinterpret_cast<const uint8_t*>(text.data()), text.size(),
                   reveal_private, out, err);
  }

 private:
  std::vector<bool> is_public_;
  std::string display_;
  Nfa nfa_;
};

bool extract_substr_idxes(const std::string& text,
                          const DecomposedRegexConfig& config,
                          bool reveal_private, std::vector<SubstrRange>* out,
                          RelayerError* err);

// The matched substrings themselves, in the same order as the ranges.
bool extract_substrs(const std::string& text,
                     const DecomposedRegexConfig& config, bool reveal_private,
                     std::vector<std::string>* out, RelayerError* err);

// Start of the leftmost match of a single pattern.
bool find_regex(const std::string& pattern, const uint8_t text[/*n*/],
                size_t n, size_t* start, RelayerError* err);

}  // namespace relayer

#endif  // RELAYER_LIB_REGEX_DECOMPOSED_REGEX_H_
