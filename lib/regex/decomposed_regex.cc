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

#include "regex/decomposed_regex.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "regex/nfa.h"
#include "regex/regex_parser.h"
#include "util/log.h"
#include "util/status.h"

namespace relayer {

bool parse_regex_location(const std::string& s, RegexLocation* out) {
  if (s == "header") {
    *out = REGEX_LOCATION_HEADER;
    return true;
  }
  if (s == "body") {
    *out = REGEX_LOCATION_BODY;
    return true;
  }
  return false;
}

bool DecomposedRegex::Compile(const std::vector<DecomposedRegexPart>& parts,
                              RelayerError* err) {
  std::vector<std::unique_ptr<RegexNode>> trees;
  std::vector<const RegexNode*> roots;
  is_public_.clear();
  display_.clear();
  for (const DecomposedRegexPart& part : parts) {
    std::unique_ptr<RegexNode> tree;
    if (!parse_regex(part.pattern, &tree, err)) {
      return false;
    }
    roots.push_back(tree.get());
    trees.push_back(std::move(tree));
    is_public_.push_back(part.is_public);
    display_ += part.pattern;
  }
  if (!nfa_.Build(roots, err)) {
    return false;
  }
  log(DEBUG, "compiled %zu fragments into %zu states", parts.size(),
      nfa_.num_states());
  return true;
}

bool DecomposedRegex::Extract(const uint8_t text[/*n*/], size_t n,
                              bool reveal_private,
                              std::vector<SubstrRange>* out,
                              RelayerError* err) const {
  size_t start, end;
  if (!nfa_.FindLongest(text, n, &start, &end)) {
    return set_error(err, RELAYER_NO_MATCH,
                     "Regex error: no match for " + display_);
  }
  std::vector<size_t> bounds;
  if (!nfa_.Attribute(text, n, start, end, &bounds)) {
    return set_error(err, RELAYER_NO_MATCH,
                     "Regex error: could not split match for " + display_);
  }
  out->clear();
  for (size_t i = 0; i + 1 < bounds.size(); ++i) {
    if (reveal_private || is_public_[i]) {
      out->push_back(SubstrRange(bounds[i], bounds[i + 1]));
    }
  }
  return true;
}

bool extract_substr_idxes(const std::string& text,
                          const DecomposedRegexConfig& config,
                          bool reveal_private, std::vector<SubstrRange>* out,
                          RelayerError* err) {
  DecomposedRegex re;
  if (!re.Compile(config.parts, err)) {
    return false;
  }
  return re.Extract(text, reveal_private, out, err);
}

bool extract_substrs(const std::string& text,
                     const DecomposedRegexConfig& config, bool reveal_private,
                     std::vector<std::string>* out, RelayerError* err) {
  std::vector<SubstrRange> idxes;
  if (!extract_substr_idxes(text, config, reveal_private, &idxes, err)) {
    return false;
  }
  out->clear();
  for (const SubstrRange& r : idxes) {
    out->push_back(text.substr(r.first, r.second - r.first));
  }
  return true;
}

bool find_regex(const std::string& pattern, const uint8_t text[/*n*/],
                size_t n, size_t* start, RelayerError* err) {
  DecomposedRegex re;
  DecomposedRegexPart part;
  part.pattern = pattern;
  part.is_public = true;
  if (!re.Compile({part}, err)) {
    return false;
  }
  std::vector<SubstrRange> r;
  if (!re.Extract(text, n, true, &r, err)) {
    return false;
  }
  *start = r[0].first;
  return true;
}

}  // namespace relayer
