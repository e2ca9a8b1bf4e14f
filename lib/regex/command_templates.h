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

#ifndef RELAYER_LIB_REGEX_COMMAND_TEMPLATES_H_
#define RELAYER_LIB_REGEX_COMMAND_TEMPLATES_H_

#include <cstddef>
#include <string>
#include <vector>

#include "algebra/fp_bn254.h"
#include "util/status.h"

namespace relayer {

// Placeholders recognized in a command template.  Any other template word
// is a fixed word that must appear in the command but yields no value.
enum TemplateValueKind {
  TEMPLATE_STRING,    // {string}: one whitespace-free word
  TEMPLATE_UINT,      // {uint}: 256-bit unsigned decimal
  TEMPLATE_INT,       // {int}: 256-bit two's complement decimal
  TEMPLATE_DECIMALS,  // {decimals}: digits '.' digits, kept as text
  TEMPLATE_ETH_ADDR,  // {ethAddr}: "0x" and 40 hex digits
};

struct TemplateValue {
  TemplateValueKind kind = TEMPLATE_STRING;
  // The matched text.  For {string} it stops before any "</div>".
  std::string text;
  // Magnitude for {uint} and {int}, the address for {ethAddr}.
  Nat254 value;
  bool negative = false;  // {int} only
};

// Finds the leftmost place in `input` where the template words occur
// separated by whitespace and extracts the placeholder values from there.
// Fails with RELAYER_NO_MATCH when the command does not fit the template.
bool extract_template_vals_from_command(
    const std::string& input, const std::vector<std::string>& templates,
    std::vector<TemplateValue>* out, RelayerError* err);

// Matches the whitespace-separated words of `input` against `templates`
// position by position.  Words past the end of the template are ignored.
bool extract_template_vals(const std::string& input,
                           const std::vector<std::string>& templates,
                           std::vector<TemplateValue>* out, RelayerError* err);

// "1.5" with 18 decimals is 1500000000000000000.  At most `decimals`
// fraction digits are accepted.
bool decimals_str_to_uint(const std::string& s, size_t decimals, Nat254* out,
                          RelayerError* err);

// Inverse of decimals_str_to_uint() without trailing fraction zeros:
// 1500000000000000000 with 18 decimals is "1.5", 10^18 is "1".
std::string uint_to_decimal_string(const Nat254& x, size_t decimals);

}  // namespace relayer

#endif  // RELAYER_LIB_REGEX_COMMAND_TEMPLATES_H_
