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

#ifndef RELAYER_LIB_REGEX_BUILTIN_REGEXES_H_
#define RELAYER_LIB_REGEX_BUILTIN_REGEXES_H_

#include <string>
#include <vector>

#include "regex/decomposed_regex.h"
#include "util/status.h"

namespace relayer {

// Fixed decomposed regexes for the fields every email circuit reveals.
// Header patterns expect the canonicalized (lower-case name) header.
const DecomposedRegexConfig& email_addr_regex();
const DecomposedRegexConfig& email_domain_regex();
const DecomposedRegexConfig& from_addr_regex();
const DecomposedRegexConfig& to_addr_regex();
const DecomposedRegexConfig& subject_all_regex();
const DecomposedRegexConfig& body_hash_regex();
const DecomposedRegexConfig& timestamp_regex();
const DecomposedRegexConfig& message_id_regex();
const DecomposedRegexConfig& invitation_code_regex();
const DecomposedRegexConfig& invitation_code_with_prefix_regex();
const DecomposedRegexConfig& command_regex();

// Each wrapper returns the public ranges of its config.
bool extract_email_addr_idxes(const std::string& text,
                              std::vector<SubstrRange>* out, RelayerError* err);
bool extract_email_domain_idxes(const std::string& text,
                                std::vector<SubstrRange>* out,
                                RelayerError* err);
bool extract_from_addr_idxes(const std::string& header,
                             std::vector<SubstrRange>* out, RelayerError* err);
bool extract_to_addr_idxes(const std::string& header,
                           std::vector<SubstrRange>* out, RelayerError* err);
bool extract_subject_all_idxes(const std::string& header,
                               std::vector<SubstrRange>* out,
                               RelayerError* err);
bool extract_body_hash_idxes(const std::string& header,
                             std::vector<SubstrRange>* out, RelayerError* err);
bool extract_timestamp_idxes(const std::string& header,
                             std::vector<SubstrRange>* out, RelayerError* err);
bool extract_message_id_idxes(const std::string& header,
                              std::vector<SubstrRange>* out, RelayerError* err);
bool extract_invitation_code_idxes(const std::string& text,
                                   std::vector<SubstrRange>* out,
                                   RelayerError* err);
bool extract_invitation_code_with_prefix_idxes(const std::string& text,
                                               std::vector<SubstrRange>* out,
                                               RelayerError* err);
bool extract_command_idxes(const std::string& body,
                           std::vector<SubstrRange>* out, RelayerError* err);

// First public substring of a builtin config.
bool extract_first_substr(const std::string& text,
                          const DecomposedRegexConfig& config,
                          std::string* out, RelayerError* err);

}  // namespace relayer

#endif  // RELAYER_LIB_REGEX_BUILTIN_REGEXES_H_
