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

#include "regex/builtin_regexes.h"

#include <string>
#include <utility>
#include <vector>

#include "regex/decomposed_regex.h"
#include "util/status.h"

namespace relayer {
namespace {

// Header patterns run on relaxed-canonicalized headers: lowercase names
// and no space after the colon.  Headers signed with c=simple/... keep
// their original spelling and do not match.
const char kAddrLocal[] = "[a-zA-Z0-9!#$%&\\*\\+-/=\\?^_`{\\|}~\\.]+";
const char kAddrDomain[] = "@[a-zA-Z0-9_\\.-]+";
const char kDkimPrefix[] = "(\r\n|^)dkim-signature:";
const char kDkimTags[] = "([a-z]+=[^;]+; )+";

DecomposedRegexConfig make(const char* name, RegexLocation location,
                           std::vector<DecomposedRegexPart> parts) {
  DecomposedRegexConfig c;
  c.name = name;
  c.location = location;
  c.parts = std::move(parts);
  return c;
}

DecomposedRegexConfig address_field(const char* name, const char* field) {
  return make(name, REGEX_LOCATION_HEADER,
              {{std::string("(\r\n|^)") + field + ":", false},
               {"([^\r\n]+<)?", false},
               {std::string(kAddrLocal) + kAddrDomain, true},
               {">?\r\n", false}});
}

// The compiled automaton is cached next to its config.
struct Builtin {
  explicit Builtin(DecomposedRegexConfig c) : config(std::move(c)) {
    RelayerError err;
    compiled = regex.Compile(config.parts, &err);
  }
  DecomposedRegexConfig config;
  DecomposedRegex regex;
  bool compiled = false;
};

const Builtin& email_addr() {
  static const Builtin b(make(
      "email_addr", REGEX_LOCATION_BODY,
      {{"[A-Za-z0-9!#$%&'*+=?\\-\\^_`{|}~./]+@[A-Za-z0-9.\\-]+", true}}));
  return b;
}

const Builtin& email_domain() {
  static const Builtin b(
      make("email_domain", REGEX_LOCATION_BODY,
           {{"[A-Za-z0-9!#$%&'*+=?\\-\\^_`{|}~./]+@", false},
            {"[A-Za-z0-9.\\-@]+", true}}));
  return b;
}

const Builtin& from_addr() {
  static const Builtin b(address_field("from_addr", "from"));
  return b;
}

const Builtin& to_addr() {
  static const Builtin b(address_field("to_addr", "to"));
  return b;
}

const Builtin& subject_all() {
  static const Builtin b(make("subject_all", REGEX_LOCATION_HEADER,
                              {{"(\r\n|^)subject:", false},
                               {"[^\r\n]+", true},
                               {"\r\n", false}}));
  return b;
}

const Builtin& body_hash() {
  static const Builtin b(make(
      "body_hash", REGEX_LOCATION_HEADER,
      {{kDkimPrefix, false},
       {std::string(kDkimTags) + "bh=", false},
       {"[a-zA-Z0-9+/=]+", true},
       {";", false}}));
  return b;
}

const Builtin& timestamp() {
  static const Builtin b(make("timestamp", REGEX_LOCATION_HEADER,
                              {{kDkimPrefix, false},
                               {std::string(kDkimTags) + "t=", false},
                               {"[0-9]+", true},
                               {";", false}}));
  return b;
}

const Builtin& message_id() {
  static const Builtin b(make("message_id", REGEX_LOCATION_HEADER,
                              {{"(\r\n|^)message-id:", false},
                               {"<[A-Za-z0-9=@\\.\\+_-]+>", true},
                               {"\r\n", false}}));
  return b;
}

const Builtin& invitation_code() {
  static const Builtin b(make("invitation_code", REGEX_LOCATION_BODY,
                              {{"[Cc]ode 0x", false},
                               {"[0-9a-fA-F]+", true}}));
  return b;
}

const Builtin& invitation_code_with_prefix() {
  static const Builtin b(make("invitation_code_with_prefix",
                              REGEX_LOCATION_BODY,
                              {{"[Cc]ode ", false},
                               {"0x[0-9a-fA-F]+", true}}));
  return b;
}

const Builtin& command() {
  static const Builtin b(
      make("command", REGEX_LOCATION_BODY,
           {{"(<div id=3D\"[^\"]*zkemail[^\"]*\"[^>]*>)", false},
            {"[^<>/]+", true},
            {"</div>", false}}));
  return b;
}

bool run(const Builtin& b, const std::string& text,
         std::vector<SubstrRange>* out, RelayerError* err) {
  if (!b.compiled) {
    return set_error(err, RELAYER_INVALID_REGEX,
                     "Regex error: builtin " + b.config.name +
                         " failed to compile");
  }
  return b.regex.Extract(text, false, out, err);
}

}  // namespace

const DecomposedRegexConfig& email_addr_regex() { return email_addr().config; }
const DecomposedRegexConfig& email_domain_regex() {
  return email_domain().config;
}
const DecomposedRegexConfig& from_addr_regex() { return from_addr().config; }
const DecomposedRegexConfig& to_addr_regex() { return to_addr().config; }
const DecomposedRegexConfig& subject_all_regex() {
  return subject_all().config;
}
const DecomposedRegexConfig& body_hash_regex() { return body_hash().config; }
const DecomposedRegexConfig& timestamp_regex() { return timestamp().config; }
const DecomposedRegexConfig& message_id_regex() { return message_id().config; }
const DecomposedRegexConfig& invitation_code_regex() {
  return invitation_code().config;
}
const DecomposedRegexConfig& invitation_code_with_prefix_regex() {
  return invitation_code_with_prefix().config;
}
const DecomposedRegexConfig& command_regex() { return command().config; }

bool extract_email_addr_idxes(const std::string& text,
                              std::vector<SubstrRange>* out,
                              RelayerError* err) {
  return run(email_addr(), text, out, err);
}

bool extract_email_domain_idxes(const std::string& text,
                                std::vector<SubstrRange>* out,
                                RelayerError* err) {
  return run(email_domain(), text, out, err);
}

bool extract_from_addr_idxes(const std::string& header,
                             std::vector<SubstrRange>* out,
                             RelayerError* err) {
  return run(from_addr(), header, out, err);
}

bool extract_to_addr_idxes(const std::string& header,
                           std::vector<SubstrRange>* out, RelayerError* err) {
  return run(to_addr(), header, out, err);
}

bool extract_subject_all_idxes(const std::string& header,
                               std::vector<SubstrRange>* out,
                               RelayerError* err) {
  return run(subject_all(), header, out, err);
}

bool extract_body_hash_idxes(const std::string& header,
                             std::vector<SubstrRange>* out,
                             RelayerError* err) {
  return run(body_hash(), header, out, err);
}

bool extract_timestamp_idxes(const std::string& header,
                             std::vector<SubstrRange>* out,
                             RelayerError* err) {
  return run(timestamp(), header, out, err);
}

bool extract_message_id_idxes(const std::string& header,
                              std::vector<SubstrRange>* out,
                              RelayerError* err) {
  return run(message_id(), header, out, err);
}

bool extract_invitation_code_idxes(const std::string& text,
                                   std::vector<SubstrRange>* out,
                                   RelayerError* err) {
  return run(invitation_code(), text, out, err);
}

bool extract_invitation_code_with_prefix_idxes(const std::string& text,
                                               std::vector<SubstrRange>* out,
                                               RelayerError* err) {
  return run(invitation_code_with_prefix(), text, out, err);
}

bool extract_command_idxes(const std::string& body,
                           std::vector<SubstrRange>* out, RelayerError* err) {
  return run(command(), body, out, err);
}

bool extract_first_substr(const std::string& text,
                          const DecomposedRegexConfig& config,
                          std::string* out, RelayerError* err) {
  std::vector<SubstrRange> ranges;
  if (!extract_substr_idxes(text, config, false, &ranges, err)) {
    return false;
  }
  if (ranges.empty()) {
    return set_error(err, RELAYER_NO_MATCH,
                     "Regex error: " + config.name + " has no public part");
  }
  *out = text.substr(ranges[0].first, ranges[0].second - ranges[0].first);
  return true;
}

}  // namespace relayer
