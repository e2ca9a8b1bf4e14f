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
#include <vector>

#include "regex/decomposed_regex.h"
#include "util/status.h"
#include "gtest/gtest.h"

namespace relayer {
namespace {

const char kHeader[] =
    "from:Alice <alice@example.com>\r\n"
    "to:bob@example.org\r\n"
    "subject:Send 1 ETH to bob@example.org\r\n"
    "message-id:<abc.123@mail.example.com>\r\n"
    "dkim-signature:v=1; a=rsa-sha256; d=example.com; s=sel; t=1694989812; "
    "bh=2jUSOH9NhtVGCQWNr9BrIAPreKQjO6Sn7XIkfJVOzv8=; b=";

std::string first(bool (*fn)(const std::string&, std::vector<SubstrRange>*,
                             RelayerError*),
                  const std::string& text) {
  std::vector<SubstrRange> r;
  RelayerError err;
  EXPECT_TRUE(fn(text, &r, &err)) << err.message;
  if (r.empty()) return "";
  return text.substr(r[0].first, r[0].second - r[0].first);
}

TEST(BuiltinRegexes, HeaderFields) {
  std::string h = kHeader;
  EXPECT_EQ(first(extract_from_addr_idxes, h), "alice@example.com");
  EXPECT_EQ(first(extract_to_addr_idxes, h), "bob@example.org");
  EXPECT_EQ(first(extract_subject_all_idxes, h),
            "Send 1 ETH to bob@example.org");
  EXPECT_EQ(first(extract_message_id_idxes, h),
            "<abc.123@mail.example.com>");
  EXPECT_EQ(first(extract_timestamp_idxes, h), "1694989812");
  EXPECT_EQ(first(extract_body_hash_idxes, h),
            "2jUSOH9NhtVGCQWNr9BrIAPreKQjO6Sn7XIkfJVOzv8=");
}

TEST(BuiltinRegexes, FromWithoutDisplayName) {
  std::string h = "subject:hi\r\nfrom:carol@example.net\r\n";
  std::vector<SubstrRange> r;
  ASSERT_TRUE(extract_from_addr_idxes(h, &r, nullptr));
  ASSERT_EQ(r.size(), 1u);
  EXPECT_EQ(r[0], SubstrRange(17, 34));
}

TEST(BuiltinRegexes, Addresses) {
  std::string text = "contact alice@example.com now";
  EXPECT_EQ(first(extract_email_addr_idxes, text), "alice@example.com");
  EXPECT_EQ(first(extract_email_domain_idxes, text), "example.com");

  std::vector<SubstrRange> r;
  ASSERT_TRUE(extract_email_domain_idxes(text, &r, nullptr));
  EXPECT_EQ(r[0], SubstrRange(14, 25));
}

TEST(BuiltinRegexes, InvitationCode) {
  std::string body = "Your Code 0x1a2B3c is ready";
  EXPECT_EQ(first(extract_invitation_code_idxes, body), "1a2B3c");
  EXPECT_EQ(first(extract_invitation_code_with_prefix_idxes, body),
            "0x1a2B3c");
}

TEST(BuiltinRegexes, Command) {
  std::string body =
      "<html><div id=3D\"zkemail\">Send 0.1 ETH to bob</div></html>";
  EXPECT_EQ(first(extract_command_idxes, body), "Send 0.1 ETH to bob");

  std::string out;
  ASSERT_TRUE(extract_first_substr(body, command_regex(), &out, nullptr));
  EXPECT_EQ(out, "Send 0.1 ETH to bob");
}

TEST(BuiltinRegexes, Missing) {
  std::vector<SubstrRange> r;
  RelayerError err;
  EXPECT_FALSE(extract_timestamp_idxes("from:a@b.c\r\n", &r, &err));
  EXPECT_EQ(err.code, RELAYER_NO_MATCH);
  EXPECT_FALSE(extract_command_idxes("plain text body", &r, &err));
  EXPECT_EQ(err.code, RELAYER_NO_MATCH);
}

TEST(BuiltinRegexes, Locations) {
  EXPECT_EQ(from_addr_regex().location, REGEX_LOCATION_HEADER);
  EXPECT_EQ(subject_all_regex().location, REGEX_LOCATION_HEADER);
  EXPECT_EQ(invitation_code_regex().location, REGEX_LOCATION_BODY);
  EXPECT_EQ(command_regex().location, REGEX_LOCATION_BODY);
}

}  // namespace
}  // namespace relayer
