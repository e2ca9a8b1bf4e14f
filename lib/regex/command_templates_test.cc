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

#include <string>
#include <vector>

#include "algebra/fp_bn254.h"
#include "util/status.h"
#include "gtest/gtest.h"

namespace relayer {
namespace {

const char kAddr[] = "0x9401296121FC9B78F84fc856B1F8dC88f4415B2e";

Nat254 nat(const char* s) { return Nat254::of_string(s); }

TEST(CommandTemplates, SendCommand) {
  std::string cmd = "Re: Send 1.5 ETH to " + std::string(kAddr) + "</div>";
  std::vector<TemplateValue> vals;
  RelayerError err;
  ASSERT_TRUE(extract_template_vals_from_command(
      cmd, {"Send", "{decimals}", "{string}", "to", "{ethAddr}"}, &vals, &err))
      << err.message;
  ASSERT_EQ(vals.size(), 3u);
  EXPECT_EQ(vals[0].kind, TEMPLATE_DECIMALS);
  EXPECT_EQ(vals[0].text, "1.5");
  EXPECT_EQ(vals[1].kind, TEMPLATE_STRING);
  EXPECT_EQ(vals[1].text, "ETH");
  EXPECT_EQ(vals[2].kind, TEMPLATE_ETH_ADDR);
  EXPECT_EQ(vals[2].text, kAddr);
  EXPECT_EQ(vals[2].value.to_decimal(),
            "844956539483415709737760098896425774370514885422");

  Nat254 amount;
  ASSERT_TRUE(decimals_str_to_uint(vals[0].text, 18, &amount, &err));
  EXPECT_EQ(amount.to_decimal(), "1500000000000000000");
}

TEST(CommandTemplates, UintAndInt) {
  std::vector<TemplateValue> vals;
  RelayerError err;
  ASSERT_TRUE(extract_template_vals_from_command(
      "Transfer 42 then -7 now", {"Transfer", "{uint}", "then", "{int}"},
      &vals, &err))
      << err.message;
  ASSERT_EQ(vals.size(), 2u);
  EXPECT_EQ(vals[0].kind, TEMPLATE_UINT);
  EXPECT_EQ(vals[0].value, Nat254(42));
  EXPECT_EQ(vals[1].kind, TEMPLATE_INT);
  EXPECT_EQ(vals[1].text, "-7");
  EXPECT_EQ(vals[1].value, Nat254(7));
  EXPECT_TRUE(vals[1].negative);
}

TEST(CommandTemplates, LeftmostOccurrence) {
  std::vector<TemplateValue> vals;
  ASSERT_TRUE(extract_template_vals_from_command(
      "Send 2 ETH. Send 3 ETH.", {"Send", "{uint}", "ETH."}, &vals, nullptr));
  ASSERT_EQ(vals.size(), 1u);
  EXPECT_EQ(vals[0].value, Nat254(2));
}

TEST(CommandTemplates, FixedWordsAreLiteral) {
  std::vector<TemplateValue> vals;
  RelayerError err;
  EXPECT_FALSE(extract_template_vals_from_command(
      "Send 3 ETHx", {"Send", "{uint}", "ETH."}, &vals, &err));
  EXPECT_EQ(err.code, RELAYER_NO_MATCH);
}

TEST(CommandTemplates, Mismatch) {
  std::vector<TemplateValue> vals;
  RelayerError err;
  EXPECT_FALSE(extract_template_vals_from_command(
      "Send one ETH to bob", {"Send", "{uint}", "ETH"}, &vals, &err));
  EXPECT_EQ(err.code, RELAYER_NO_MATCH);
  EXPECT_EQ(err.message, "Regex error: Unable to match templates with input");

  EXPECT_FALSE(extract_template_vals("Send 5", {"Send", "{uint}", "ETH"},
                                     &vals, &err));
  EXPECT_EQ(err.code, RELAYER_NO_MATCH);

  EXPECT_FALSE(extract_template_vals("Send 5x ETH", {"Send", "{uint}", "ETH"},
                                     &vals, &err));
  EXPECT_EQ(err.code, RELAYER_NO_MATCH);

  EXPECT_FALSE(extract_template_vals_from_command("anything", {}, &vals, &err));
  EXPECT_EQ(err.code, RELAYER_EMPTY_INPUT);
}

TEST(CommandTemplates, InvalidEthAddr) {
  std::vector<TemplateValue> vals;
  RelayerError err;
  // 39 hex digits.
  std::string short_addr = std::string(kAddr).substr(0, 41);
  EXPECT_FALSE(extract_template_vals_from_command(
      "Send to " + short_addr, {"Send", "to", "{ethAddr}"}, &vals, &err));
  EXPECT_EQ(err.code, RELAYER_NO_MATCH);

  EXPECT_FALSE(extract_template_vals("to 0x94012961zz", {"to", "{ethAddr}"},
                                     &vals, &err));
  EXPECT_EQ(err.code, RELAYER_NO_MATCH);

  std::string bad = kAddr;
  bad[10] = 'g';
  EXPECT_FALSE(extract_template_vals("to " + bad, {"to", "{ethAddr}"}, &vals,
                                     &err));
  EXPECT_EQ(err.code, RELAYER_NO_MATCH);
}

TEST(CommandTemplates, StringStopsAtDivTag) {
  std::vector<TemplateValue> vals;
  ASSERT_TRUE(extract_template_vals("Hello world</div><div>",
                                    {"Hello", "{string}"}, &vals, nullptr));
  ASSERT_EQ(vals.size(), 1u);
  EXPECT_EQ(vals[0].text, "world");
}

TEST(CommandTemplates, IntRange) {
  const std::string min =
      "57896044618658097711785492504343953926634992332820282019728792003956564"
      "819968";
  std::vector<TemplateValue> vals;
  RelayerError err;
  ASSERT_TRUE(extract_template_vals("-" + min, {"{int}"}, &vals, &err));
  EXPECT_TRUE(vals[0].negative);
  EXPECT_EQ(vals[0].value.to_decimal(), min);

  EXPECT_FALSE(extract_template_vals(min, {"{int}"}, &vals, &err));
  EXPECT_EQ(err.code, RELAYER_INVALID_INPUT_LENGTH);

  ASSERT_TRUE(extract_template_vals("-0", {"{int}"}, &vals, &err));
  EXPECT_FALSE(vals[0].negative);

  EXPECT_FALSE(extract_template_vals(
      "1157920892373161954235709850086879078532699846656405640394575840079131"
      "29639936",
      {"{uint}"}, &vals, &err));
  EXPECT_EQ(err.code, RELAYER_INVALID_INPUT_LENGTH);
}

TEST(CommandTemplates, DecimalsToUint) {
  Nat254 x;
  RelayerError err;
  ASSERT_TRUE(decimals_str_to_uint("0.000000000000000001", 18, &x, &err));
  EXPECT_EQ(x, Nat254(1));
  ASSERT_TRUE(decimals_str_to_uint("12", 18, &x, &err));
  EXPECT_EQ(x, nat("12000000000000000000"));
  ASSERT_TRUE(decimals_str_to_uint("3.25", 6, &x, &err));
  EXPECT_EQ(x, Nat254(3250000));

  EXPECT_FALSE(decimals_str_to_uint("0.0000000000000000001", 18, &x, &err));
  EXPECT_EQ(err.code, RELAYER_INVALID_INPUT_LENGTH);
  EXPECT_FALSE(decimals_str_to_uint("1.2.3", 18, &x, &err));
  EXPECT_FALSE(decimals_str_to_uint("", 0, &x, &err));
}

TEST(CommandTemplates, UintToDecimalString) {
  EXPECT_EQ(uint_to_decimal_string(Nat254(1500000000000000000ull), 18), "1.5");
  EXPECT_EQ(uint_to_decimal_string(Nat254(1000000000000000000ull), 18), "1");
  EXPECT_EQ(uint_to_decimal_string(Nat254(1), 18), "0.000000000000000001");
  EXPECT_EQ(uint_to_decimal_string(Nat254(0), 18), "0");
  EXPECT_EQ(uint_to_decimal_string(Nat254(1234), 2), "12.34");
  EXPECT_EQ(uint_to_decimal_string(Nat254(1200), 2), "12");
  EXPECT_EQ(uint_to_decimal_string(Nat254(50), 3), "0.05");
  EXPECT_EQ(uint_to_decimal_string(Nat254(7), 0), "7");
  EXPECT_EQ(uint_to_decimal_string(nat("12000000000000000000"), 18), "12");
}

}  // namespace
}  // namespace relayer
