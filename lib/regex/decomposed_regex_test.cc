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
#include <string>
#include <vector>

#include "benchmark/benchmark.h"
#include "util/status.h"
#include "gtest/gtest.h"

namespace relayer {
namespace {

DecomposedRegexConfig make_config(
    const std::vector<std::pair<std::string, bool>>& parts) {
  DecomposedRegexConfig c;
  c.name = "test";
  for (const auto& p : parts) {
    DecomposedRegexPart part;
    part.pattern = p.first;
    part.is_public = p.second;
    c.parts.push_back(part);
  }
  return c;
}

std::vector<SubstrRange> extract(const std::string& text,
                                 const DecomposedRegexConfig& c,
                                 bool reveal_private = false) {
  std::vector<SubstrRange> r;
  EXPECT_TRUE(extract_substr_idxes(text, c, reveal_private, &r, nullptr));
  return r;
}

TEST(DecomposedRegex, AdjacentPublicFragments) {
  auto c = make_config({{"Hi", true}, {"!", true}});
  std::string body = "Hello there. Hi! bye";
  auto r = extract(body, c);
  ASSERT_EQ(r.size(), 2u);
  EXPECT_EQ(r[0], SubstrRange(13, 15));
  EXPECT_EQ(r[1], SubstrRange(15, 16));
  EXPECT_EQ(body.substr(r[0].first, r[0].second - r[0].first), "Hi");
}

TEST(DecomposedRegex, FromAddress) {
  auto c = make_config({{"(\r\n|^)from:", false},
                        {"([^\r\n]+<)?", false},
                        {"[a-zA-Z0-9!#$%&\\*\\+-/=\\?^_`{\\|}~\\.]+@[a-zA-Z0-9_"
                         "\\.-]+",
                         true},
                        {">?\r\n", false}});
  std::string header =
      "from:Alice <alice@example.com>\r\nto:bob@example.org\r\n";
  auto r = extract(header, c);
  ASSERT_EQ(r.size(), 1u);
  EXPECT_EQ(r[0], SubstrRange(12, 29));

  auto all = extract(header, c, true);
  ASSERT_EQ(all.size(), 4u);
  EXPECT_EQ(all[0], SubstrRange(0, 5));
  EXPECT_EQ(all[1], SubstrRange(5, 12));
  EXPECT_EQ(all[2], SubstrRange(12, 29));
  EXPECT_EQ(all[3], SubstrRange(29, 32));
}

TEST(DecomposedRegex, LeftmostThenLongest) {
  EXPECT_EQ(extract("abcde", make_config({{"ab|abcd", true}}))[0],
            SubstrRange(0, 4));
  EXPECT_EQ(extract("abbbcbbbbbb", make_config({{"b+", true}}))[0],
            SubstrRange(1, 4));
  // A later, longer candidate never beats an earlier start.
  EXPECT_EQ(extract("xcabcd", make_config({{"abcd|c", true}}))[0],
            SubstrRange(1, 2));
  EXPECT_EQ(extract("abcd", make_config({{"abcd|c", true}}))[0],
            SubstrRange(0, 4));
}

TEST(DecomposedRegex, EarlierFragmentsAreGreedy) {
  auto r = extract("xaaay", make_config({{"a+", true}, {"a*", true}}));
  ASSERT_EQ(r.size(), 2u);
  EXPECT_EQ(r[0], SubstrRange(1, 4));
  EXPECT_EQ(r[1], SubstrRange(4, 4));

  r = extract("key=a=b=c;",
              make_config({{"[a-z]+=[a-z=]*", true}, {"=[a-z]", true}}));
  ASSERT_EQ(r.size(), 2u);
  EXPECT_EQ(r[0], SubstrRange(0, 7));
  EXPECT_EQ(r[1], SubstrRange(7, 9));
}

TEST(DecomposedRegex, EmptyFragmentStillReported) {
  auto r = extract("xz", make_config({{"x", false}, {"y?", true}, {"z", false}}));
  ASSERT_EQ(r.size(), 1u);
  EXPECT_EQ(r[0], SubstrRange(1, 1));
}

TEST(DecomposedRegex, Anchors) {
  std::vector<SubstrRange> r;
  RelayerError err;
  EXPECT_FALSE(extract_substr_idxes("xabc", make_config({{"^abc", true}}),
                                    false, &r, &err));
  EXPECT_EQ(err.code, RELAYER_NO_MATCH);
  EXPECT_EQ(extract("abc", make_config({{"c$", true}}))[0], SubstrRange(2, 3));
  EXPECT_EQ(extract("abcabc", make_config({{"abc$", true}}))[0],
            SubstrRange(3, 6));
}

TEST(DecomposedRegex, CountedRepetition) {
  EXPECT_EQ(extract("call 555-1234 now",
                    make_config({{"\\d{3}-\\d{4}", true}}))[0],
            SubstrRange(5, 13));
}

TEST(DecomposedRegex, Deterministic) {
  auto c = make_config({{"[Cc]ode ", false}, {"0x[0-9a-f]+", true}});
  std::string text = "Your code 0x12ab34 is here; Code 0xffff";
  auto a = extract(text, c);
  auto b = extract(text, c);
  EXPECT_EQ(a, b);
  ASSERT_EQ(a.size(), 1u);
  EXPECT_EQ(a[0], SubstrRange(10, 18));
}

TEST(DecomposedRegex, Errors) {
  std::vector<SubstrRange> r;
  RelayerError err;
  EXPECT_FALSE(extract_substr_idxes(
      "abc", make_config({{"(?=a)", true}}), false, &r, &err));
  EXPECT_EQ(err.code, RELAYER_UNSUPPORTED_CONSTRUCT);
  EXPECT_EQ(error_category(err.code), CATEGORY_REGEX_FAILURE);

  EXPECT_FALSE(extract_substr_idxes("abc", make_config({{"z", true}}), false,
                                    &r, &err));
  EXPECT_EQ(err.code, RELAYER_NO_MATCH);

  DecomposedRegexConfig empty;
  EXPECT_FALSE(extract_substr_idxes("abc", empty, false, &r, &err));
  EXPECT_EQ(err.code, RELAYER_INVALID_REGEX);
}

TEST(DecomposedRegex, NoCatastrophicBacktracking) {
  std::string text(20000, 'a');
  std::vector<SubstrRange> r;
  EXPECT_FALSE(extract_substr_idxes(text, make_config({{"(a|aa)*b", true}}),
                                    false, &r, nullptr));
}

TEST(DecomposedRegex, FindRegex) {
  std::string body = "hello\r\n<div id=3D\"zkemail\">cmd</div>\r\n";
  size_t start;
  ASSERT_TRUE(find_regex("<div", reinterpret_cast<const uint8_t*>(body.data()),
                         body.size(), &start, nullptr));
  EXPECT_EQ(start, 7u);
}

TEST(RegexLocation, Parse) {
  RegexLocation loc;
  EXPECT_TRUE(parse_regex_location("header", &loc));
  EXPECT_EQ(loc, REGEX_LOCATION_HEADER);
  EXPECT_TRUE(parse_regex_location("body", &loc));
  EXPECT_EQ(loc, REGEX_LOCATION_BODY);
  EXPECT_FALSE(parse_regex_location("footer", &loc));
}

void BM_ExtractFromAddress(benchmark::State& state) {
  auto c = make_config({{"(\r\n|^)from:", false},
                        {"([^\r\n]+<)?", false},
                        {"[a-zA-Z0-9._%+-]+@[a-zA-Z0-9_\\.-]+", true},
                        {">?\r\n", false}});
  std::string header(state.range(0), 'x');
  header += "\r\nfrom:Alice <alice@example.com>\r\n";
  DecomposedRegex re;
  re.Compile(c.parts, nullptr);
  std::vector<SubstrRange> r;
  for (auto _ : state) {
    re.Extract(header, false, &r, nullptr);
    benchmark::DoNotOptimize(r);
  }
}
BENCHMARK(BM_ExtractFromAddress)->Arg(256)->Arg(1024)->Arg(4096);

}  // namespace
}  // namespace relayer
