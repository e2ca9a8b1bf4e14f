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

#include "circuits/sha/sha256_pad.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "util/crypto.h"
#include "util/status.h"
#include "gtest/gtest.h"

namespace relayer {
namespace {

TEST(Sha256Pad, Abc) {
  Sha256Padded p;
  ASSERT_TRUE(sha256_pad("abc", 128, &p, nullptr));
  EXPECT_EQ(p.padded.size(), 128u);
  EXPECT_EQ(p.padded_length, 64u);
  EXPECT_EQ(p.bit_length, 24u);
  EXPECT_EQ(p.padded[0], 'a');
  EXPECT_EQ(p.padded[3], 0x80);
  for (size_t i = 4; i < 63; ++i) {
    EXPECT_EQ(p.padded[i], 0) << i;
  }
  EXPECT_EQ(p.padded[63], 24);
  for (size_t i = 64; i < 128; ++i) {
    EXPECT_EQ(p.padded[i], 0) << i;
  }
}

TEST(Sha256Pad, BlockBoundaries) {
  Sha256Padded p;
  ASSERT_TRUE(sha256_pad(std::string(55, 'x'), 64, &p, nullptr));
  EXPECT_EQ(p.padded_length, 64u);
  ASSERT_TRUE(sha256_pad(std::string(56, 'x'), 128, &p, nullptr));
  EXPECT_EQ(p.padded_length, 128u);
  ASSERT_TRUE(sha256_pad(std::string(), 64, &p, nullptr));
  EXPECT_EQ(p.padded_length, 64u);
  EXPECT_EQ(p.padded[0], 0x80);
}

// Dropping the zero fill, the length field and the 0x80 marker gives back
// the message, for every length across the first few block boundaries.
TEST(Sha256Pad, StripsBackToMessage) {
  for (size_t n = 0; n <= 200; ++n) {
    std::string msg(n, 'a');
    for (size_t i = 0; i < n; ++i) {
      msg[i] = static_cast<char>('a' + i % 26);
    }
    const size_t want_len = ((n + 9 + 63) / 64) * 64;

    Sha256Padded p;
    ASSERT_TRUE(sha256_pad(msg, want_len, &p, nullptr)) << n;
    ASSERT_EQ(p.padded.size(), want_len) << n;
    EXPECT_EQ(p.padded_length, want_len) << n;
    EXPECT_EQ(p.padded_length % 64, 0u) << n;
    EXPECT_EQ(p.bit_length, 8 * n) << n;

    uint64_t bits = 0;
    for (size_t i = want_len - 8; i < want_len; ++i) {
      bits = (bits << 8) | p.padded[i];
    }
    EXPECT_EQ(bits, 8 * n) << n;

    size_t end = want_len - 8;
    while (end > 0 && p.padded[end - 1] == 0) --end;
    ASSERT_GT(end, 0u) << n;
    EXPECT_EQ(p.padded[end - 1], 0x80) << n;
    EXPECT_EQ(std::string(p.padded.begin(), p.padded.begin() + (end - 1)), msg)
        << n;

    // One block short of the exact size does not fit.
    if (want_len > 64) {
      EXPECT_FALSE(sha256_pad(msg, want_len - 64, &p, nullptr)) << n;
    }
  }
}

TEST(Sha256Pad, TooLong) {
  Sha256Padded p;
  RelayerError err;
  EXPECT_FALSE(sha256_pad(std::string(56, 'x'), 64, &p, &err));
  EXPECT_EQ(err.code, RELAYER_INPUT_EXCEEDS_MAX_LENGTH);
  EXPECT_EQ(error_category(err.code), CATEGORY_LENGTH_FAILURE);
}

// Compressing the padded blocks from the IV yields the ordinary digest.
TEST(Sha256Pad, CompressesToDigest) {
  std::string msg = "The quick brown fox jumps over the lazy dog, twice over.";
  Sha256Padded p;
  ASSERT_TRUE(sha256_pad(msg, 256, &p, nullptr));
  SHA256 sha;
  sha.Update(p.padded.data(), p.padded_length);
  uint8_t mid[kSHA256DigestSize];
  sha.Midstate(mid);
  uint8_t want[kSHA256DigestSize];
  sha256(reinterpret_cast<const uint8_t*>(msg.data()), msg.size(), want);
  EXPECT_EQ(0, memcmp(mid, want, kSHA256DigestSize));
}

std::string selector_body() {
  return std::string(200, 'a') + "\r\nSELECT here\r\n";
}

TEST(PartialSha, CutsAtSelectorBlock) {
  Sha256Padded p;
  ASSERT_TRUE(sha256_pad(selector_body(), 512, &p, nullptr));
  EXPECT_EQ(p.padded_length, 256u);

  PartialSha ps;
  ASSERT_TRUE(generate_partial_sha(p.padded, p.padded_length, "SELECT", 128,
                                   &ps, nullptr));
  EXPECT_EQ(ps.cutoff, 192u);
  EXPECT_EQ(ps.remaining_length, 64u);
  ASSERT_EQ(ps.remaining_body.size(), 128u);
  for (size_t i = 0; i < 128; ++i) {
    EXPECT_EQ(ps.remaining_body[i], p.padded[192 + i]) << i;
  }

  SHA256 sha;
  sha.Update(p.padded.data(), 192);
  uint8_t mid[kSHA256DigestSize];
  sha.Midstate(mid);
  EXPECT_EQ(0, memcmp(mid, ps.precomputed_sha, kSHA256DigestSize));
}

TEST(PartialSha, NoSelectorKeepsWholeBody) {
  Sha256Padded p;
  ASSERT_TRUE(sha256_pad(selector_body(), 256, &p, nullptr));
  PartialSha ps;
  ASSERT_TRUE(generate_partial_sha(p.padded, p.padded_length, "", 256, &ps,
                                   nullptr));
  EXPECT_EQ(ps.cutoff, 0u);
  EXPECT_EQ(ps.remaining_length, 256u);

  // The midstate of nothing is the SHA-256 IV.
  EXPECT_EQ(ps.precomputed_sha[0], 0x6a);
  EXPECT_EQ(ps.precomputed_sha[1], 0x09);
  EXPECT_EQ(ps.precomputed_sha[2], 0xe6);
  EXPECT_EQ(ps.precomputed_sha[3], 0x67);
}

TEST(PartialSha, Errors) {
  Sha256Padded p;
  ASSERT_TRUE(sha256_pad(selector_body(), 512, &p, nullptr));
  PartialSha ps;
  RelayerError err;

  EXPECT_FALSE(generate_partial_sha(p.padded, p.padded_length, "MISSING",
                                    128, &ps, &err));
  EXPECT_EQ(err.code, RELAYER_NO_MATCH);
  EXPECT_NE(err.message.find("not found in the body"), std::string::npos);

  EXPECT_FALSE(generate_partial_sha(p.padded, p.padded_length, "SELECT", 32,
                                    &ps, &err));
  EXPECT_EQ(err.code, RELAYER_MAX_LENGTH_EXCEEDED);
  EXPECT_NE(err.message.find("longer than max (32)"), std::string::npos);

  EXPECT_FALSE(generate_partial_sha(p.padded, p.padded_length, "(?=x)", 128,
                                    &ps, &err));
  EXPECT_EQ(err.code, RELAYER_UNSUPPORTED_CONSTRUCT);
}

}  // namespace
}  // namespace relayer
