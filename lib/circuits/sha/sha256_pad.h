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

#ifndef RELAYER_LIB_CIRCUITS_SHA_SHA256_PAD_H_
#define RELAYER_LIB_CIRCUITS_SHA_SHA256_PAD_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "util/crypto.h"
#include "util/status.h"

namespace relayer {

struct Sha256Padded {
  // Message, 0x80, zeros, 64-bit big-endian bit length, then zeros up to
  // the requested maximum.
  std::vector<uint8_t> padded;
  uint64_t bit_length = 0;    // of the original message
  size_t padded_length = 0;   // bytes up to the end of the length field
};

// FIPS 180-4 padding, zero-extended to max_bytes.  Fails with
// RELAYER_INPUT_EXCEEDS_MAX_LENGTH when the padded message alone is longer
// than max_bytes.
bool sha256_pad(const uint8_t data[/*n*/], size_t n, size_t max_bytes,
                Sha256Padded* out, RelayerError* err);

inline bool sha256_pad(const std::string& data, size_t max_bytes,
                       Sha256Padded* out, RelayerError* err) {
  return sha256_pad(reinterpret_cast<const uint8_t*>(data.data()),
                    data.size(), max_bytes, out, err);
}

// Split of a padded body at a block boundary before a selector.  The
// circuit resumes hashing from precomputed_sha over remaining_body.
struct PartialSha {
  uint8_t precomputed_sha[kSHA256DigestSize];
  std::vector<uint8_t> remaining_body;  // exactly max_remaining bytes
  size_t remaining_length = 0;          // padded bytes after the cutoff
  size_t cutoff = 0;
};

// body is SHA-padded and body_length is its padded length.  An empty
// selector cuts at 0.  Otherwise the cut is the start of the 64-byte block
// holding the leftmost selector match.
bool generate_partial_sha(const std::vector<uint8_t>& body,
                          size_t body_length, const std::string& selector,
                          size_t max_remaining, PartialSha* out,
                          RelayerError* err);

}  // namespace relayer

#endif  // RELAYER_LIB_CIRCUITS_SHA_SHA256_PAD_H_
