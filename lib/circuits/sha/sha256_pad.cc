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
#include <string>
#include <vector>

#include "regex/decomposed_regex.h"
#include "util/crypto.h"
#include "util/status.h"

namespace relayer {

bool sha256_pad(const uint8_t data[/*n*/], size_t n, size_t max_bytes,
                Sha256Padded* out, RelayerError* err) {
  // 0x80 plus the 8-byte length, rounded up to whole blocks.
  size_t padded_length =
      ((n + 9 + kSHA256BlockSize - 1) / kSHA256BlockSize) * kSHA256BlockSize;
  if (padded_length > max_bytes) {
    return set_error(err, RELAYER_INPUT_EXCEEDS_MAX_LENGTH,
                     "Length error: padded message of " +
                         std::to_string(padded_length) +
                         " bytes is longer than max (" +
                         std::to_string(max_bytes) + ")");
  }

  out->bit_length = static_cast<uint64_t>(n) * 8;
  out->padded_length = padded_length;
  out->padded.assign(max_bytes, 0);
  for (size_t i = 0; i < n; ++i) {
    out->padded[i] = data[i];
  }
  out->padded[n] = 0x80;
  uint64_t bits = out->bit_length;
  for (size_t i = 0; i < 8; ++i) {
    out->padded[padded_length - 1 - i] = static_cast<uint8_t>(bits & 0xff);
    bits >>= 8;
  }
  return true;
}

bool generate_partial_sha(const std::vector<uint8_t>& body,
                          size_t body_length, const std::string& selector,
                          size_t max_remaining, PartialSha* out,
                          RelayerError* err) {
  if (body_length > body.size()) {
    return set_error(err, RELAYER_INVALID_INPUT_LENGTH,
                     "Length error: body length " +
                         std::to_string(body_length) + " exceeds buffer of " +
                         std::to_string(body.size()) + " bytes");
  }

  size_t selector_index = 0;
  if (!selector.empty()) {
    // Search only the message itself, which ends at its last CRLF.
    size_t text_len = body.size();
    while (text_len >= 2 &&
           !(body[text_len - 2] == '\r' && body[text_len - 1] == '\n')) {
      --text_len;
    }
    if (text_len < 2) {
      text_len = body.size();
    }
    RelayerError find_err;
    if (!find_regex(selector, body.data(), text_len, &selector_index,
                    &find_err)) {
      if (find_err.code != RELAYER_NO_MATCH) {
        if (err != nullptr) *err = find_err;
        return false;
      }
      return set_error(err, RELAYER_NO_MATCH,
                       "Regex error: Selector " + selector +
                           " not found in the body");
    }
  }

  size_t cutoff = (selector_index / kSHA256BlockSize) * kSHA256BlockSize;
  size_t remaining_length = body_length - cutoff;
  if (remaining_length > max_remaining) {
    return set_error(err, RELAYER_MAX_LENGTH_EXCEEDED,
                     "Length error: Remaining body " +
                         std::to_string(remaining_length) +
                         " after the selector is longer than max (" +
                         std::to_string(max_remaining) + ")");
  }
  if ((body.size() - cutoff) % kSHA256BlockSize != 0) {
    return set_error(err, RELAYER_INVALID_INPUT_LENGTH,
                     "Length error: Remaining body was not padded to whole "
                     "blocks");
  }

  SHA256 sha;
  sha.Update(body.data(), cutoff);
  sha.Midstate(out->precomputed_sha);

  // Bytes past body_length are padding zeros, so truncating them is safe.
  out->remaining_body.assign(max_remaining, 0);
  for (size_t i = cutoff; i < body.size() && i - cutoff < max_remaining;
       ++i) {
    out->remaining_body[i - cutoff] = body[i];
  }
  out->remaining_length = remaining_length;
  out->cutoff = cutoff;
  return true;
}

}  // namespace relayer
