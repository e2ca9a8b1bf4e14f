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

#include "codec/field_codec.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "algebra/fp_bn254.h"
#include "algebra/nat.h"
#include "util/ceildiv.h"
#include "util/crypto.h"
#include "util/status.h"

namespace relayer {

namespace {

bool bit_of(const std::vector<uint8_t>& le, size_t i) {
  return (le[i / 8] >> (i % 8)) & 1;
}

}  // namespace

std::vector<Fp254Elt> bytes_to_fields(const std::vector<uint8_t>& bytes) {
  const Fp254& F = bn254_scalar_field();
  std::vector<Fp254Elt> out;
  for (size_t i = 0; i < bytes.size(); i += kFieldChunkBytes) {
    uint8_t buf[Nat254::kBytes] = {};
    size_t n = std::min(kFieldChunkBytes, bytes.size() - i);
    std::copy(bytes.begin() + i, bytes.begin() + i + n, buf);
    out.push_back(F.to_montgomery(Nat254::of_bytes(buf)));
  }
  return out;
}

bool bytes_chunk_fields(const std::vector<uint8_t>& bytes, size_t chunk_bits,
                        size_t pack, size_t num_chunks,
                        std::vector<Fp254Elt>* out, RelayerError* err) {
  if (chunk_bits == 0 || pack == 0 || chunk_bits * pack > kFieldCapacityBits) {
    return set_error(err, RELAYER_INVALID_INPUT_LENGTH,
                     "Encoding error: " + std::to_string(pack) + " words of " +
                         std::to_string(chunk_bits) +
                         " bits do not fit in a field element");
  }
  const size_t max_bytes = num_chunks * chunk_bits / 8;
  if (bytes.size() > max_bytes) {
    return set_error(err, RELAYER_INVALID_INPUT_LENGTH,
                     "Encoding error: " + std::to_string(bytes.size()) +
                         " bytes exceed the packing capacity of " +
                         std::to_string(max_bytes));
  }
  std::vector<uint8_t> padded(bytes);
  padded.resize(max_bytes, 0);

  const Fp254& F = bn254_scalar_field();
  const size_t total_bits = 8 * max_bytes;
  const size_t elt_bits = chunk_bits * pack;
  out->clear();
  for (size_t base = 0; base < total_bits; base += elt_bits) {
    Nat254 v;
    size_t end = std::min(total_bits, base + elt_bits);
    for (size_t g = base; g < end; ++g) {
      if (bit_of(padded, g)) {
        v.set_bit(g - base);
      }
    }
    out->push_back(F.to_montgomery(v));
  }
  return true;
}

std::string field_to_hex(const Fp254Elt& x) {
  return u256_to_hex(bn254_scalar_field().from_montgomery(x));
}

std::string u256_to_hex(const Nat254& x) {
  uint8_t le[Nat254::kBytes];
  x.to_bytes(le);
  std::vector<uint8_t> be(le, le + Nat254::kBytes);
  std::reverse(be.begin(), be.end());
  return "0x" + hex_encode(be);
}

bool hex_to_u256(const std::string& hex, Nat254* out, RelayerError* err) {
  std::vector<uint8_t> be;
  if (hex.compare(0, 2, "0x") != 0 || !hex_decode(hex, be) ||
      be.size() > Nat254::kBytes) {
    return set_error(err, RELAYER_INVALID_HEX,
                     "Encoding error: invalid u256 hex string " + hex);
  }
  uint8_t le[Nat254::kBytes] = {};
  std::reverse_copy(be.begin(), be.end(), le);
  *out = Nat254::of_bytes(le);
  return true;
}

std::string field_to_decimal(const Fp254Elt& x) {
  return bn254_scalar_field().from_montgomery(x).to_decimal();
}

bool field_of_bytes_le(const std::vector<uint8_t>& le, Fp254Elt* out) {
  if (le.size() > Nat254::kBytes) {
    return false;
  }
  uint8_t buf[Nat254::kBytes] = {};
  std::copy(le.begin(), le.end(), buf);
  Nat254 v = Nat254::of_bytes(buf);
  const Fp254& F = bn254_scalar_field();
  if (!F.in_field(v)) {
    return false;
  }
  *out = F.to_montgomery(v);
  return true;
}

bool hex_to_field(const std::string& hex, Fp254Elt* out, RelayerError* err) {
  std::vector<uint8_t> be;
  if (!hex_decode(hex, be)) {
    return set_error(err, RELAYER_INVALID_HEX,
                     "Encoding error: invalid hex string " + hex);
  }
  if (be.size() > Nat254::kBytes) {
    return set_error(err, RELAYER_INVALID_HEX,
                     "Encoding error: hex string longer than 32 bytes");
  }
  std::reverse(be.begin(), be.end());
  if (!field_of_bytes_le(be, out)) {
    return set_error(err, RELAYER_INVALID_HEX,
                     "Encoding error: value is not a field element");
  }
  return true;
}

bool to_circom_bigint_limbs(const std::vector<uint8_t>& be, size_t n, size_t k,
                            std::vector<std::string>* out, RelayerError* err) {
  if (n == 0 || n > 128) {
    return set_error(err, RELAYER_INVALID_INPUT_LENGTH,
                     "Encoding error: limb width must be 1..128 bits");
  }
  std::vector<uint8_t> le(be.rbegin(), be.rend());
  const size_t total_bits = 8 * le.size();
  for (size_t g = n * k; g < total_bits; ++g) {
    if (bit_of(le, g)) {
      return set_error(err, RELAYER_INVALID_INPUT_LENGTH,
                       "Encoding error: integer does not fit in " +
                           std::to_string(k) + " limbs of " +
                           std::to_string(n) + " bits");
    }
  }
  out->clear();
  for (size_t i = 0; i < k; ++i) {
    Nat<2> limb;
    for (size_t j = 0; j < n; ++j) {
      size_t g = i * n + j;
      if (g < total_bits && bit_of(le, g)) {
        limb.set_bit(j);
      }
    }
    out->push_back(limb.to_decimal());
  }
  return true;
}

bool pad_string(const std::string& str, size_t len, std::vector<uint8_t>* out,
                RelayerError* err) {
  if (str.size() > len) {
    return set_error(err, RELAYER_MAX_LENGTH_EXCEEDED,
                     "Length error: string of " + std::to_string(str.size()) +
                         " bytes exceeds " + std::to_string(len));
  }
  out->assign(len, 0);
  std::copy(str.begin(), str.end(), out->begin());
  return true;
}

size_t compute_signal_length(size_t max_len) {
  return ceildiv(max_len, kFieldChunkBytes);
}

bool string_to_signals(const std::string& value, size_t max_len,
                       std::vector<std::string>* out, RelayerError* err) {
  if (value.size() > max_len) {
    return set_error(err, RELAYER_MAX_LENGTH_EXCEEDED,
                     "Length error: value of " + std::to_string(value.size()) +
                         " bytes exceeds max length " +
                         std::to_string(max_len));
  }
  std::vector<Fp254Elt> fields =
      bytes_to_fields(std::vector<uint8_t>(value.begin(), value.end()));
  out->clear();
  for (const Fp254Elt& f : fields) {
    out->push_back(field_to_decimal(f));
  }
  out->resize(std::max(out->size(), compute_signal_length(max_len)), "0");
  return true;
}

}  // namespace relayer
