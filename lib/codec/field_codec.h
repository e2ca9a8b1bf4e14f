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

#ifndef RELAYER_LIB_CODEC_FIELD_CODEC_H_
#define RELAYER_LIB_CODEC_FIELD_CODEC_H_

// Conversions between byte strings and BN254 scalar field elements, in the
// layouts the email circuits expect.  Every field-size constant used by the
// hashing and circuit-input code lives here.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "algebra/fp_bn254.h"
#include "util/status.h"

namespace relayer {

// Bytes per packed field element; 31 * 8 = 248 < 254 bits.
constexpr size_t kFieldChunkBytes = 31;
// Largest number of bits that always packs without reduction.
constexpr size_t kFieldCapacityBits = 253;

// Splits bytes into 31-byte little-endian chunks, one element per chunk.
// The last chunk may be short.
std::vector<Fp254Elt> bytes_to_fields(const std::vector<uint8_t>& bytes);

// Zero-pads bytes to num_chunks * chunk_bits / 8, reads the result as a
// little-endian bit string, cuts it into chunk_bits-bit words and packs
// `pack` consecutive words per element, the first one least significant.
//
// Fails with RELAYER_INVALID_INPUT_LENGTH when bytes is longer than the
// padded size or chunk_bits * pack exceeds kFieldCapacityBits.
bool bytes_chunk_fields(const std::vector<uint8_t>& bytes, size_t chunk_bits,
                        size_t pack, size_t num_chunks,
                        std::vector<Fp254Elt>* out, RelayerError* err);

// "0x" followed by 64 lowercase hex digits, big-endian.
std::string field_to_hex(const Fp254Elt& x);

std::string field_to_decimal(const Fp254Elt& x);

// Accepts a big-endian hex string of at most 32 bytes, with or without
// "0x".  Fails with RELAYER_INVALID_HEX on bad digits or a value outside
// the field.
bool hex_to_field(const std::string& hex, Fp254Elt* out, RelayerError* err);

// Unsigned 256-bit integers, e.g. Ethereum addresses and amounts.  The
// hex form needs the "0x" prefix and at most 32 bytes; shorter values are
// left-padded.  Fails with RELAYER_INVALID_HEX otherwise.
bool hex_to_u256(const std::string& hex, Nat254* out, RelayerError* err);

// "0x" followed by 64 lowercase hex digits.
std::string u256_to_hex(const Nat254& x);

// Interprets up to 32 little-endian bytes as a field element.  Returns
// false when the value is not reduced.
bool field_of_bytes_le(const std::vector<uint8_t>& le, Fp254Elt* out);

// Splits the big-endian integer be into k limbs of n <= 128 bits, least
// significant first, as decimal strings.  Fails with
// RELAYER_INVALID_INPUT_LENGTH when the integer needs more than n * k bits.
bool to_circom_bigint_limbs(const std::vector<uint8_t>& be, size_t n, size_t k,
                            std::vector<std::string>* out, RelayerError* err);

// Copies str into a zero-filled buffer of exactly len bytes.  Fails with
// RELAYER_MAX_LENGTH_EXCEEDED when str is longer.
bool pad_string(const std::string& str, size_t len, std::vector<uint8_t>* out,
                RelayerError* err);

// Number of 31-byte signals for a value of at most max_len bytes.
size_t compute_signal_length(size_t max_len);

// Encodes value as its 31-byte little-endian chunks, each a decimal
// string, then appends "0" up to compute_signal_length(max_len).  Fails
// with RELAYER_MAX_LENGTH_EXCEEDED when value is longer than max_len.
bool string_to_signals(const std::string& value, size_t max_len,
                       std::vector<std::string>* out, RelayerError* err);

}  // namespace relayer

#endif  // RELAYER_LIB_CODEC_FIELD_CODEC_H_
