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

#ifndef RELAYER_LIB_UTIL_CRYPTO_H_
#define RELAYER_LIB_UTIL_CRYPTO_H_

// Encapsulates the cryptographic primitives used by this library: SHA256
// for DKIM hashes and circuit precomputation, RSA-SHA256 verification for
// DKIM signatures, and a system random source.  All of them come from the
// openssl library.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "openssl/evp.h"
#include "openssl/sha.h"

namespace relayer {

constexpr size_t kSHA256DigestSize = 32;
constexpr size_t kSHA256BlockSize = 64;

class SHA256 {
 public:
  SHA256() { SHA256_Init(&sha_); }

  // Disable copy for good measure.
  SHA256(const SHA256&) = delete;
  SHA256& operator=(const SHA256&) = delete;

  void Update(const uint8_t bytes[/*n*/], size_t n) {
    SHA256_Update(&sha_, bytes, n);
  }
  void Update(const std::string& s) {
    Update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
  }
  void DigestData(uint8_t digest[/* kSHA256DigestSize */]) {
    SHA256_Final(digest, &sha_);
  }
  void CopyState(const SHA256& src) { sha_ = src.sha_; }

  // Writes the eight chaining words H0..H7, each big-endian, as they stand
  // after the blocks absorbed so far.  Only meaningful when the number of
  // bytes absorbed is a multiple of kSHA256BlockSize.
  void Midstate(uint8_t out[/* kSHA256DigestSize */]) const;

  // Number of bytes absorbed so far.
  uint64_t Length() const {
    return ((static_cast<uint64_t>(sha_.Nh) << 32) | sha_.Nl) / 8;
  }

 private:
  SHA256_CTX sha_;
};

void sha256(const uint8_t in[/*n*/], size_t n,
            uint8_t digest[/* kSHA256DigestSize */]);

// An RSA public key held as an openssl EVP_PKEY.
class RsaPublicKey {
 public:
  RsaPublicKey() : pkey_(nullptr) {}
  ~RsaPublicKey();

  RsaPublicKey(const RsaPublicKey&) = delete;
  RsaPublicKey& operator=(const RsaPublicKey&) = delete;
  RsaPublicKey(RsaPublicKey&& other) noexcept : pkey_(other.pkey_) {
    other.pkey_ = nullptr;
  }
  RsaPublicKey& operator=(RsaPublicKey&& other) noexcept;

  // Accepts a DER SubjectPublicKeyInfo, falling back to a bare PKCS#1
  // RSAPublicKey.  Returns false if neither parses to an RSA key.
  bool ParseDer(const std::vector<uint8_t>& der);

  // Builds a key from a big-endian modulus and public exponent.
  bool FromModulus(const std::vector<uint8_t>& n_be, uint64_t e = 65537);

  bool Verify(const uint8_t msg[/*msg_len*/], size_t msg_len,
              const uint8_t sig[/*sig_len*/], size_t sig_len) const;

  // Big-endian modulus without leading zeros; empty if no key is loaded.
  std::vector<uint8_t> ModulusBE() const;

  bool loaded() const { return pkey_ != nullptr; }

 private:
  EVP_PKEY* pkey_;
};

// Generate n random bytes, following the openssl API convention.
// Returns false if the openssl random source fails.
bool rand_bytes(uint8_t out[/*n*/], size_t n);

void hex_to_str(char out[/* 2*n + 1*/], const uint8_t in[/*n*/], size_t n);

std::string hex_encode(const std::vector<uint8_t>& in);

// Decodes an even-length hex string, with or without a leading "0x".
bool hex_decode(const std::string& hex, std::vector<uint8_t>& out);

// Standard (not url-safe) base64 with padding.  Whitespace, as it appears
// in folded header values, is skipped.
bool base64_decode(const std::string& b64, std::vector<uint8_t>& out);

}  // namespace relayer

#endif  // RELAYER_LIB_UTIL_CRYPTO_H_
