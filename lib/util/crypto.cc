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

#include "util/crypto.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "openssl/bn.h"
#include "openssl/core_names.h"
#include "openssl/evp.h"
#include "openssl/param_build.h"
#include "openssl/rand.h"
#include "openssl/x509.h"
#include "util/log.h"

namespace relayer {

void SHA256::Midstate(uint8_t out[/* kSHA256DigestSize */]) const {
  for (size_t i = 0; i < 8; ++i) {
    uint32_t w = sha_.h[i];
    out[4 * i] = (w >> 24) & 0xff;
    out[4 * i + 1] = (w >> 16) & 0xff;
    out[4 * i + 2] = (w >> 8) & 0xff;
    out[4 * i + 3] = w & 0xff;
  }
}

void sha256(const uint8_t in[/*n*/], size_t n,
            uint8_t digest[/* kSHA256DigestSize */]) {
  SHA256 sha;
  sha.Update(in, n);
  sha.DigestData(digest);
}

RsaPublicKey::~RsaPublicKey() { EVP_PKEY_free(pkey_); }

RsaPublicKey& RsaPublicKey::operator=(RsaPublicKey&& other) noexcept {
  if (this != &other) {
    EVP_PKEY_free(pkey_);
    pkey_ = other.pkey_;
    other.pkey_ = nullptr;
  }
  return *this;
}

bool RsaPublicKey::ParseDer(const std::vector<uint8_t>& der) {
  if (der.empty()) {
    log(ERROR, "empty DER public key");
    return false;
  }
  const unsigned char* p = der.data();
  EVP_PKEY* pkey = d2i_PUBKEY(nullptr, &p, static_cast<long>(der.size()));
  if (pkey == nullptr) {
    p = der.data();
    pkey = d2i_PublicKey(EVP_PKEY_RSA, nullptr, &p,
                         static_cast<long>(der.size()));
  }
  if (pkey == nullptr) {
    log(ERROR, "public key is neither SubjectPublicKeyInfo nor PKCS#1");
    return false;
  }
  if (EVP_PKEY_get_base_id(pkey) != EVP_PKEY_RSA) {
    log(ERROR, "public key is not an RSA key");
    EVP_PKEY_free(pkey);
    return false;
  }
  EVP_PKEY_free(pkey_);
  pkey_ = pkey;
  return true;
}

bool RsaPublicKey::FromModulus(const std::vector<uint8_t>& n_be, uint64_t e) {
  if (n_be.empty()) {
    log(ERROR, "empty RSA modulus");
    return false;
  }
  BIGNUM* n = BN_bin2bn(n_be.data(), static_cast<int>(n_be.size()), nullptr);
  BIGNUM* eb = BN_new();
  OSSL_PARAM_BLD* bld = OSSL_PARAM_BLD_new();
  OSSL_PARAM* params = nullptr;
  EVP_PKEY_CTX* ctx = nullptr;
  EVP_PKEY* pkey = nullptr;
  bool ok = n != nullptr && eb != nullptr && bld != nullptr &&
            BN_set_word(eb, e) == 1 &&
            OSSL_PARAM_BLD_push_BN(bld, OSSL_PKEY_PARAM_RSA_N, n) == 1 &&
            OSSL_PARAM_BLD_push_BN(bld, OSSL_PKEY_PARAM_RSA_E, eb) == 1;
  if (ok) {
    params = OSSL_PARAM_BLD_to_param(bld);
    ctx = EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr);
    ok = params != nullptr && ctx != nullptr &&
         EVP_PKEY_fromdata_init(ctx) == 1 &&
         EVP_PKEY_fromdata(ctx, &pkey, EVP_PKEY_PUBLIC_KEY, params) == 1;
  }
  EVP_PKEY_CTX_free(ctx);
  OSSL_PARAM_free(params);
  OSSL_PARAM_BLD_free(bld);
  BN_free(eb);
  BN_free(n);
  if (!ok || pkey == nullptr) {
    log(ERROR, "could not build RSA key from modulus");
    EVP_PKEY_free(pkey);
    return false;
  }
  EVP_PKEY_free(pkey_);
  pkey_ = pkey;
  return true;
}

bool RsaPublicKey::Verify(const uint8_t msg[/*msg_len*/], size_t msg_len,
                          const uint8_t sig[/*sig_len*/],
                          size_t sig_len) const {
  if (pkey_ == nullptr) {
    log(ERROR, "no RSA key loaded");
    return false;
  }
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (ctx == nullptr) {
    log(ERROR, "EVP_MD_CTX_new failed");
    return false;
  }
  bool ok =
      EVP_DigestVerifyInit(ctx, nullptr, EVP_sha256(), nullptr, pkey_) == 1 &&
      EVP_DigestVerify(ctx, sig, sig_len, msg, msg_len) == 1;
  EVP_MD_CTX_free(ctx);
  return ok;
}

std::vector<uint8_t> RsaPublicKey::ModulusBE() const {
  std::vector<uint8_t> out;
  if (pkey_ == nullptr) {
    return out;
  }
  BIGNUM* n = nullptr;
  if (EVP_PKEY_get_bn_param(pkey_, OSSL_PKEY_PARAM_RSA_N, &n) != 1) {
    log(ERROR, "EVP_PKEY_get_bn_param(n) failed");
    return out;
  }
  out.resize(BN_num_bytes(n));
  BN_bn2bin(n, out.data());
  BN_free(n);
  return out;
}

bool rand_bytes(uint8_t out[/*n*/], size_t n) {
  int ret = RAND_bytes(out, static_cast<int>(n));
  if (ret != 1) {
    log(ERROR, "openssl RAND_bytes failed");
    return false;
  }
  return true;
}

void hex_to_str(char out[/* 2*n + 1*/], const uint8_t in[/*n*/], size_t n) {
  for (size_t i = 0; i < n; ++i) {
    out[2 * i] = "0123456789abcdef"[in[i] >> 4];
    out[2 * i + 1] = "0123456789abcdef"[in[i] & 0xf];
  }
  out[2 * n] = '\0';
}

std::string hex_encode(const std::vector<uint8_t>& in) {
  std::vector<char> buf(2 * in.size() + 1);
  hex_to_str(buf.data(), in.data(), in.size());
  return std::string(buf.data(), 2 * in.size());
}

static int hex_nibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool hex_decode(const std::string& hex, std::vector<uint8_t>& out) {
  size_t start = 0;
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    start = 2;
  }
  size_t n = hex.size() - start;
  if (n % 2 != 0) {
    return false;
  }
  out.clear();
  out.reserve(n / 2);
  for (size_t i = start; i < hex.size(); i += 2) {
    int hi = hex_nibble(hex[i]);
    int lo = hex_nibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return true;
}

bool base64_decode(const std::string& b64, std::vector<uint8_t>& out) {
  std::string clean;
  clean.reserve(b64.size());
  for (char c : b64) {
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
      clean.push_back(c);
    }
  }
  out.clear();
  if (clean.empty()) {
    return true;
  }
  if (clean.size() % 4 != 0) {
    return false;
  }
  size_t pad = 0;
  if (clean[clean.size() - 1] == '=') ++pad;
  if (clean[clean.size() - 2] == '=') ++pad;

  out.resize(clean.size() / 4 * 3);
  int n = EVP_DecodeBlock(out.data(),
                          reinterpret_cast<const unsigned char*>(clean.data()),
                          static_cast<int>(clean.size()));
  if (n < 0 || static_cast<size_t>(n) < pad) {
    out.clear();
    return false;
  }
  out.resize(static_cast<size_t>(n) - pad);
  return true;
}

}  // namespace relayer
