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

#ifndef RELAYER_LIB_EMAIL_DKIM_TEST_SIGNER_H_
#define RELAYER_LIB_EMAIL_DKIM_TEST_SIGNER_H_

// Test-only helper that DKIM-signs synthetic messages with a fresh RSA key.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "email/dkim_canon.h"
#include "email/dkim_signature.h"
#include "email/mime.h"
#include "util/crypto.h"
#include "util/panic.h"
#include "openssl/evp.h"
#include "openssl/rsa.h"
#include "openssl/x509.h"

namespace relayer {

inline std::string base64_encode_for_test(const std::vector<uint8_t>& in) {
  std::string out(4 * ((in.size() + 2) / 3) + 1, '\0');
  int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                          in.data(), static_cast<int>(in.size()));
  out.resize(static_cast<size_t>(n));
  return out;
}

class DkimTestSigner {
 public:
  static constexpr uint64_t kTimestamp = 1694989812;

  DkimTestSigner() : key_(EVP_RSA_gen(2048)) {
    check(key_ != nullptr, "EVP_RSA_gen failed");
  }
  ~DkimTestSigner() { EVP_PKEY_free(key_); }

  DkimTestSigner(const DkimTestSigner&) = delete;
  DkimTestSigner& operator=(const DkimTestSigner&) = delete;

  std::vector<uint8_t> SpkiDer() const {
    unsigned char* der = nullptr;
    int n = i2d_PUBKEY(key_, &der);
    check(n > 0, "i2d_PUBKEY failed");
    std::vector<uint8_t> out(der, der + n);
    OPENSSL_free(der);
    return out;
  }

  std::string KeyRecord() const {
    return "v=DKIM1; k=rsa; p=" + base64_encode_for_test(SpkiDer());
  }

  std::vector<uint8_t> ModulusBE() const {
    RsaPublicKey pk;
    check(pk.ParseDer(SpkiDer()), "ParseDer failed");
    return pk.ModulusBE();
  }

  // Returns the signed message: a DKIM-Signature header, then
  // header_lines (each "Name: value", may contain folded CRLF WSP), an empty
  // line and the body.
  std::string Sign(const std::vector<std::string>& header_lines,
                   const std::string& body,
                   const std::string& canon = "relaxed/relaxed",
                   const std::string& h = "from:to:subject") const {
    std::string head;
    for (const std::string& line : header_lines) {
      head += line + "\r\n";
    }

    size_t slash = canon.find('/');
    DkimCanonicalization hc, bc;
    check(parse_dkim_canonicalization(canon.substr(0, slash), &hc) &&
              parse_dkim_canonicalization(canon.substr(slash + 1), &bc),
          "bad canonicalization");

    std::string canon_body = canonicalize_body(body, bc);
    std::vector<uint8_t> bh(kSHA256DigestSize);
    sha256(reinterpret_cast<const uint8_t*>(canon_body.data()),
           canon_body.size(), bh.data());

    std::string dkim = "DKIM-Signature: v=1; a=rsa-sha256; c=" + canon +
                       "; d=example.com; s=selector1; t=" +
                       std::to_string(kTimestamp) + "; h=" + h +
                       "; bh=" + base64_encode_for_test(bh) + "; b=";

    std::vector<HeaderField> headers;
    std::string unused_body;
    check(split_message(dkim + "\r\n" + head + "\r\n", &headers,
                        &unused_body, nullptr),
          "split_message failed");

    std::vector<std::string> names;
    size_t pos = 0;
    while (pos <= h.size()) {
      size_t colon = h.find(':', pos);
      if (colon == std::string::npos) colon = h.size();
      names.push_back(to_lower_ascii(h.substr(pos, colon - pos)));
      pos = colon + 1;
    }

    std::string signed_data;
    for (const HeaderField* f : select_signed_headers(headers, names)) {
      signed_data += canonicalize_header_field(*f, hc);
    }
    std::string d = canonicalize_header_field(headers[0], hc);
    signed_data += d.substr(0, d.size() - 2);

    std::vector<uint8_t> sig = RsaSign(signed_data);
    return dkim + base64_encode_for_test(sig) + "\r\n" + head + "\r\n" + body;
  }

  std::vector<uint8_t> RsaSign(const std::string& msg) const {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    size_t siglen = 0;
    check(EVP_DigestSignInit(ctx, nullptr, EVP_sha256(), nullptr, key_) == 1,
          "EVP_DigestSignInit failed");
    const uint8_t* m = reinterpret_cast<const uint8_t*>(msg.data());
    check(EVP_DigestSign(ctx, nullptr, &siglen, m, msg.size()) == 1,
          "EVP_DigestSign failed");
    std::vector<uint8_t> sig(siglen);
    check(EVP_DigestSign(ctx, sig.data(), &siglen, m, msg.size()) == 1,
          "EVP_DigestSign failed");
    sig.resize(siglen);
    EVP_MD_CTX_free(ctx);
    return sig;
  }

 private:
  EVP_PKEY* key_;
};

}  // namespace relayer

#endif  // RELAYER_LIB_EMAIL_DKIM_TEST_SIGNER_H_
