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

#include "email/dkim_key.h"

#include <cstdint>
#include <string>
#include <vector>

#include "email/dkim_signature.h"
#include "email/mime.h"
#include "util/crypto.h"
#include "util/status.h"

namespace relayer {

std::string dkim_key_name(const std::string& selector,
                          const std::string& domain) {
  return selector + "._domainkey." + to_lower_ascii(domain);
}

void StaticKeyResolver::Add(const std::string& selector,
                            const std::string& domain,
                            const std::string& txt) {
  records_[dkim_key_name(selector, domain)] = txt;
}

bool StaticKeyResolver::Lookup(const std::string& selector,
                               const std::string& domain,
                               std::string* txt) const {
  auto it = records_.find(dkim_key_name(selector, domain));
  if (it == records_.end()) return false;
  *txt = it->second;
  return true;
}

bool parse_dkim_key_record(const std::string& txt, RsaPublicKey* key,
                           RelayerError* err) {
  DkimTagList tags;
  if (!parse_dkim_tag_list(txt, &tags)) {
    return set_error(err, RELAYER_PARSE_FAILURE,
                     "Failed to parse email: malformed DKIM key record");
  }
  const std::string* v = find_dkim_tag(tags, "v");
  if (v != nullptr && *v != "DKIM1") {
    return set_error(err, RELAYER_PARSE_FAILURE,
                     "Failed to parse email: unsupported key record "
                     "version " + *v);
  }
  const std::string* k = find_dkim_tag(tags, "k");
  if (k != nullptr && to_lower_ascii(*k) != "rsa") {
    return set_error(err, RELAYER_PARSE_FAILURE,
                     "Failed to parse email: unsupported key type " + *k);
  }
  const std::string* p = find_dkim_tag(tags, "p");
  if (p == nullptr) {
    return set_error(err, RELAYER_PARSE_FAILURE,
                     "Failed to parse email: key record has no p= tag");
  }
  if (p->empty()) {
    return set_error(err, RELAYER_KEY_NOT_FOUND,
                     "Failed to parse email: DKIM key has been revoked");
  }
  std::vector<uint8_t> der;
  if (!base64_decode(*p, der) || !key->ParseDer(der)) {
    return set_error(err, RELAYER_PARSE_FAILURE,
                     "Failed to parse email: bad public key in key record");
  }
  return true;
}

}  // namespace relayer
