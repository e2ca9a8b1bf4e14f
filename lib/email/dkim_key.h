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

#ifndef RELAYER_LIB_EMAIL_DKIM_KEY_H_
#define RELAYER_LIB_EMAIL_DKIM_KEY_H_

#include <map>
#include <string>

#include "util/crypto.h"
#include "util/status.h"

namespace relayer {

// Supplies the TXT record published at <selector>._domainkey.<domain>.
// DNS access lives with the caller; this library never performs lookups.
class DkimKeyResolver {
 public:
  virtual ~DkimKeyResolver() = default;

  // Returns false when no record exists.
  virtual bool Lookup(const std::string& selector, const std::string& domain,
                      std::string* txt) const = 0;
};

// Resolver over a fixed in-memory table.
class StaticKeyResolver : public DkimKeyResolver {
 public:
  void Add(const std::string& selector, const std::string& domain,
           const std::string& txt);

  bool Lookup(const std::string& selector, const std::string& domain,
              std::string* txt) const override;

 private:
  std::map<std::string, std::string> records_;
};

// "<selector>._domainkey.<domain>" with the domain in lower case.
std::string dkim_key_name(const std::string& selector,
                          const std::string& domain);

// Parses a DKIM key record ("v=DKIM1; k=rsa; p=<base64 DER>").  An empty p=
// means the key was revoked and fails with RELAYER_KEY_NOT_FOUND.
bool parse_dkim_key_record(const std::string& txt, RsaPublicKey* key,
                           RelayerError* err);

}  // namespace relayer

#endif  // RELAYER_LIB_EMAIL_DKIM_KEY_H_
