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

#ifndef RELAYER_LIB_UTIL_STATUS_H_
#define RELAYER_LIB_UTIL_STATUS_H_

#include <string>

namespace relayer {

enum RelayerErrorCode {
  RELAYER_OK = 0,
  RELAYER_EMPTY_INPUT,
  RELAYER_MALFORMED_ADDRESS,
  RELAYER_PARSE_FAILURE,
  RELAYER_INVALID_DKIM_SIGNATURE,
  RELAYER_SIGNATURE_VERIFICATION_FAILED,
  RELAYER_BODY_HASH_MISMATCH,
  RELAYER_KEY_NOT_FOUND,
  RELAYER_NO_MATCH,
  RELAYER_UNSUPPORTED_CONSTRUCT,
  RELAYER_INVALID_REGEX,
  RELAYER_INPUT_EXCEEDS_MAX_LENGTH,
  RELAYER_MAX_LENGTH_EXCEEDED,
  RELAYER_INVALID_INPUT_LENGTH,
  RELAYER_INVALID_HEX,
  RELAYER_RANDOMNESS_FAILURE,
};

enum RelayerErrorCategory {
  CATEGORY_NONE = 0,
  CATEGORY_INPUT_VALIDATION,
  CATEGORY_PARSE_FAILURE,
  CATEGORY_SIGNATURE_FAILURE,
  CATEGORY_REGEX_FAILURE,
  CATEGORY_LENGTH_FAILURE,
  CATEGORY_ENCODING_FAILURE,
};

RelayerErrorCategory error_category(RelayerErrorCode code);
const char* error_code_name(RelayerErrorCode code);

// Error value returned through an optional out-parameter by every fallible
// operation.  The message has the form "<Category>: <detail>"; the prefixes
// are stable and callers match on them.
struct RelayerError {
  RelayerErrorCode code = RELAYER_OK;
  std::string message;

  bool ok() const { return code == RELAYER_OK; }
};

// Fills *err (when non-null), logs the message at ERROR and returns false,
// so that failure paths can be written as `return set_error(...)`.
bool set_error(RelayerError* err, RelayerErrorCode code,
               const std::string& message);

}  // namespace relayer

#endif  // RELAYER_LIB_UTIL_STATUS_H_
