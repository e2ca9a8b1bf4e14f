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

#include "util/status.h"

#include <string>

#include "util/log.h"

namespace relayer {

RelayerErrorCategory error_category(RelayerErrorCode code) {
  switch (code) {
    case RELAYER_OK:
      return CATEGORY_NONE;
    case RELAYER_EMPTY_INPUT:
    case RELAYER_MALFORMED_ADDRESS:
      return CATEGORY_INPUT_VALIDATION;
    case RELAYER_PARSE_FAILURE:
    case RELAYER_INVALID_DKIM_SIGNATURE:
      return CATEGORY_PARSE_FAILURE;
    case RELAYER_SIGNATURE_VERIFICATION_FAILED:
    case RELAYER_BODY_HASH_MISMATCH:
    case RELAYER_KEY_NOT_FOUND:
      return CATEGORY_SIGNATURE_FAILURE;
    case RELAYER_NO_MATCH:
    case RELAYER_UNSUPPORTED_CONSTRUCT:
    case RELAYER_INVALID_REGEX:
      return CATEGORY_REGEX_FAILURE;
    case RELAYER_INPUT_EXCEEDS_MAX_LENGTH:
    case RELAYER_MAX_LENGTH_EXCEEDED:
      return CATEGORY_LENGTH_FAILURE;
    case RELAYER_INVALID_INPUT_LENGTH:
    case RELAYER_INVALID_HEX:
    case RELAYER_RANDOMNESS_FAILURE:
      return CATEGORY_ENCODING_FAILURE;
  }
  return CATEGORY_NONE;
}

const char* error_code_name(RelayerErrorCode code) {
  switch (code) {
    case RELAYER_OK:
      return "Ok";
    case RELAYER_EMPTY_INPUT:
      return "EmptyInput";
    case RELAYER_MALFORMED_ADDRESS:
      return "MalformedAddress";
    case RELAYER_PARSE_FAILURE:
      return "ParseFailure";
    case RELAYER_INVALID_DKIM_SIGNATURE:
      return "MissingOrInvalidSignatureHeader";
    case RELAYER_SIGNATURE_VERIFICATION_FAILED:
      return "SignatureVerificationFailed";
    case RELAYER_BODY_HASH_MISMATCH:
      return "BodyHashMismatch";
    case RELAYER_KEY_NOT_FOUND:
      return "KeyNotFound";
    case RELAYER_NO_MATCH:
      return "NoMatch";
    case RELAYER_UNSUPPORTED_CONSTRUCT:
      return "UnsupportedConstruct";
    case RELAYER_INVALID_REGEX:
      return "InvalidRegex";
    case RELAYER_INPUT_EXCEEDS_MAX_LENGTH:
      return "InputExceedsMaxLength";
    case RELAYER_MAX_LENGTH_EXCEEDED:
      return "MaxLengthExceeded";
    case RELAYER_INVALID_INPUT_LENGTH:
      return "InvalidInputLength";
    case RELAYER_INVALID_HEX:
      return "InvalidHex";
    case RELAYER_RANDOMNESS_FAILURE:
      return "RandomnessFailure";
  }
  return "Unknown";
}

bool set_error(RelayerError* err, RelayerErrorCode code,
               const std::string& message) {
  log(ERROR, "%s (%s)", message.c_str(), error_code_name(code));
  if (err != nullptr) {
    err->code = code;
    err->message = message;
  }
  return false;
}

}  // namespace relayer
