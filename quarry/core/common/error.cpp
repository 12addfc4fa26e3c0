// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "error.hpp"

#include <magic_enum.hpp>

namespace quarry {

Error::Error(ErrorCode code, const std::string& message)
    : std::runtime_error{
          message.empty() ? "Error : " + std::string{magic_enum::enum_name(code)}
                          : message},
      code_{code} {}

std::string to_string(DecodingError err) {
    return "Decoding error : " + std::string{magic_enum::enum_name(err)};
}

}  // namespace quarry
