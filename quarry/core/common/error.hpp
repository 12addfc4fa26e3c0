// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

#include <tl/expected.hpp>

namespace quarry {

//! \brief Failure categories surfaced by the storage, index, query and bus layers
enum class ErrorCode {
    kNotFound,
    kInvalidInput,
    kStorageUnavailable,
    kDecodeFailure,
    kCapacity,
    kCancelled,
};

//! \brief Reasons a RLP item or a stored record fails to decode
enum class [[nodiscard]] DecodingError {
    kOverflow,
    kLeadingZero,
    kInputTooShort,
    kInputTooLong,
    kNonCanonicalSize,
    kUnexpectedLength,
    kUnexpectedString,
    kUnexpectedList,
    kUnexpectedListElements,
    kUnsupportedTransactionType,
    kInvalidFieldset,
};

// TODO(C++23) Switch to std::expected
using DecodingResult = tl::expected<void, DecodingError>;

class Error : public std::runtime_error {
  public:
    explicit Error(ErrorCode code, const std::string& message = "");

    ErrorCode code() const noexcept { return code_; }

  private:
    ErrorCode code_;
};

std::string to_string(DecodingError err);

//! \brief Throws Error{kDecodeFailure} if the decoding result holds an error
template <class T>
inline void success_or_throw(const tl::expected<T, DecodingError>& res, const std::string& error_message = "") {
    if (!res) {
        throw Error(ErrorCode::kDecodeFailure, error_message.empty() ? to_string(res.error()) : error_message);
    }
}

//! Throws Error{kInvalidInput} with the provided message unless condition holds
inline void ensure_input(bool condition, const std::string& message) {
    if (!condition) [[unlikely]] {
        throw Error(ErrorCode::kInvalidInput, message);
    }
}

//! Throws Error{kDecodeFailure} with the provided message unless condition holds, for checks on stored data
inline void ensure_stored(bool condition, const std::string& message) {
    if (!condition) [[unlikely]] {
        throw Error(ErrorCode::kDecodeFailure, message);
    }
}

}  // namespace quarry
