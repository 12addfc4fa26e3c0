// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iomanip>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <ethash/keccak.hpp>
#include <intx/intx.hpp>

#include <quarry/core/common/base.hpp>

// intx does not include operator<< overloading for uint<N>
namespace intx {

template <unsigned N>
inline std::ostream& operator<<(std::ostream& out, const uint<N>& value) {
    out << intx::to_string(value);
    return out;
}

}  // namespace intx

namespace quarry {

//! \brief Strips leftmost zeroed bytes from byte sequence
//! \param [in] data : The view to process
//! \return A new view of the sequence
ByteView zeroless_view(ByteView data);

inline bool has_hex_prefix(std::string_view s) {
    return s.length() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

bool is_valid_hex(std::string_view s);

inline bool is_valid_hash(std::string_view s) {
    return s.length() == 2 + kHashLength * 2 && is_valid_hex(s);
}

inline bool is_valid_address(std::string_view s) {
    return s.length() == 2 + kAddressLength * 2 && is_valid_hex(s);
}

//! \brief Returns a string representing the hex form of provided string of bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

std::optional<uint8_t> decode_hex_digit(char ch) noexcept;

//! \brief Decodes a hex string (with or without 0x prefix). Odd lengths are left padded with a zero nibble
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

// Parses a string input value representing a size in
// human-readable format with qualifiers. eg "256MB"
std::optional<uint64_t> parse_size(const std::string& sizestr);

// Converts a number of bytes in a human-readable format
std::string human_size(uint64_t bytes, const char* unit = "B");

// Compares two strings for equality with case insensitivity
bool iequals(std::string_view a, std::string_view b);

inline ethash::hash256 keccak256(ByteView view) { return ethash::keccak256(view.data(), view.size()); }

inline std::ostream& operator<<(std::ostream& out, ByteView bytes) {
    for (const auto& b : bytes) {
        out << std::hex << std::setw(2) << std::setfill('0') << int{b};
    }
    out << std::dec;
    return out;
}

}  // namespace quarry
