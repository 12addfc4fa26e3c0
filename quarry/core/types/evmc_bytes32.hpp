// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <quarry/core/common/base.hpp>

namespace quarry {

// Converts bytes to evmc::bytes32; input is cropped if necessary.
// Short inputs are left-padded with 0s.
evmc::bytes32 to_bytes32(ByteView bytes);

//! \brief Parses a 0x-prefixed 64 hex digits hash, returns std::nullopt on malformed input
std::optional<evmc::bytes32> hex_to_bytes32(std::string_view hex);

std::string to_hex(const evmc::bytes32& value, bool with_prefix = false);

inline intx::uint256 bytes32_to_uint256(const evmc::bytes32& value) {
    return intx::be::load<intx::uint256>(value.bytes);
}

inline evmc::bytes32 uint256_to_bytes32(const intx::uint256& value) {
    evmc::bytes32 out;
    intx::be::store(out.bytes, value);
    return out;
}

}  // namespace quarry

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::bytes32& value);

}  // namespace evmc
