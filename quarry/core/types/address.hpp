// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>

#include <quarry/core/common/base.hpp>

namespace quarry {

inline constexpr evmc::address kZeroAddress{};

// Converts bytes to evmc::address keeping the rightmost 20 bytes (e.g. a 32-byte log topic).
// Short inputs are left-padded with 0s.
evmc::address bytes_to_address(ByteView bytes);

//! \brief Parses a 0x-prefixed 40 hex digits address, returns std::nullopt on malformed input
std::optional<evmc::address> hex_to_address(std::string_view hex);

std::string address_to_hex(const evmc::address& address);

}  // namespace quarry

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address);

}  // namespace evmc
