// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "address.hpp"

#include <algorithm>
#include <cstring>

#include <quarry/core/common/util.hpp>

namespace quarry {

evmc::address bytes_to_address(ByteView bytes) {
    evmc::address out;
    if (!bytes.empty()) {
        const size_t n{std::min(bytes.size(), kAddressLength)};
        std::memcpy(out.bytes + kAddressLength - n, bytes.data() + bytes.size() - n, n);
    }
    return out;
}

std::optional<evmc::address> hex_to_address(std::string_view hex) {
    if (!is_valid_address(hex)) {
        return std::nullopt;
    }
    const auto bytes{from_hex(hex)};
    if (!bytes) {
        return std::nullopt;
    }
    return bytes_to_address(*bytes);
}

std::string address_to_hex(const evmc::address& address) {
    return to_hex(address.bytes, /*with_prefix=*/true);
}

}  // namespace quarry

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address) {
    out << quarry::address_to_hex(address);
    return out;
}

}  // namespace evmc
