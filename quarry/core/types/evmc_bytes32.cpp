// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "evmc_bytes32.hpp"

#include <algorithm>
#include <cstring>

#include <quarry/core/common/base.hpp>
#include <quarry/core/common/util.hpp>

namespace quarry {

evmc::bytes32 to_bytes32(ByteView bytes) {
    evmc::bytes32 out;
    if (!bytes.empty()) {
        const size_t n{std::min(bytes.size(), kHashLength)};
        std::memcpy(out.bytes + kHashLength - n, bytes.data(), n);
    }
    return out;
}

std::optional<evmc::bytes32> hex_to_bytes32(std::string_view hex) {
    if (!is_valid_hash(hex)) {
        return std::nullopt;
    }
    const auto bytes{from_hex(hex)};
    if (!bytes) {
        return std::nullopt;
    }
    return to_bytes32(*bytes);
}

std::string to_hex(const evmc::bytes32& value, bool with_prefix) {
    return quarry::to_hex(ByteView{value.bytes}, with_prefix);
}

}  // namespace quarry

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::bytes32& value) {
    out << quarry::to_hex(value, /*with_prefix=*/true);
    return out;
}

}  // namespace evmc
