// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

// RLP encoding functions as per
// https://ethereum.org/en/developers/docs/data-structures-and-encoding/rlp/

#pragma once

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <quarry/core/common/base.hpp>
#include <quarry/core/common/endian.hpp>

namespace quarry::rlp {

struct Header {
    bool list{false};
    size_t payload_length{0};
};

inline constexpr uint8_t kEmptyStringCode{0x80};
inline constexpr uint8_t kEmptyListCode{0xC0};

//! Payloads up to this length have their length folded into the prefix byte
inline constexpr size_t kMaxShortPayload{55};

void encode_header(Bytes& to, Header header);

void encode(Bytes& to, ByteView str);

template <UnsignedIntegral T>
void encode(Bytes& to, const T& n) {
    if (n == 0) {
        to.push_back(kEmptyStringCode);
    } else if (n < kEmptyStringCode) {
        to.push_back(static_cast<uint8_t>(n));
    } else {
        const ByteView be{endian::to_big_compact(n)};
        encode_header(to, {.list = false, .payload_length = be.size()});
        to.append(be);
    }
}

void encode(Bytes& to, bool);

void encode(Bytes& to, const evmc::address& address);

void encode(Bytes& to, const evmc::bytes32& hash);

//! \brief Appends a list header for the already encoded payload followed by the payload itself
void encode_list(Bytes& to, ByteView payload);

template <typename T>
void encode(Bytes& to, const std::vector<T>& v) {
    Bytes payload;
    for (const T& x : v) {
        encode(payload, x);
    }
    encode_list(to, payload);
}

//! \brief Encodes an optional value as a list holding zero or one item
template <typename T>
void encode(Bytes& to, const std::optional<T>& v) {
    Bytes payload;
    if (v) {
        encode(payload, *v);
    }
    encode_list(to, payload);
}

}  // namespace quarry::rlp
