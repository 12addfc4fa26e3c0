// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "encode.hpp"

namespace quarry::rlp {

namespace {

    // short form: base + length, long form: base + 55 + length of the length, then the length itself
    void append_prefix(Bytes& to, uint8_t base, size_t payload_length) {
        if (payload_length <= kMaxShortPayload) {
            to.push_back(static_cast<uint8_t>(base + payload_length));
            return;
        }
        const Bytes length{endian::to_big_compact(static_cast<uint64_t>(payload_length))};
        to.push_back(static_cast<uint8_t>(base + kMaxShortPayload + length.size()));
        to += length;
    }

}  // namespace

void encode_header(Bytes& to, Header header) {
    append_prefix(to, header.list ? kEmptyListCode : kEmptyStringCode, header.payload_length);
}

void encode(Bytes& to, ByteView str) {
    // a single byte below 0x80 is its own encoding
    const bool self_encoded{str.size() == 1 && str[0] < kEmptyStringCode};
    if (!self_encoded) {
        append_prefix(to, kEmptyStringCode, str.size());
    }
    to.append(str);
}

void encode(Bytes& to, bool flag) { encode(to, flag ? uint8_t{1} : uint8_t{0}); }

void encode(Bytes& to, const evmc::address& address) { encode(to, ByteView{address.bytes}); }

void encode(Bytes& to, const evmc::bytes32& hash) { encode(to, ByteView{hash.bytes}); }

void encode_list(Bytes& to, ByteView payload) {
    append_prefix(to, kEmptyListCode, payload.size());
    to.append(payload);
}

}  // namespace quarry::rlp
