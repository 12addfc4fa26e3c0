// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

// RLP decoding functions as per
// https://ethereum.org/en/developers/docs/data-structures-and-encoding/rlp/

#pragma once

#include <cstring>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <quarry/core/common/base.hpp>
#include <quarry/core/common/error.hpp>
#include <quarry/core/rlp/encode.hpp>

namespace quarry::rlp {

// Whether to allow or prohibit trailing characters in an input after decoding.
// If prohibited and the input does contain extra characters, decode() returns kInputTooLong.
enum class Leftover {
    kProhibit,
    kAllow,
};

// Consumes an RLP header unless it's a single byte in the [0x00, 0x7f] range,
// in which case the byte is put back.
tl::expected<Header, DecodingError> decode_header(ByteView& from) noexcept;

//! \brief Consumes a list header and returns a view over its payload, advancing from past the whole list
tl::expected<ByteView, DecodingError> decode_list(ByteView& from) noexcept;

//! \brief Checks a list payload has been fully consumed and applies the leftover policy to the outer input
inline DecodingResult finalize_list(ByteView payload, ByteView from, Leftover mode) noexcept {
    if (!payload.empty()) {
        return tl::unexpected{DecodingError::kUnexpectedListElements};
    }
    if (mode != Leftover::kAllow && !from.empty()) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    return {};
}

DecodingResult decode(ByteView& from, Bytes& to, Leftover mode = Leftover::kProhibit) noexcept;

template <UnsignedIntegral T>
DecodingResult decode(ByteView& from, T& to, Leftover mode = Leftover::kProhibit) noexcept {
    const auto h{decode_header(from)};
    if (!h) {
        return tl::unexpected{h.error()};
    }
    if (h->list) {
        return tl::unexpected{DecodingError::kUnexpectedList};
    }
    if (DecodingResult res{endian::from_big_compact(from.substr(0, h->payload_length), to)}; !res) {
        return res;
    }
    from.remove_prefix(h->payload_length);
    if (mode != Leftover::kAllow && !from.empty()) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    return {};
}

DecodingResult decode(ByteView& from, bool& to, Leftover mode = Leftover::kProhibit) noexcept;

template <size_t N>
DecodingResult decode(ByteView& from, std::span<uint8_t, N> to, Leftover mode = Leftover::kProhibit) noexcept {
    static_assert(N != std::dynamic_extent);
    const auto h{decode_header(from)};
    if (!h) {
        return tl::unexpected{h.error()};
    }
    if (h->list) {
        return tl::unexpected{DecodingError::kUnexpectedList};
    }
    if (h->payload_length != N) {
        return tl::unexpected{DecodingError::kUnexpectedLength};
    }
    std::memcpy(to.data(), from.data(), N);
    from.remove_prefix(N);
    if (mode != Leftover::kAllow && !from.empty()) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    return {};
}

inline DecodingResult decode(ByteView& from, evmc::address& to, Leftover mode = Leftover::kProhibit) noexcept {
    return decode<kAddressLength>(from, std::span<uint8_t, kAddressLength>{to.bytes}, mode);
}

inline DecodingResult decode(ByteView& from, evmc::bytes32& to, Leftover mode = Leftover::kProhibit) noexcept {
    return decode<kHashLength>(from, std::span<uint8_t, kHashLength>{to.bytes}, mode);
}

template <typename T>
DecodingResult decode(ByteView& from, std::vector<T>& to, Leftover mode = Leftover::kProhibit) noexcept {
    auto payload{decode_list(from)};
    if (!payload) {
        return tl::unexpected{payload.error()};
    }
    to.clear();
    while (!payload->empty()) {
        to.emplace_back();
        if (DecodingResult res{decode(*payload, to.back(), Leftover::kAllow)}; !res) {
            return res;
        }
    }
    if (mode != Leftover::kAllow && !from.empty()) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    return {};
}

template <typename T>
DecodingResult decode(ByteView& from, std::optional<T>& to, Leftover mode = Leftover::kProhibit) noexcept {
    auto payload{decode_list(from)};
    if (!payload) {
        return tl::unexpected{payload.error()};
    }
    if (payload->empty()) {
        to = std::nullopt;
    } else {
        T value{};
        if (DecodingResult res{decode(*payload, value, Leftover::kProhibit)}; !res) {
            return res;
        }
        to = std::move(value);
    }
    if (mode != Leftover::kAllow && !from.empty()) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    return {};
}

//! \brief Decodes a sequence of items from a list payload, each consuming its own part of the input
template <typename Arg1, typename... Args>
DecodingResult decode_items(ByteView& from, Arg1& arg1, Args&... args) noexcept {
    if (DecodingResult res{decode(from, arg1, Leftover::kAllow)}; !res) {
        return res;
    }
    if constexpr (sizeof...(args) > 0) {
        return decode_items(from, args...);
    }
    return {};
}

}  // namespace quarry::rlp
