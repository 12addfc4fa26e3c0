// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/*
Byte order facilities.
Table keys store integers big endian so that the lexicographic order of MDBX matches the numeric order,
stored values use the compact form (no leading zero bytes) of the RLP integers.
*/

#include <cstdint>
#include <cstring>

#include <intx/intx.hpp>

#include <quarry/core/common/base.hpp>
#include <quarry/core/common/error.hpp>

namespace quarry::endian {

// NOLINTBEGIN(readability-identifier-naming)

const auto load_big_u32 = intx::be::unsafe::load<uint32_t>;
const auto load_big_u64 = intx::be::unsafe::load<uint64_t>;
const auto store_big_u32 = intx::be::unsafe::store<uint32_t>;
const auto store_big_u64 = intx::be::unsafe::store<uint64_t>;

// NOLINTEND(readability-identifier-naming)

//! \brief Appends the 4 bytes big endian form of value, the building block of composite keys
inline void append_big_u32(Bytes& out, uint32_t value) {
    const size_t pos{out.size()};
    out.resize(pos + sizeof(uint32_t));
    store_big_u32(&out[pos], value);
}

//! \brief Appends the 8 bytes big endian form of value
inline void append_big_u64(Bytes& out, uint64_t value) {
    const size_t pos{out.size()};
    out.resize(pos + sizeof(uint64_t));
    store_big_u64(&out[pos], value);
}

//! \brief Appends the 32 bytes big endian form of value
inline void append_big_u256(Bytes& out, const intx::uint256& value) {
    const size_t pos{out.size()};
    out.resize(pos + sizeof(intx::uint256));
    intx::be::unsafe::store(&out[pos], value);
}

//! \brief Big endian form of value without its leading zero bytes, empty for zero
//! \return A view into a thread_local buffer, valid until the next call on the same thread
ByteView to_big_compact(uint64_t value);
ByteView to_big_compact(const intx::uint256& value);

//! \brief Parses an unsigned integer from its compact big endian form
//! \return kOverflow when data is wider than T, kLeadingZero when the form is not compact
template <UnsignedIntegral T>
static DecodingResult from_big_compact(ByteView data, T& out) {
    if (data.size() > sizeof(T)) {
        return tl::unexpected{DecodingError::kOverflow};
    }
    out = 0;
    if (data.empty()) {
        return {};
    }
    if (data[0] == 0) {
        return tl::unexpected{DecodingError::kLeadingZero};
    }
    auto* ptr{reinterpret_cast<uint8_t*>(&out)};
    std::memcpy(ptr + (sizeof(T) - data.size()), &data[0], data.size());
    out = intx::to_big_endian(out);
    return {};
}

}  // namespace quarry::endian
