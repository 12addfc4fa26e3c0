// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "endian.hpp"

#include <type_traits>

#include <quarry/core/common/util.hpp>

namespace quarry::endian {

namespace {

    template <class T>
    ByteView compact(const T& value) {
        thread_local uint8_t buffer[sizeof(T)];
        if constexpr (std::is_same_v<T, intx::uint256>) {
            intx::be::store(buffer, value);
        } else {
            store_big_u64(buffer, value);
        }
        return zeroless_view(buffer);
    }

}  // namespace

ByteView to_big_compact(uint64_t value) { return value ? compact(value) : ByteView{}; }

ByteView to_big_compact(const intx::uint256& value) { return value ? compact(value) : ByteView{}; }

}  // namespace quarry::endian
