// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic concepts, types, and constants.

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string>

#include <evmc/bytes.hpp>
#include <intx/intx.hpp>

namespace quarry {

using namespace std::string_view_literals;

template <class T>
concept UnsignedIntegral = std::unsigned_integral<T> || std::same_as<T, intx::uint128> ||
                           std::same_as<T, intx::uint256>;

using Bytes = evmc::bytes;

//! \brief Non owning view over bytes, implicitly built from Bytes, raw arrays and spans
class ByteView : public evmc::bytes_view {
  public:
    constexpr ByteView() noexcept = default;

    // NOLINTBEGIN(google-explicit-constructor, hicpp-explicit-conversions)
    constexpr ByteView(const evmc::bytes_view& other) noexcept : evmc::bytes_view{other.data(), other.size()} {}
    ByteView(const Bytes& bytes) noexcept : evmc::bytes_view{bytes.data(), bytes.size()} {}
    template <size_t N>
    constexpr ByteView(const uint8_t (&array)[N]) noexcept : evmc::bytes_view{array, N} {}
    template <size_t N>
    constexpr ByteView(const std::array<uint8_t, N>& array) noexcept : evmc::bytes_view{array.data(), N} {}
    template <size_t Extent>
    constexpr ByteView(std::span<const uint8_t, Extent> span) noexcept : evmc::bytes_view{span.data(), span.size()} {}
    // NOLINTEND(google-explicit-constructor, hicpp-explicit-conversions)

    constexpr ByteView(const uint8_t* data, size_type size) noexcept : evmc::bytes_view{data, size} {}
};

using BlockNum = uint64_t;

inline constexpr BlockNum kMaxBlockNum = std::numeric_limits<BlockNum>::max();

//! \brief Inclusive range of block numbers [start, end]
struct BlockNumRange {
    BlockNum start{0};
    BlockNum end{0};
    friend bool operator==(const BlockNumRange&, const BlockNumRange&) = default;
    bool contains(BlockNum block_num) const { return (start <= block_num) && (block_num <= end); }
    BlockNum size() const { return end - start + 1; }
    std::string to_string() const { return "[" + std::to_string(start) + ", " + std::to_string(end) + "]"; }
};

using BlockTime = uint64_t;

inline constexpr size_t kAddressLength{20};

inline constexpr size_t kHashLength{32};

// https://en.wikipedia.org/wiki/Binary_prefix
inline constexpr uint64_t kKibi{1024};
inline constexpr uint64_t kMebi{1024 * kKibi};
inline constexpr uint64_t kGibi{1024 * kMebi};
inline constexpr uint64_t kTebi{1024 * kGibi};

inline constexpr uint64_t kGiga{1'000'000'000};   // = 10^9
inline constexpr uint64_t kEther{kGiga * kGiga};  // = 10^18

consteval uint64_t operator"" _Kibi(unsigned long long x) { return x * kKibi; }
consteval uint64_t operator"" _Mebi(unsigned long long x) { return x * kMebi; }
consteval uint64_t operator"" _Gibi(unsigned long long x) { return x * kGibi; }
consteval uint64_t operator"" _Tebi(unsigned long long x) { return x * kTebi; }

}  // namespace quarry
