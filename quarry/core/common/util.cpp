// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <algorithm>
#include <cstdio>
#include <regex>

namespace quarry {

ByteView zeroless_view(ByteView data) {
    const auto is_zero_byte = [](const auto& b) { return b == 0x0; };
    const auto first_nonzero_byte_it{std::ranges::find_if_not(data, is_zero_byte)};
    return data.substr(static_cast<size_t>(std::distance(data.begin(), first_nonzero_byte_it)));
}

bool is_valid_hex(std::string_view s) {
    static const std::regex kHexRegex("^0x[0-9a-fA-F]+$");
    return std::regex_match(s.begin(), s.end(), kHexRegex);
}

std::string to_hex(ByteView bytes, bool with_prefix) {
    static const char* kHexDigits{"0123456789abcdef"};
    std::string out(bytes.size() * 2 + (with_prefix ? 2 : 0), '\0');
    char* dest{&out[0]};
    if (with_prefix) {
        *dest++ = '0';
        *dest++ = 'x';
    }
    for (const auto& b : bytes) {
        *dest++ = kHexDigits[b >> 4];    // Hi
        *dest++ = kHexDigits[b & 0x0f];  // Lo
    }
    return out;
}

std::optional<uint8_t> decode_hex_digit(char ch) noexcept {
    if (ch >= '0' && ch <= '9') {
        return static_cast<uint8_t>(ch - '0');
    }
    if (ch >= 'a' && ch <= 'f') {
        return static_cast<uint8_t>(ch - 'a' + 10);
    }
    if (ch >= 'A' && ch <= 'F') {
        return static_cast<uint8_t>(ch - 'A' + 10);
    }
    return std::nullopt;
}

std::optional<Bytes> from_hex(std::string_view hex) noexcept {
    if (has_hex_prefix(hex)) {
        hex.remove_prefix(2);
    }
    if (hex.empty()) {
        return Bytes{};
    }

    const size_t pos{hex.size() & 1};  // "[0x]1" is legit and has to be treated as "[0x]01"
    Bytes out((hex.size() + pos) / 2, '\0');
    auto src{hex.begin()};
    auto dst{out.begin()};
    if (pos) {
        const auto lo{decode_hex_digit(*src++)};
        if (!lo) return std::nullopt;
        *dst++ = *lo;
    }
    for (; dst != out.end(); ++dst) {
        const auto hi{decode_hex_digit(*src++)};
        const auto lo{decode_hex_digit(*src++)};
        if (!hi || !lo) {
            return std::nullopt;
        }
        *dst = static_cast<uint8_t>((*hi << 4) | *lo);
    }
    return out;
}

inline bool case_insensitive_char_comparer(char a, char b) { return (tolower(a) == tolower(b)); }

bool iequals(const std::string_view a, const std::string_view b) {
    return (a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), case_insensitive_char_comparer));
}

std::optional<uint64_t> parse_size(const std::string& sizestr) {
    if (sizestr.empty()) {
        return 0ull;
    }

    static const std::regex kPattern{R"(^(\d*)(\.\d{1,3})?\ *?(B|KB|MB|GB|TB)?$)", std::regex_constants::icase};
    std::smatch matches;
    if (!std::regex_search(sizestr, matches, kPattern, std::regex_constants::match_default)) {
        return std::nullopt;
    }

    uint64_t multiplier{1};
    const std::string int_part{matches[1].str()};
    const std::string dec_part{matches[2].str().empty() ? "" : matches[2].str().substr(1)};
    const std::string suf_part{matches[3].str()};

    if (iequals(suf_part, "KB")) {
        multiplier = kKibi;
    } else if (iequals(suf_part, "MB")) {
        multiplier = kMebi;
    } else if (iequals(suf_part, "GB")) {
        multiplier = kGibi;
    } else if (iequals(suf_part, "TB")) {
        multiplier = kTebi;
    }

    uint64_t number{std::strtoull(int_part.c_str(), nullptr, 10) * multiplier};
    if (!dec_part.empty()) {
        const auto base{std::strtoull(("1" + std::string(dec_part.size(), '0')).c_str(), nullptr, 10)};
        const auto d{std::strtoull(dec_part.c_str(), nullptr, 10)};
        number += multiplier * d / base;
    }
    return number;
}

std::string human_size(uint64_t bytes, const char* unit) {
    static const char* suffix[]{"", "K", "M", "G", "T"};
    static const uint32_t kItems{sizeof(suffix) / sizeof(suffix[0])};
    uint32_t index{0};
    double value{static_cast<double>(bytes)};
    while (value >= kKibi) {
        value /= kKibi;
        if (++index == (kItems - 1)) {
            break;
        }
    }
    static constexpr size_t kBufferSize{64};
    char output[kBufferSize];
    std::snprintf(output, kBufferSize, "%.02lf %s%s", value, suffix[index], unit);
    return output;
}

}  // namespace quarry
