// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <evmc/evmc.hpp>

#include <quarry/core/common/util.hpp>
#include <quarry/core/rlp/decode.hpp>
#include <quarry/core/rlp/encode.hpp>

namespace quarry::rlp {

using evmc::literals::operator""_address;

TEST_CASE("RLP encoding of scalars") {
    Bytes out;
    SECTION("zero") {
        encode(out, uint64_t{0});
        CHECK(to_hex(out) == "80");
    }
    SECTION("single byte") {
        encode(out, uint64_t{0x7f});
        CHECK(to_hex(out) == "7f");
    }
    SECTION("two bytes") {
        encode(out, uint64_t{0x400});
        CHECK(to_hex(out) == "820400");
    }
    SECTION("string") {
        encode(out, ByteView{Bytes{'d', 'o', 'g'}});
        CHECK(to_hex(out) == "83646f67");
    }
    SECTION("list of strings") {
        std::vector<Bytes> v{Bytes{'c', 'a', 't'}, Bytes{'d', 'o', 'g'}};
        encode(out, v);
        CHECK(to_hex(out) == "c88363617483646f67");
    }
}

TEST_CASE("RLP decoding") {
    SECTION("integer") {
        Bytes in{*from_hex("820400")};
        ByteView view{in};
        uint64_t x{0};
        REQUIRE(decode(view, x));
        CHECK(x == 0x400);
        CHECK(view.empty());
    }
    SECTION("leading zero rejected") {
        Bytes in{*from_hex("8200f4")};
        ByteView view{in};
        uint64_t x{0};
        const auto res{decode(view, x)};
        REQUIRE_FALSE(res);
        CHECK(res.error() == DecodingError::kLeadingZero);
    }
    SECTION("address") {
        const auto address{0x0000000000000000000000000000000000001000_address};
        Bytes encoded;
        encode(encoded, address);
        ByteView view{encoded};
        evmc::address decoded;
        REQUIRE(decode(view, decoded));
        CHECK(decoded == address);
    }
    SECTION("list payload and trailing items") {
        Bytes in{*from_hex("c88363617483646f67")};
        ByteView view{in};
        auto payload{decode_list(view)};
        REQUIRE(payload);
        CHECK(view.empty());
        Bytes cat, dog;
        REQUIRE(decode_items(*payload, cat, dog));
        CHECK(cat == Bytes{'c', 'a', 't'});
        CHECK(dog == Bytes{'d', 'o', 'g'});
        CHECK(payload->empty());
    }
    SECTION("truncated input") {
        Bytes in{*from_hex("c88363617483646f")};
        ByteView view{in};
        CHECK_FALSE(decode_list(view));
    }
}

}  // namespace quarry::rlp
