// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <catch2/catch_test_macros.hpp>
#include <evmc/evmc.hpp>

#include <quarry/core/common/util.hpp>
#include <quarry/core/crypto/secp256k1_context.hpp>
#include <quarry/core/rlp/encode.hpp>

namespace quarry {

using evmc::literals::operator""_address, evmc::literals::operator""_bytes32;

TEST_CASE("Effective gas price", "[core][types]") {
    Transaction txn;
    txn.type = TransactionType::kDynamicFee;
    txn.max_priority_fee_per_gas = 20;

    SECTION("fee cap below base fee plus tip") {
        txn.max_fee_per_gas = 110;
        CHECK(txn.effective_gas_price(intx::uint256{100}) == 110);
    }
    SECTION("fee cap above base fee plus tip") {
        txn.max_fee_per_gas = 200;
        CHECK(txn.effective_gas_price(intx::uint256{100}) == 120);
    }
    SECTION("no base fee") {
        txn.max_fee_per_gas = 200;
        CHECK(txn.effective_gas_price(std::nullopt) == 200);
    }
    SECTION("fee delegated transactions follow the fee market") {
        txn.type = TransactionType::kFeeDelegateDynamicFee;
        txn.max_fee_per_gas = 200;
        CHECK(txn.effective_gas_price(intx::uint256{100}) == 120);
    }
    SECTION("legacy uses the gas price") {
        txn.type = TransactionType::kLegacy;
        txn.max_fee_per_gas = 30;
        txn.max_priority_fee_per_gas = 30;
        CHECK(txn.effective_gas_price(intx::uint256{100}) == 30);
    }
}

TEST_CASE("Transaction storage encoding", "[core][types]") {
    Transaction txn;
    txn.type = TransactionType::kSetCode;
    txn.hash = 0x6d2ea3e9b1a1f0b8d4b0e1d4c7e5ab8d9a3f8e1b2c4d5e6f708192a3b4c5d6e7_bytes32;
    txn.chain_id = 1;
    txn.nonce = 7;
    txn.from = 0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f_address;
    txn.value = intx::from_string<intx::uint256>("1000000000000000000");
    txn.gas_limit = 21'000;
    txn.max_priority_fee_per_gas = 2;
    txn.max_fee_per_gas = 50;
    txn.data = *from_hex("0xdeadbeef");
    txn.r = 11;
    txn.s = 13;
    txn.access_list.push_back({0xde0b295669a9fd93d5f28d9ec85e40f4cb697bae_address,
                               {0x0000000000000000000000000000000000000000000000000000000000000003_bytes32}});
    txn.authorizations.push_back({.chain_id = 1,
                                  .address = 0x5a0b54d5dc17e0aadc383d2db43b0a0d3e029c4c_address,
                                  .nonce = 3,
                                  .y_parity = 1,
                                  .r = 5,
                                  .s = 6});
    txn.fee_payer = 0x1000000000000000000000000000000000000001_address;

    Bytes encoded;
    rlp::encode(encoded, txn);

    Transaction decoded;
    ByteView view{encoded};
    REQUIRE(rlp::decode(view, decoded));
    CHECK(view.empty());
    CHECK(decoded == txn);
    CHECK(!decoded.is_contract_creation());

    SECTION("unsupported type is rejected") {
        Transaction bogus{txn};
        Bytes bad;
        rlp::encode(bad, bogus);
        // First payload item is the type byte
        ByteView header_view{bad};
        REQUIRE(rlp::decode_header(header_view));
        bad[bad.size() - header_view.size()] = 0x42;
        ByteView bad_view{bad};
        const auto res{rlp::decode(bad_view, bogus)};
        REQUIRE(!res);
        CHECK(res.error() == DecodingError::kUnsupportedTransactionType);
    }
}

TEST_CASE("Authorization recovery", "[core][types]") {
    // EIP-155 example private key
    const Bytes private_key{*from_hex("0x4646464646464646464646464646464646464646464646464646464646464646")};
    const auto expected_authority{0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f_address};

    Authorization authorization{.chain_id = 1, .address = 0x5a0b54d5dc17e0aadc383d2db43b0a0d3e029c4c_address, .nonce = 0};

    SecP256K1Context context{/*allow_verify=*/true, /*allow_sign=*/true};
    const evmc::bytes32 hash{authorization.signing_hash()};
    secp256k1_ecdsa_recoverable_signature signature;
    REQUIRE(context.sign_recoverable(&signature, hash.bytes, private_key));
    const auto [compact, recovery_id]{context.serialize_recoverable_signature(&signature)};
    authorization.r = intx::be::unsafe::load<intx::uint256>(compact.data());
    authorization.s = intx::be::unsafe::load<intx::uint256>(compact.data() + kHashLength);
    authorization.y_parity = recovery_id;

    SECTION("valid signature") {
        CHECK(is_valid_signature(authorization.r, authorization.s));
        CHECK(authorization.recover_authority() == expected_authority);
    }
    SECTION("tampered payload recovers a different signer") {
        authorization.nonce = 1;
        CHECK(authorization.recover_authority() != expected_authority);
    }
    SECTION("bad y parity") {
        authorization.y_parity = 2;
        CHECK(!authorization.recover_authority());
    }
    SECTION("zero signature") {
        authorization.r = 0;
        authorization.s = 0;
        CHECK(!is_valid_signature(authorization.r, authorization.s));
        CHECK(!authorization.recover_authority());
    }
}

}  // namespace quarry
