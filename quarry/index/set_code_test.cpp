// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "set_code.hpp"

#include <limits>

#include <catch2/catch_test_macros.hpp>

#include <quarry/core/test_util/sample_authorization.hpp>
#include <quarry/core/test_util/sample_blocks.hpp>

namespace quarry::index {

using namespace quarry::test_util;

namespace {

    const evmc::address kDelegate{0x5a0b54d5dc17e0aadc383d2db43b0a0d3e029c4c_address};

    Transaction set_code_transaction(std::vector<Authorization> authorizations) {
        Transaction txn{sample_transaction(3, 0)};
        txn.type = TransactionType::kSetCode;
        txn.authorizations = std::move(authorizations);
        return txn;
    }

}  // namespace

TEST_CASE("validate_authorization", "[index][set_code]") {
    Authorization authorization{sample_authorization(kDelegate)};
    CHECK(validate_authorization(authorization, 1).empty());

    SECTION("chain id") {
        CHECK(validate_authorization(authorization, 5) == kSetCodeErrWrongChainId);
        authorization.chain_id = 0;
        CHECK(validate_authorization(authorization, 5).empty());
    }

    SECTION("first failing rule wins") {
        authorization.nonce = std::numeric_limits<uint64_t>::max();
        authorization.r = 0;
        CHECK(validate_authorization(authorization, 1) == kSetCodeErrNonceOverflow);
        authorization.nonce = 0;
        CHECK(validate_authorization(authorization, 1) == kSetCodeErrInvalidSignature);
    }
}

TEST_CASE("make_set_code_records", "[index][set_code]") {
    const Block block{sample_block(3, 1)};
    const TransactionLocation location{3, block.header.hash, 0};
    Receipt receipt{sample_receipts(block)[0]};

    SECTION("not a set-code transaction") {
        Transaction txn{sample_transaction(3, 0)};
        txn.authorizations = {sample_authorization(kDelegate)};
        CHECK(make_set_code_records(txn, location, &receipt, 10).empty());
    }

    SECTION("valid authorization of a successful transaction") {
        const Transaction txn{set_code_transaction({sample_authorization(kDelegate)})};
        const auto records{make_set_code_records(txn, location, &receipt, 10)};
        REQUIRE(records.size() == 1);
        CHECK(records[0].tx_hash == txn.hash);
        CHECK(records[0].block_num == 3);
        CHECK(records[0].auth_index == 0);
        CHECK(records[0].target == kDelegate);
        CHECK(records[0].authority == kSampleAuthority);
        CHECK(records[0].applied);
        CHECK(records[0].error.empty());
        CHECK(records[0].timestamp == 10);
    }

    SECTION("failed transaction") {
        receipt.success = false;
        const auto records{make_set_code_records(set_code_transaction({sample_authorization(kDelegate)}), location,
                                                 &receipt, 10)};
        REQUIRE(records.size() == 1);
        CHECK(records[0].authority == kSampleAuthority);
        CHECK_FALSE(records[0].applied);
        CHECK(records[0].error.empty());
    }

    SECTION("unrecoverable signature is still recorded") {
        Authorization broken{sample_authorization(kDelegate)};
        broken.y_parity = 2;
        const auto records{make_set_code_records(
            set_code_transaction({sample_authorization(kDelegate, 1, 1), broken}), location, &receipt, 10)};
        REQUIRE(records.size() == 2);
        CHECK(records[0].applied);
        CHECK(records[0].nonce == 1);
        CHECK(records[1].auth_index == 1);
        CHECK_FALSE(records[1].authority);
        CHECK_FALSE(records[1].applied);
        CHECK(records[1].error == kSetCodeErrRecoveryFailed);
    }

    SECTION("wrong chain") {
        const auto records{make_set_code_records(set_code_transaction({sample_authorization(kDelegate, 7)}),
                                                 location, &receipt, 10)};
        REQUIRE(records.size() == 1);
        CHECK(records[0].authority == kSampleAuthority);
        CHECK_FALSE(records[0].applied);
        CHECK(records[0].error == kSetCodeErrWrongChainId);
    }
}

}  // namespace quarry::index
