// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "setcode_index.hpp"

#include <catch2/catch_test_macros.hpp>

#include <quarry/core/test_util/sample_blocks.hpp>
#include <quarry/core/types/address.hpp>
#include <quarry/db/test_util/temp_store.hpp>

namespace quarry::db {

using namespace quarry::test_util;

namespace {

    constexpr evmc::address kDelegate{0x00000000000000000000000000000000de1e9a7e_address};
    constexpr evmc::address kOtherDelegate{0x0000000000000000000000000000000000ba5e00_address};

    SetCodeAuthorizationRecord authorization(BlockNum block_num, uint32_t auth_index, const evmc::address& target,
                                             std::optional<evmc::address> authority, bool applied = true) {
        SetCodeAuthorizationRecord record{
            .tx_hash = sample_tx_hash(block_num, 0),
            .block_num = block_num,
            .block_hash = sample_block_hash(block_num),
            .tx_index = 0,
            .auth_index = auth_index,
            .target = target,
            .authority = authority,
            .chain_id = 1,
            .nonce = block_num,
            .applied = applied,
        };
        if (!applied) {
            record.error = authority ? "nonce_mismatch" : "invalid_signature";
        }
        return record;
    }

}  // namespace

TEST_CASE("Set-code authorizations", "[db][index][set_code]") {
    db::test_util::TempStore store;
    const auto& set_code{store.capabilities().set_code};
    REQUIRE(set_code);
    OperationContext ctx;

    const auto put = [&](const SetCodeAuthorizationRecord& record) {
        RWTxn txn{store.env()};
        set_code.writer->put_set_code_authorization(txn, record);
        txn.commit();
    };
    const auto erase = [&](const SetCodeAuthorizationRecord& record) {
        RWTxn txn{store.env()};
        set_code.writer->erase_set_code_authorization(txn, record);
        txn.commit();
    };

    const auto first{authorization(2, 0, kDelegate, kSampleSender)};
    const auto rejected{authorization(2, 1, kOtherDelegate, kSampleRecipient, false)};
    const auto unrecovered{authorization(2, 2, kOtherDelegate, std::nullopt, false)};
    const auto second{authorization(5, 0, kOtherDelegate, kSampleSender)};
    put(first);
    put(rejected);
    put(unrecovered);
    put(second);

    SECTION("lookups") {
        CHECK(set_code.reader->get_set_code_authorization(ctx, first.tx_hash, 1) == rejected);
        CHECK(set_code.reader->get_set_code_authorizations(ctx, first.tx_hash).size() == 3);
        CHECK(set_code.reader->count_set_code_authorizations_by_target(ctx, kOtherDelegate) == 3);
        CHECK(set_code.reader->count_set_code_authorizations_by_authority(ctx, kSampleSender) == 2);
        // No authority index entry when recovery failed
        CHECK(set_code.reader->count_set_code_authorizations_by_authority(ctx, kZeroAddress) == 0);

        const auto by_authority{set_code.reader->get_set_code_authorizations_by_authority(ctx, kSampleSender, {})};
        REQUIRE(by_authority.size() == 2);
        CHECK(by_authority[0] == second);
        CHECK(by_authority[1] == first);
    }

    SECTION("delegation state follows applied authorizations only") {
        const auto state{set_code.reader->get_delegation_state(ctx, kSampleSender)};
        REQUIRE(state);
        CHECK(state->target == kOtherDelegate);
        CHECK(state->last_updated_block == 5);
        CHECK_FALSE(set_code.reader->get_delegation_state(ctx, kSampleRecipient));
    }

    SECTION("an older authorization does not override a newer state") {
        put(authorization(3, 0, kDelegate, kSampleSender));
        const auto state{set_code.reader->get_delegation_state(ctx, kSampleSender)};
        REQUIRE(state);
        CHECK(state->target == kOtherDelegate);
    }

    SECTION("delegating to the zero address clears the delegation") {
        put(authorization(6, 0, kZeroAddress, kSampleSender));
        const auto state{set_code.reader->get_delegation_state(ctx, kSampleSender)};
        REQUIRE(state);
        CHECK_FALSE(state->has_delegation());
        CHECK(state->last_updated_block == 6);
    }

    SECTION("erase restores the previous delegation") {
        erase(second);
        const auto state{set_code.reader->get_delegation_state(ctx, kSampleSender)};
        REQUIRE(state);
        CHECK(state->target == kDelegate);
        CHECK(state->last_updated_block == 2);

        erase(first);
        CHECK_FALSE(set_code.reader->get_delegation_state(ctx, kSampleSender));
        CHECK(set_code.reader->count_set_code_authorizations_by_authority(ctx, kSampleSender) == 0);
    }

    SECTION("stats") {
        const auto target_stats{set_code.reader->get_set_code_stats(ctx, kOtherDelegate)};
        CHECK(target_stats.as_target_count == 3);
        CHECK(target_stats.as_authority_count == 0);
        CHECK(target_stats.last_activity_block == 5);
        CHECK_FALSE(target_stats.current_delegation);

        const auto authority_stats{set_code.reader->get_set_code_stats(ctx, kSampleSender)};
        CHECK(authority_stats.as_authority_count == 2);
        CHECK(authority_stats.current_delegation == kOtherDelegate);
    }
}

}  // namespace quarry::db
