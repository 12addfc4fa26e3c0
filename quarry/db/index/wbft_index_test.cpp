// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "wbft_index.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <quarry/core/test_util/sample_blocks.hpp>
#include <quarry/db/test_util/temp_store.hpp>

namespace quarry::db {

using namespace quarry::test_util;

namespace {

    constexpr uint64_t kEpochLength{10};

    constexpr evmc::address kValidator0{0x00000000000000000000000000000000000000a0_address};
    constexpr evmc::address kValidator1{0x00000000000000000000000000000000000000a1_address};
    constexpr evmc::address kValidator2{0x00000000000000000000000000000000000000a2_address};

    EpochInfo sample_epoch(uint64_t epoch_num, BlockNum block_num) {
        return EpochInfo{
            .epoch_num = epoch_num,
            .block_num = block_num,
            .candidates = {{kValidator0, 1'000'000}, {kValidator1, 900'000}, {kValidator2, 800'000}},
            .validators = {0, 1, 2},
        };
    }

    ValidatorSigningActivity activity(const evmc::address& validator, uint32_t index, BlockNum block_num,
                                      bool prepare, bool commit) {
        return ValidatorSigningActivity{
            .block_num = block_num,
            .block_hash = sample_block_hash(block_num),
            .validator = validator,
            .validator_index = index,
            .signed_prepare = prepare,
            .signed_commit = commit,
            .timestamp = 1'700'000'000 + block_num * 12,
        };
    }

}  // namespace

TEST_CASE("WBFT block and epoch records", "[db][index][wbft]") {
    db::test_util::TempStore store;
    const auto& wbft{store.capabilities().wbft};
    REQUIRE(wbft);
    OperationContext ctx;

    WbftBlockRecord boundary{.block_num = 10, .block_hash = sample_block_hash(10), .round = 1};
    boundary.epoch_info = sample_epoch(1, 10);
    boundary.committed_seal = WbftAggregatedSeal{.sealers = {0x07}, .signature = Bytes(96, 0xab)};
    boundary.committed_signers = {kValidator0, kValidator1, kValidator2};
    {
        RWTxn txn{store.env()};
        wbft.writer->put_wbft_block(txn, boundary);
        wbft.writer->put_epoch_info(txn, *boundary.epoch_info);
        txn.commit();
    }

    CHECK(wbft.reader->get_wbft_block(ctx, 10) == boundary);
    CHECK_FALSE(wbft.reader->get_wbft_block(ctx, 11));
    CHECK(wbft.reader->get_epoch_info(ctx, 1) == boundary.epoch_info);
    CHECK_FALSE(wbft.reader->get_epoch_info(ctx, 0));
    CHECK(wbft.reader->get_latest_epoch_info(ctx) == boundary.epoch_info);

    SECTION("epoch in force") {
        ROTxn txn{store.env()};
        CHECK_FALSE(wbft.writer->find_epoch_in_force(txn, 5, kEpochLength));
        CHECK(wbft.writer->find_epoch_in_force(txn, 10, kEpochLength) == boundary.epoch_info);
        CHECK(wbft.writer->find_epoch_in_force(txn, 37, kEpochLength) == boundary.epoch_info);
        CHECK_THROWS_AS(wbft.writer->find_epoch_in_force(txn, 37, 0), Error);
    }
}

TEST_CASE("WBFT signing statistics", "[db][index][wbft]") {
    db::test_util::TempStore store;
    const auto& wbft{store.capabilities().wbft};
    REQUIRE(wbft);
    OperationContext ctx;

    const auto index_block = [&](BlockNum block_num, bool v2_signs) {
        RWTxn txn{store.env()};
        wbft.writer->put_wbft_block(txn, {.block_num = block_num, .block_hash = sample_block_hash(block_num)});
        wbft.writer->put_signing_activity(txn, activity(kValidator0, 0, block_num, true, true));
        wbft.writer->put_signing_activity(txn, activity(kValidator1, 1, block_num, true, false));
        wbft.writer->put_signing_activity(txn, activity(kValidator2, 2, block_num, v2_signs, v2_signs));
        txn.commit();
    };

    {
        RWTxn txn{store.env()};
        wbft.writer->put_epoch_info(txn, sample_epoch(0, 0));
        txn.commit();
    }
    index_block(1, true);
    index_block(2, false);
    index_block(3, true);

    const auto v1{wbft.reader->get_validator_stats(ctx, kValidator1)};
    REQUIRE(v1);
    CHECK(v1->prepare_sign_count == 3);
    CHECK(v1->commit_miss_count == 3);
    CHECK(v1->from_block == 1);
    CHECK(v1->to_block == 3);
    CHECK(v1->signing_rate() == 0.0);

    const auto v2{wbft.reader->get_validator_stats(ctx, kValidator2)};
    REQUIRE(v2);
    CHECK(v2->commit_sign_count == 2);
    CHECK(v2->commit_miss_count == 1);
    CHECK(v2->signing_rate() == Catch::Approx(66.6667).epsilon(0.001));

    CHECK(wbft.reader->get_all_validator_stats(ctx).size() == 3);
    CHECK(wbft.reader->count_validator_activity(ctx, kValidator0, {1, 3}) == 3);
    CHECK(wbft.reader->count_validator_activity(ctx, kValidator0, {2, 2}) == 1);

    const auto recent{wbft.reader->get_validator_activity(ctx, kValidator2, {1, 3}, {.limit = 2})};
    REQUIRE(recent.size() == 2);
    CHECK(recent[0].block_num == 3);
    CHECK(recent[1].block_num == 2);
    CHECK_FALSE(recent[1].signed_commit);

    CHECK_THROWS_AS(wbft.reader->get_validator_activity(ctx, kValidator0, {3, 1}, {}), Error);

    SECTION("replaying a block does not double count") {
        index_block(2, true);
        const auto replayed{wbft.reader->get_validator_stats(ctx, kValidator2)};
        REQUIRE(replayed);
        CHECK(replayed->commit_sign_count == 3);
        CHECK(replayed->commit_miss_count == 0);
        CHECK(wbft.reader->count_validator_activity(ctx, kValidator2, {1, 3}) == 3);
    }

    SECTION("erasing a block reverts its activity") {
        {
            RWTxn txn{store.env()};
            wbft.writer->erase_wbft_block(txn, 3, kEpochLength);
            txn.commit();
        }
        CHECK_FALSE(wbft.reader->get_wbft_block(ctx, 3));
        const auto stats{wbft.reader->get_validator_stats(ctx, kValidator2)};
        REQUIRE(stats);
        CHECK(stats->commit_sign_count == 1);
        CHECK(stats->commit_miss_count == 1);
        CHECK(stats->to_block == 2);
        CHECK(wbft.reader->count_validator_activity(ctx, kValidator0, {1, 3}) == 2);
    }

    SECTION("erasing every block drops the statistics") {
        RWTxn txn{store.env()};
        for (BlockNum n{3}; n >= 1; --n) {
            wbft.writer->erase_wbft_block(txn, n, kEpochLength);
        }
        txn.commit();
        CHECK(wbft.reader->get_all_validator_stats(ctx).empty());
        CHECK_FALSE(wbft.reader->get_validator_stats(ctx, kValidator0));
    }
}

}  // namespace quarry::db
