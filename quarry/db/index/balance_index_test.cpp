// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "balance_index.hpp"

#include <catch2/catch_test_macros.hpp>

#include <quarry/core/test_util/sample_blocks.hpp>
#include <quarry/db/test_util/temp_store.hpp>
#include <quarry/infra/test_util/log.hpp>

namespace quarry::db {

using namespace quarry::test_util;

namespace {

    BalanceEntry snapshot(BlockNum block_num, const intx::uint256& balance) {
        return BalanceEntry{
            .address = kSampleSender,
            .block_num = block_num,
            .sequence = 0,
            .kind = BalanceEntry::Kind::kSnapshot,
            .amount = balance,
        };
    }

    BalanceEntry delta(BlockNum block_num, uint32_t sequence, bool negative, const intx::uint256& amount) {
        return BalanceEntry{
            .address = kSampleSender,
            .block_num = block_num,
            .sequence = sequence,
            .kind = BalanceEntry::Kind::kDelta,
            .negative = negative,
            .amount = amount,
            .tx_hash = sample_tx_hash(block_num, (sequence - 1) / 2),
        };
    }

}  // namespace

TEST_CASE("Balance history with a snapshot", "[db][index][balance]") {
    db::test_util::TempStore store;
    const auto& balances{store.capabilities().balance_history};
    REQUIRE(balances);
    OperationContext ctx;

    {
        RWTxn txn{store.env()};
        CHECK_FALSE(balances.writer->has_balance_history(txn, kSampleSender));
        balances.writer->put_balance_entry(txn, snapshot(5, 1'000));
        balances.writer->put_balance_entry(txn, delta(5, 1, true, 300));
        balances.writer->put_balance_entry(txn, delta(7, 2, false, 50));
        balances.writer->put_balance_entry(txn, delta(9, 1, true, 25));
        CHECK(balances.writer->has_balance_history(txn, kSampleSender));
        CHECK_FALSE(balances.writer->has_balance_history(txn, kSampleRecipient));
        txn.commit();
    }

    SECTION("point in time") {
        CHECK(balances.reader->get_balance(ctx, kSampleSender, 4) == 0);
        CHECK(balances.reader->get_balance(ctx, kSampleSender, 5) == 700);
        CHECK(balances.reader->get_balance(ctx, kSampleSender, 6) == 700);
        CHECK(balances.reader->get_balance(ctx, kSampleSender, 7) == 750);
        CHECK(balances.reader->get_balance(ctx, kSampleSender, 100) == 725);
        CHECK(balances.reader->get_balance(ctx, kSampleRecipient, 100) == 0);
    }

    SECTION("history oldest first") {
        const auto history{
            balances.reader->get_balance_history(ctx, kSampleSender, {0, 100}, {.newest_first = false})};
        REQUIRE(history.size() == 4);
        CHECK(history[0].balance == 1'000);
        CHECK(history[0].delta == 0);
        CHECK(history[1].balance == 700);
        CHECK(history[1].negative_delta);
        CHECK(history[1].delta == 300);
        CHECK(history[2].balance == 750);
        CHECK(history[3].balance == 725);
        CHECK(history[3].block_num == 9);
    }

    SECTION("page in the middle of the history, newest first") {
        const auto history{
            balances.reader->get_balance_history(ctx, kSampleSender, {0, 100}, {.offset = 1, .limit = 2})};
        REQUIRE(history.size() == 2);
        CHECK(history[0].block_num == 7);
        CHECK(history[0].balance == 750);
        CHECK(history[1].block_num == 5);
        CHECK(history[1].balance == 700);
    }

    SECTION("range bounds") {
        CHECK(balances.reader->count_balance_history(ctx, kSampleSender, {0, 100}) == 4);
        CHECK(balances.reader->count_balance_history(ctx, kSampleSender, {6, 8}) == 1);
        CHECK(balances.reader->get_balance_history(ctx, kSampleSender, {10, 20}, {}).empty());
        CHECK_THROWS_AS(balances.reader->count_balance_history(ctx, kSampleSender, {8, 6}), Error);
    }

    SECTION("erase the entries of one block") {
        RWTxn txn{store.env()};
        balances.writer->erase_balance_entries(txn, kSampleSender, 5);
        txn.commit();
        CHECK(balances.reader->count_balance_history(ctx, kSampleSender, {0, 100}) == 2);
        CHECK(balances.reader->get_balance(ctx, kSampleSender, 7) == 50);
    }
}

TEST_CASE("Balance history without snapshot", "[db][index][balance]") {
    db::test_util::TempStore store;
    const auto& balances{store.capabilities().balance_history};
    REQUIRE(balances);
    OperationContext ctx;

    {
        RWTxn txn{store.env()};
        balances.writer->put_balance_entry(txn, delta(1, 2, false, 100));
        balances.writer->put_balance_entry(txn, delta(2, 1, true, 30));
        txn.commit();
    }
    CHECK(balances.reader->get_balance(ctx, kSampleSender, 1) == 100);
    CHECK(balances.reader->get_balance(ctx, kSampleSender, 2) == 70);

    SECTION("a negative running balance is reported as zero") {
        SetLogVerbosityGuard guard{log::Level::kNone};
        {
            RWTxn txn{store.env()};
            balances.writer->put_balance_entry(txn, delta(3, 1, true, 500));
            balances.writer->put_balance_entry(txn, delta(4, 2, false, 1'000));
            txn.commit();
        }
        CHECK(balances.reader->get_balance(ctx, kSampleSender, 3) == 0);
        CHECK(balances.reader->get_balance(ctx, kSampleSender, 4) == 570);

        const auto history{
            balances.reader->get_balance_history(ctx, kSampleSender, {3, 4}, {.newest_first = false})};
        REQUIRE(history.size() == 2);
        CHECK(history[0].balance == 0);
        CHECK(history[1].balance == 570);
    }
}

}  // namespace quarry::db
