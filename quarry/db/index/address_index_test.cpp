// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "address_index.hpp"

#include <catch2/catch_test_macros.hpp>

#include <quarry/core/test_util/sample_blocks.hpp>
#include <quarry/db/test_util/temp_store.hpp>

namespace quarry::db {

using namespace quarry::test_util;

TEST_CASE("Address index", "[db][index][address]") {
    db::test_util::TempStore store;
    const auto& address{store.capabilities().address};
    REQUIRE(address);
    OperationContext ctx;

    {
        RWTxn txn{store.env()};
        for (BlockNum n{1}; n <= 3; ++n) {
            for (uint32_t i{0}; i < 2; ++i) {
                address.writer->put_address_transaction(txn, {kSampleSender, n, i, sample_tx_hash(n, i)});
            }
        }
        address.writer->put_address_transaction(txn, {kSampleRecipient, 2, 1, sample_tx_hash(2, 1)});
        txn.commit();
    }

    CHECK(address.reader->count_address_transactions(ctx, kSampleSender) == 6);
    CHECK(address.reader->count_address_transactions(ctx, kSampleRecipient) == 1);
    CHECK(address.reader->count_address_transactions(ctx, kSampleMiner) == 0);

    SECTION("newest first") {
        const auto page{address.reader->get_address_transactions(ctx, kSampleSender, {.offset = 0, .limit = 3})};
        REQUIRE(page.size() == 3);
        CHECK(page[0] == AddressTransaction{kSampleSender, 3, 1, sample_tx_hash(3, 1)});
        CHECK(page[1] == AddressTransaction{kSampleSender, 3, 0, sample_tx_hash(3, 0)});
        CHECK(page[2] == AddressTransaction{kSampleSender, 2, 1, sample_tx_hash(2, 1)});
    }

    SECTION("oldest first with offset") {
        const auto page{address.reader->get_address_transactions(
            ctx, kSampleSender, {.offset = 4, .limit = 10, .newest_first = false})};
        REQUIRE(page.size() == 2);
        CHECK(page[0].block_num == 3);
        CHECK(page[0].tx_index == 0);
        CHECK(page[1].tx_index == 1);
    }

    SECTION("no bleeding into a neighbour address") {
        const auto page{address.reader->get_address_transactions(ctx, kSampleRecipient, {})};
        REQUIRE(page.size() == 1);
        CHECK(page[0].tx_hash == sample_tx_hash(2, 1));
    }

    SECTION("erase") {
        RWTxn txn{store.env()};
        address.writer->erase_address_transaction(txn, {kSampleSender, 3, 0, sample_tx_hash(3, 0)});
        txn.commit();
        CHECK(address.reader->count_address_transactions(ctx, kSampleSender) == 5);
    }
}

}  // namespace quarry::db
