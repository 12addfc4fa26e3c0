// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "chain_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <quarry/core/test_util/sample_blocks.hpp>
#include <quarry/db/test_util/temp_store.hpp>

namespace quarry::db {

using namespace quarry::test_util;

TEST_CASE("ChainStore blocks round trip", "[db][chain_store]") {
    test_util::TempStore store;
    auto& chain{store.chain()};
    OperationContext ctx;

    CHECK_FALSE(chain.get_latest_height(ctx));
    CHECK_FALSE(chain.get_block(ctx, 0));

    const Block block{sample_block(0)};
    chain.set_block(ctx, block);

    SECTION("by height") {
        const auto read{chain.get_block(ctx, 0)};
        REQUIRE(read);
        CHECK(*read == block);
    }

    SECTION("by hash") {
        const auto read{chain.get_block_by_hash(ctx, block.header.hash)};
        REQUIRE(read);
        CHECK(*read == block);
        CHECK_FALSE(chain.get_block_by_hash(ctx, sample_block_hash(42)));
    }

    SECTION("transactions by hash") {
        for (uint32_t i{0}; i < block.transactions.size(); ++i) {
            const auto read{chain.get_transaction(ctx, block.transactions[i].hash)};
            REQUIRE(read);
            CHECK(read->first == block.transactions[i]);
            CHECK(read->second == TransactionLocation{0, block.header.hash, i});
        }
        CHECK(chain.has_transaction(ctx, block.transactions[0].hash));
        CHECK_FALSE(chain.has_transaction(ctx, sample_tx_hash(0, 99)));
    }

    SECTION("counters") {
        CHECK(chain.get_block_count(ctx) == 1);
        CHECK(chain.get_transaction_count(ctx) == 2);
        chain.set_block(ctx, block);  // idempotent
        CHECK(chain.get_block_count(ctx) == 1);
        CHECK(chain.get_transaction_count(ctx) == 2);
    }
}

TEST_CASE("ChainStore latest height follows contiguous writes", "[db][chain_store]") {
    test_util::TempStore store;
    auto& chain{store.chain()};
    OperationContext ctx;

    chain.set_block(ctx, sample_block(0));
    chain.set_block(ctx, sample_block(1));
    CHECK(chain.get_latest_height(ctx) == 1);

    // A gap stops the contiguous height
    chain.set_block(ctx, sample_block(3));
    CHECK(chain.get_latest_height(ctx) == 1);

    // Filling the gap catches up with the heights already stored
    chain.set_block(ctx, sample_block(2));
    CHECK(chain.get_latest_height(ctx) == 3);
    CHECK(chain.get_block_count(ctx) == 4);
}

TEST_CASE("ChainStore get_blocks", "[db][chain_store]") {
    test_util::TempStore store;
    auto& chain{store.chain()};
    OperationContext ctx;

    std::vector<Block> blocks;
    for (BlockNum n{0}; n < 5; ++n) {
        blocks.push_back(sample_block(n, 1));
    }
    chain.set_blocks(ctx, blocks);

    SECTION("inclusive ascending range") {
        const auto read{chain.get_blocks(ctx, 1, 3)};
        REQUIRE(read.size() == 3);
        CHECK(read[0].header.number == 1);
        CHECK(read[2].header.number == 3);
    }

    SECTION("deleted heights are skipped") {
        chain.delete_block(ctx, 2);
        const auto read{chain.get_blocks(ctx, 0, 4)};
        REQUIRE(read.size() == 4);
        for (const auto& block : read) {
            CHECK(block.header.number != 2);
        }
    }

    SECTION("inverted range") {
        CHECK_THROWS_AS(chain.get_blocks(ctx, 3, 1), Error);
    }

    SECTION("cancelled scan") {
        OperationContext cancelled;
        cancelled.cancel();
        try {
            (void)chain.get_blocks(cancelled, 0, 4);
            FAIL("expected cancellation");
        } catch (const Error& e) {
            CHECK(e.code() == ErrorCode::kCancelled);
        }
    }
}

TEST_CASE("ChainStore delete_block", "[db][chain_store]") {
    test_util::TempStore store;
    auto& chain{store.chain()};
    OperationContext ctx;

    const Block block0{sample_block(0)};
    const Block block1{sample_block(1)};
    chain.set_blocks(ctx, std::vector<Block>{block0, block1});
    chain.set_receipts(ctx, sample_receipts(block1));
    REQUIRE(chain.get_latest_height(ctx) == 1);

    chain.delete_block(ctx, 1);
    CHECK_FALSE(chain.get_block(ctx, 1));
    CHECK_FALSE(chain.has_block(ctx, 1));
    CHECK_FALSE(chain.get_block_by_hash(ctx, block1.header.hash));
    CHECK_FALSE(chain.get_transaction(ctx, block1.transactions[0].hash));
    CHECK_FALSE(chain.has_receipt(ctx, block1.transactions[0].hash));
    CHECK(chain.get_latest_height(ctx) == 0);
    CHECK(chain.get_block_count(ctx) == 1);
    CHECK(chain.get_transaction_count(ctx) == 2);

    try {
        chain.delete_block(ctx, 1);
        FAIL("expected NotFound");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::kNotFound);
    }

    chain.delete_block(ctx, 0);
    CHECK_FALSE(chain.get_latest_height(ctx));
    CHECK(chain.get_block_count(ctx) == 0);
    CHECK(chain.get_transaction_count(ctx) == 0);
}

TEST_CASE("ChainStore overwrite by height", "[db][chain_store]") {
    test_util::TempStore store;
    auto& chain{store.chain()};
    OperationContext ctx;

    const Block original{sample_block(7, 2)};
    chain.set_block(ctx, original);

    Block replacement{sample_block(7, 1)};
    replacement.header.hash = sample_hash(0xcc, 7);
    replacement.transactions[0].hash = sample_hash(0xdd, 7);
    chain.set_block(ctx, replacement);

    CHECK(chain.get_block(ctx, 7) == replacement);
    CHECK_FALSE(chain.get_block_by_hash(ctx, original.header.hash));
    CHECK(chain.get_block_by_hash(ctx, replacement.header.hash));
    CHECK_FALSE(chain.has_transaction(ctx, original.transactions[0].hash));
    CHECK_FALSE(chain.has_transaction(ctx, original.transactions[1].hash));
    CHECK(chain.get_block_count(ctx) == 1);
    CHECK(chain.get_transaction_count(ctx) == 1);
}

TEST_CASE("ChainStore batched transaction lookup", "[db][chain_store]") {
    test_util::TempStore store;
    auto& chain{store.chain()};
    OperationContext ctx;

    std::vector<Block> blocks;
    for (BlockNum n{0}; n < 4; ++n) {
        blocks.push_back(sample_block(n, 3));
    }
    chain.set_blocks(ctx, blocks);

    const std::vector<evmc::bytes32> hashes{
        sample_tx_hash(3, 2), sample_tx_hash(0, 0), sample_tx_hash(9, 9), sample_tx_hash(1, 1), sample_tx_hash(2, 0),
    };
    const auto results{chain.get_transactions(ctx, hashes)};
    REQUIRE(results.size() == hashes.size());
    for (size_t i{0}; i < hashes.size(); ++i) {
        if (i == 2) {
            CHECK_FALSE(results[i]);
            continue;
        }
        REQUIRE(results[i]);
        CHECK(results[i]->first.hash == hashes[i]);
    }
    CHECK(chain.get_transactions(ctx, {}).empty());
}

TEST_CASE("ChainStore receipts derive gas used and effective gas price", "[db][chain_store]") {
    test_util::TempStore store;
    auto& chain{store.chain()};
    OperationContext ctx;

    Block block{sample_block(5, 3)};
    block.transactions[1].type = TransactionType::kLegacy;
    block.transactions[1].max_fee_per_gas = 150;
    block.transactions[1].max_priority_fee_per_gas = 150;
    block.transactions[2].max_fee_per_gas = 110;
    chain.set_block(ctx, block);

    auto receipts{sample_receipts(block)};
    receipts[0].cumulative_gas_used = 21'000;
    receipts[1].cumulative_gas_used = 71'000;
    receipts[2].cumulative_gas_used = 100'000;
    chain.set_receipts(ctx, receipts);

    const auto read{chain.get_receipts_by_block_number(ctx, 5)};
    REQUIRE(read.size() == 3);
    CHECK(read[0].gas_used == 21'000);
    CHECK(read[1].gas_used == 50'000);
    CHECK(read[2].gas_used == 29'000);
    CHECK(read[0].gas_used + read[1].gas_used + read[2].gas_used == read[2].cumulative_gas_used);

    // base fee 100: min(100 + 20, 200), legacy gas price, min(100 + 20, 110)
    CHECK(read[0].effective_gas_price == 120);
    CHECK(read[1].effective_gas_price == 150);
    CHECK(read[2].effective_gas_price == 110);

    const auto single{chain.get_receipt(ctx, block.transactions[1].hash)};
    REQUIRE(single);
    CHECK(single->gas_used == 50'000);
    CHECK(single->tx_index == 1);
    CHECK(single->block_hash == block.header.hash);

    CHECK_FALSE(chain.get_receipt(ctx, sample_tx_hash(5, 9)));
}

TEST_CASE("ChainStore contract creation receipt", "[db][chain_store]") {
    test_util::TempStore store;
    auto& chain{store.chain()};
    OperationContext ctx;

    Block block{sample_block(1, 1)};
    block.transactions[0].to.reset();
    chain.set_block(ctx, block);

    auto receipts{sample_receipts(block)};
    receipts[0].contract_address = 0x5fbdb2315678afecb367f032d93f642f64180aa3_address;
    chain.set_receipts(ctx, receipts);

    const auto receipt{chain.get_receipt(ctx, block.transactions[0].hash)};
    REQUIRE(receipt);
    CHECK(receipt->contract_address == 0x5fbdb2315678afecb367f032d93f642f64180aa3_address);
}

}  // namespace quarry::db
