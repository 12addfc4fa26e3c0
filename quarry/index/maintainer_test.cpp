// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "maintainer.hpp"

#include <chrono>
#include <thread>
#include <utility>

#include <catch2/catch_test_macros.hpp>

#include <quarry/core/common/error.hpp>
#include <quarry/core/test_util/sample_blocks.hpp>
#include <quarry/db/test_util/temp_store.hpp>
#include <quarry/index/wbft_extra.hpp>
#include <quarry/infra/test_util/log.hpp>

namespace quarry::index {

using namespace std::chrono_literals;
using namespace quarry::test_util;

namespace {

    constexpr evmc::address kSampleNft{0x00000000000000000000000000000000000000ee_address};

    constexpr evmc::address kValidator0{0x00000000000000000000000000000000000000a0_address};
    constexpr evmc::address kValidator1{0x00000000000000000000000000000000000000a1_address};
    constexpr evmc::address kValidator2{0x00000000000000000000000000000000000000a2_address};

    struct SampleHeight {
        Block block;
        std::vector<Receipt> receipts;
    };

    //! \brief Two value transfers, the first moving 500 ERC20 tokens, the second moving NFT #7
    SampleHeight sample_height(BlockNum block_num) {
        SampleHeight height{.block = sample_block(block_num)};
        height.receipts = sample_receipts(height.block);
        height.receipts[0].logs = {
            erc20_transfer_log(height.receipts[0], 0, kSampleToken, kSampleSender, kSampleRecipient, 500)};
        height.receipts[1].logs = {
            erc721_transfer_log(height.receipts[1], 1, kSampleNft, kSampleSender, kSampleRecipient, 7)};
        return height;
    }

    Bytes wbft_extra(Bytes committed, bool announce_epoch) {
        WbftExtra extra;
        extra.vanity = Bytes(kWbftVanityLength, 0);
        extra.randao_reveal = Bytes(96, 0xaa);
        extra.prepared_seal = db::WbftAggregatedSeal{Bytes{0x07}, Bytes(96, 0xbb)};
        extra.committed_seal = db::WbftAggregatedSeal{std::move(committed), Bytes(96, 0xcc)};
        extra.gas_tip = 1'000;
        if (announce_epoch) {
            extra.epoch = WbftEpochAnnouncement{
                .candidates = {{kValidator0, 1'000'000}, {kValidator1, 1'000'000}, {kValidator2, 1'000'000}},
                .validators = {0, 1, 2},
                .bls_public_keys = {Bytes(48, 0x01), Bytes(48, 0x02), Bytes(48, 0x03)},
            };
        }
        return encode_wbft_extra(extra);
    }

    bool wait_for_pending(const events::Subscription& subscription, size_t count) {
        for (int i{0}; i < 5'000; ++i) {
            if (subscription.pending() >= count) {
                return true;
            }
            std::this_thread::sleep_for(1ms);
        }
        return false;
    }

}  // namespace

TEST_CASE("IndexMaintainer ingest", "[index][maintainer]") {
    db::test_util::TempStore store;
    LogDecoder decoder{SignatureRegistry::defaults()};
    IndexMaintainer maintainer{*store, decoder};
    OperationContext ctx;
    const auto& caps{store.capabilities()};

    CHECK_FALSE(maintainer.indexed_height(ctx));

    const auto height{sample_height(0)};
    maintainer.ingest(ctx, height.block, height.receipts);

    CHECK(store.chain().get_block(ctx, 0) == height.block);
    CHECK(store.chain().get_latest_height(ctx) == 0);
    CHECK(maintainer.indexed_height(ctx) == 0);
    const auto receipt{store.chain().get_receipt(ctx, height.block.transactions[1].hash)};
    REQUIRE(receipt);
    CHECK(receipt->gas_used == 21'000);
    CHECK(receipt->logs.size() == 1);

    CHECK(caps.address.reader->count_address_transactions(ctx, kSampleSender) == 2);
    CHECK(caps.address.reader->count_address_transactions(ctx, kSampleRecipient) == 2);
    CHECK(caps.tokens.reader->count_erc20_transfers_by_token(ctx, kSampleToken) == 1);
    const auto owner{caps.tokens.reader->get_nft_owner(ctx, kSampleNft, 7)};
    REQUIRE(owner);
    CHECK(owner->owner == kSampleRecipient);

    SECTION("re-ingesting the same height is idempotent") {
        maintainer.ingest(ctx, height.block, height.receipts);
        CHECK(caps.address.reader->count_address_transactions(ctx, kSampleSender) == 2);
        CHECK(caps.tokens.reader->count_erc20_transfers_by_token(ctx, kSampleToken) == 1);
        CHECK(caps.tokens.reader->count_nfts_by_owner(ctx, kSampleRecipient) == 1);
        CHECK(caps.balance_history.reader->get_balance(ctx, kSampleRecipient, 0) == 2'000);
        CHECK(store.chain().get_transaction_count(ctx) == 2);
    }

    SECTION("receipts are accepted in any order") {
        auto next{sample_height(1)};
        std::swap(next.receipts[0], next.receipts[1]);
        maintainer.ingest(ctx, next.block, next.receipts);
        CHECK(maintainer.indexed_height(ctx) == 1);
        CHECK(store.chain().get_receipts_by_block_number(ctx, 1)[0].tx_hash == next.block.transactions[0].hash);
    }

    SECTION("overwriting a height drops the records of the replaced block") {
        Block replacement{sample_block(0, 0)};
        replacement.header.hash = sample_hash(0xf0, 0);
        maintainer.ingest(ctx, replacement, {});

        CHECK(store.chain().get_block(ctx, 0) == replacement);
        CHECK(maintainer.indexed_height(ctx) == 0);
        CHECK(caps.address.reader->count_address_transactions(ctx, kSampleSender) == 0);
        CHECK(caps.tokens.reader->count_erc20_transfers_by_token(ctx, kSampleToken) == 0);
        CHECK_FALSE(caps.tokens.reader->get_nft_owner(ctx, kSampleNft, 7));
        CHECK(caps.balance_history.reader->get_balance(ctx, kSampleRecipient, 0) == 0);
    }
}

TEST_CASE("IndexMaintainer rejects mismatching receipts", "[index][maintainer]") {
    db::test_util::TempStore store;
    LogDecoder decoder{SignatureRegistry::defaults()};
    IndexMaintainer maintainer{*store, decoder};
    OperationContext ctx;

    auto height{sample_height(0)};
    auto expect_invalid = [&](std::vector<Receipt> receipts) {
        try {
            maintainer.ingest(ctx, height.block, std::move(receipts));
            FAIL("expected InvalidInput");
        } catch (const Error& e) {
            CHECK(e.code() == ErrorCode::kInvalidInput);
        }
    };

    expect_invalid({height.receipts[0]});
    expect_invalid({height.receipts[0], height.receipts[0]});
    auto foreign{height.receipts};
    foreign[1].tx_hash = sample_tx_hash(99, 0);
    expect_invalid(foreign);

    // nothing was written
    CHECK_FALSE(store.chain().has_block(ctx, 0));
    CHECK_FALSE(maintainer.indexed_height(ctx));
}

TEST_CASE("IndexMaintainer requires an initialized decoder", "[index][maintainer]") {
    db::test_util::TempStore store;
    LogDecoder uninitialized;
    IndexMaintainer not_ready{*store, uninitialized};
    OperationContext ctx;

    const auto height{sample_height(0)};
    CHECK_THROWS_AS(not_ready.ingest(ctx, height.block, height.receipts), Error);
}

TEST_CASE("IndexMaintainer is the only eraser of its store", "[index][maintainer]") {
    db::test_util::TempStore store;
    LogDecoder decoder{SignatureRegistry::defaults()};
    {
        IndexMaintainer first{*store, decoder};
        try {
            IndexMaintainer second{*store, decoder};
            FAIL("expected InvalidInput");
        } catch (const Error& e) {
            CHECK(e.code() == ErrorCode::kInvalidInput);
        }
    }
    // the slot is free again once the first maintainer is gone
    CHECK_NOTHROW(IndexMaintainer{*store, decoder});
}

TEST_CASE("Chain store changes cascade to the indexes", "[index][maintainer]") {
    db::test_util::TempStore store;
    LogDecoder decoder{SignatureRegistry::defaults()};
    OperationContext ctx;
    const auto& caps{store.capabilities()};

    auto height{sample_height(0)};
    height.receipts[0].logs.push_back(sample_log(height.receipts[0], 2, kNativeCoinAdapter,
                                                 {event_topic("Mint(address,address,uint256)"),
                                                  address_topic(kSampleSender), address_topic(kSampleRecipient)},
                                                 uint256_word(250)));
    const BlockNumRange all_heights{0, 10};

    auto expect_indexed = [&] {
        CHECK(caps.address.reader->count_address_transactions(ctx, kSampleSender) == 2);
        CHECK(caps.tokens.reader->count_erc20_transfers_by_token(ctx, kSampleToken) == 1);
        CHECK(caps.system_contracts.reader->count_system_events(ctx, db::SystemEventKind::kMint, all_heights) == 1);
        CHECK(caps.system_contracts.reader->get_total_supply(ctx) == 250);
    };
    auto expect_erased = [&] {
        CHECK(caps.address.reader->get_address_transactions(ctx, kSampleSender, {}).empty());
        CHECK(caps.address.reader->count_address_transactions(ctx, kSampleRecipient) == 0);
        CHECK(caps.tokens.reader->get_erc20_transfers_by_token(ctx, kSampleToken, {}).empty());
        CHECK_FALSE(caps.tokens.reader->get_nft_owner(ctx, kSampleNft, 7));
        CHECK(caps.system_contracts.reader->count_system_events(ctx, db::SystemEventKind::kMint, all_heights) == 0);
        CHECK(caps.system_contracts.reader->get_total_supply(ctx) == 0);
    };

    SECTION("deleting an indexed block") {
        IndexMaintainer maintainer{*store, decoder};
        maintainer.ingest(ctx, height.block, height.receipts);
        expect_indexed();

        store.chain().delete_block(ctx, 0);
        CHECK_FALSE(store.chain().has_block(ctx, 0));
        CHECK_FALSE(maintainer.indexed_height(ctx));
        expect_erased();
    }

    SECTION("overwriting an indexed block") {
        IndexMaintainer maintainer{*store, decoder};
        maintainer.ingest(ctx, height.block, height.receipts);

        Block replacement{sample_block(0, 0)};
        replacement.header.hash = sample_hash(0xf3, 0);
        store.chain().set_block(ctx, replacement);
        CHECK(store.chain().get_block(ctx, 0) == replacement);
        CHECK_FALSE(maintainer.indexed_height(ctx));
        expect_erased();

        // the replacement is indexed on demand
        maintainer.reindex(ctx, 0);
        CHECK(maintainer.indexed_height(ctx) == 0);
        CHECK(caps.address.reader->count_address_transactions(ctx, kSampleSender) == 0);
    }

    SECTION("overwriting a receipt of an indexed block") {
        IndexMaintainer maintainer{*store, decoder};
        maintainer.ingest(ctx, height.block, height.receipts);

        auto receipt{height.receipts[0]};
        receipt.logs.clear();
        store.chain().set_receipt(ctx, receipt);
        CHECK_FALSE(maintainer.indexed_height(ctx));
        expect_erased();

        maintainer.reindex(ctx, 0);
        CHECK(caps.address.reader->count_address_transactions(ctx, kSampleSender) == 2);
        CHECK(caps.tokens.reader->count_erc20_transfers_by_token(ctx, kSampleToken) == 0);
        CHECK(caps.system_contracts.reader->get_total_supply(ctx) == 0);
        const auto owner{caps.tokens.reader->get_nft_owner(ctx, kSampleNft, 7)};
        REQUIRE(owner);
        CHECK(owner->owner == kSampleRecipient);
    }

    SECTION("indexed heights are refused without a maintainer") {
        {
            IndexMaintainer maintainer{*store, decoder};
            maintainer.ingest(ctx, height.block, height.receipts);
        }
        try {
            store.chain().delete_block(ctx, 0);
            FAIL("expected InvalidInput");
        } catch (const Error& e) {
            CHECK(e.code() == ErrorCode::kInvalidInput);
        }
        CHECK_THROWS_AS(store.chain().set_block(ctx, sample_block(0, 0)), Error);
        CHECK(store.chain().get_block(ctx, 0) == height.block);
        CHECK(store.chain().get_indexed_height(ctx) == 0);
        expect_indexed();

        // heights that were never indexed stay writable
        store.chain().set_block(ctx, sample_block(1));
        store.chain().delete_block(ctx, 1);
        CHECK_FALSE(store.chain().has_block(ctx, 1));
    }
}

TEST_CASE("IndexMaintainer skips undecodable logs", "[index][maintainer]") {
    SetLogVerbosityGuard log_guard{log::Level::kNone};
    db::test_util::TempStore store;
    LogDecoder decoder{SignatureRegistry::defaults()};
    IndexMaintainer maintainer{*store, decoder};
    OperationContext ctx;

    auto height{sample_height(0)};
    // ERC20 shape without the value word
    height.receipts[0].logs[0].data.clear();
    maintainer.ingest(ctx, height.block, height.receipts);

    CHECK(maintainer.indexed_height(ctx) == 0);
    CHECK(store.capabilities().tokens.reader->count_erc20_transfers_by_token(ctx, kSampleToken) == 0);
    CHECK(store.capabilities().tokens.reader->get_nft_owner(ctx, kSampleNft, 7));
    // the raw log is still stored
    const auto receipt{store.chain().get_receipt(ctx, height.block.transactions[0].hash)};
    REQUIRE(receipt);
    CHECK(receipt->logs.size() == 1);
}

TEST_CASE("IndexMaintainer watermarks and reindex", "[index][maintainer]") {
    db::test_util::TempStore store;
    LogDecoder decoder{SignatureRegistry::defaults()};
    IndexMaintainer maintainer{*store, decoder};
    OperationContext ctx;

    // primary data written without indexing
    for (BlockNum n{0}; n <= 2; ++n) {
        const auto height{sample_height(n)};
        store.chain().set_block(ctx, height.block);
        store.chain().set_receipts(ctx, height.receipts);
    }
    CHECK(store.chain().get_latest_height(ctx) == 2);
    CHECK_FALSE(maintainer.indexed_height(ctx));

    maintainer.reindex(ctx, 0);
    CHECK(maintainer.indexed_height(ctx) == 0);
    // a gap holds the watermark back
    maintainer.reindex(ctx, 2);
    CHECK(maintainer.indexed_height(ctx) == 0);
    CHECK(store.chain().get_indexed_height(ctx) == 0);
    maintainer.reindex(ctx, 1);
    CHECK(maintainer.indexed_height(ctx) == 2);

    const auto& address{store.capabilities().address};
    CHECK(address.reader->count_address_transactions(ctx, kSampleSender) == 6);

    SECTION("reindexing an indexed height rebuilds it in place") {
        maintainer.reindex(ctx, 1);
        CHECK(address.reader->count_address_transactions(ctx, kSampleSender) == 6);
        CHECK(maintainer.indexed_height(ctx) == 2);
    }

    SECTION("missing primary data") {
        try {
            maintainer.reindex(ctx, 0);
            FAIL("expected NotFound");
        } catch (const Error& e) {
            CHECK(e.code() == ErrorCode::kNotFound);
        }
    }

    SECTION("unwind removes the height and its records") {
        maintainer.unwind(ctx, 2);
        CHECK_FALSE(store.chain().has_block(ctx, 2));
        CHECK(store.chain().get_latest_height(ctx) == 1);
        CHECK(maintainer.indexed_height(ctx) == 1);
        CHECK(address.reader->count_address_transactions(ctx, kSampleSender) == 4);
        CHECK(store.capabilities().tokens.reader->count_erc20_transfers_by_token(ctx, kSampleToken) == 2);
        CHECK_THROWS_AS(maintainer.unwind(ctx, 2), Error);
    }
}

TEST_CASE("IndexMaintainer with disabled families", "[index][maintainer]") {
    db::IndexFeatures features;
    features.tokens = false;
    features.balance_history = false;
    db::test_util::TempStore store{features};
    LogDecoder decoder{SignatureRegistry::defaults()};
    IndexMaintainer maintainer{*store, decoder};
    OperationContext ctx;

    const auto height{sample_height(0)};
    maintainer.ingest(ctx, height.block, height.receipts);
    CHECK(maintainer.indexed_height(ctx) == 0);
    CHECK_FALSE(store.capabilities().tokens);
    CHECK(store.capabilities().address.reader->count_address_transactions(ctx, kSampleSender) == 2);
}

TEST_CASE("IndexMaintainer seeds balances from the provider", "[index][maintainer]") {
    SetLogVerbosityGuard log_guard{log::Level::kNone};
    db::test_util::TempStore store;
    LogDecoder decoder{SignatureRegistry::defaults()};
    std::vector<std::pair<evmc::address, BlockNum>> queries;
    BalanceProvider provider{[&](const evmc::address& address, BlockNum block_num) -> std::optional<intx::uint256> {
        queries.emplace_back(address, block_num);
        if (address == kSampleSender) {
            return intx::uint256{100'000'000};
        }
        return std::nullopt;
    }};
    IndexMaintainer maintainer{*store, decoder, nullptr, {}, provider};
    OperationContext ctx;

    maintainer.ingest(ctx, sample_height(4).block, sample_height(4).receipts);
    maintainer.ingest(ctx, sample_height(5).block, sample_height(5).receipts);

    // each address is seeded once, with its balance before the first block it appears in
    REQUIRE(queries.size() == 2);
    CHECK(queries[0] == std::make_pair(kSampleSender, BlockNum{3}));
    CHECK(queries[1] == std::make_pair(kSampleRecipient, BlockNum{3}));

    // 21'000 gas at min(100 + 20, 200) plus 1'000 value per transfer
    const auto& balances{*store.capabilities().balance_history.reader};
    constexpr uint64_t kTransferCost{21'000 * 120 + 1'000};
    CHECK(balances.get_balance(ctx, kSampleSender, 4) == 100'000'000 - 2 * kTransferCost);
    CHECK(balances.get_balance(ctx, kSampleSender, 5) == 100'000'000 - 4 * kTransferCost);
    CHECK(balances.get_balance(ctx, kSampleRecipient, 5) == 4'000);
}

TEST_CASE("IndexMaintainer WBFT consensus data", "[index][maintainer]") {
    db::test_util::TempStore store;
    LogDecoder decoder{SignatureRegistry::defaults()};
    events::EventBus bus{events::BusSettings{.poll_interval = 5ms}};
    bus.start();
    auto validator_events{bus.subscribe("validators", {.types = {events::EventType::kValidatorSet}})};
    IndexMaintainer maintainer{*store, decoder, &bus, WbftSettings{.epoch_length = 10}};
    OperationContext ctx;

    Block boundary{sample_block(10, 0)};
    boundary.header.extra_data = wbft_extra(Bytes{0x03}, /*announce_epoch=*/true);
    maintainer.ingest(ctx, boundary, {});

    Block next{sample_block(11, 0)};
    next.header.extra_data = wbft_extra(Bytes{0x07}, /*announce_epoch=*/false);
    maintainer.ingest(ctx, next, {});

    const auto& wbft{*store.capabilities().wbft.reader};
    const auto epoch{wbft.get_epoch_info(ctx, 1)};
    REQUIRE(epoch);
    CHECK(epoch->block_num == 10);
    CHECK(epoch->validators.size() == 3);

    const auto record{wbft.get_wbft_block(ctx, 11)};
    REQUIRE(record);
    CHECK(record->committed_signers == std::vector<evmc::address>{kValidator0, kValidator1, kValidator2});

    const auto stats{wbft.get_validator_stats(ctx, kValidator2)};
    REQUIRE(stats);
    CHECK(stats->commit_sign_count == 1);
    CHECK(stats->commit_miss_count == 1);
    CHECK(stats->prepare_sign_count == 2);

    SECTION("replaying a block does not double count") {
        maintainer.ingest(ctx, next, {});
        const auto replayed{wbft.get_validator_stats(ctx, kValidator2)};
        REQUIRE(replayed);
        CHECK(replayed->commit_sign_count == 1);
        CHECK(replayed->commit_miss_count == 1);
    }

    SECTION("the first announced epoch adds every validator") {
        REQUIRE(wait_for_pending(*validator_events, 3));
        for (const auto& validator : {kValidator0, kValidator1, kValidator2}) {
            const auto event{validator_events->try_next()};
            REQUIRE(event);
            const auto& change{std::get<events::ValidatorSetEvent>((*event)->payload)};
            CHECK(change.validator == validator);
            CHECK(change.change == events::ValidatorChange::kAdded);
            CHECK(change.validator_set_size == 3);
        }
    }

    SECTION("malformed extra data is skipped") {
        SetLogVerbosityGuard log_guard{log::Level::kNone};
        Block broken{sample_block(12, 0)};
        broken.header.extra_data = Bytes(40, 0xff);
        maintainer.ingest(ctx, broken, {});
        CHECK(maintainer.indexed_height(ctx) == 12);
        CHECK_FALSE(wbft.get_wbft_block(ctx, 12));
        CHECK(store.chain().has_block(ctx, 12));
    }
}

TEST_CASE("IndexMaintainer publishes after commit", "[index][maintainer]") {
    db::test_util::TempStore store;
    LogDecoder decoder{SignatureRegistry::defaults()};
    events::EventBus bus{events::BusSettings{.poll_interval = 5ms}};
    bus.start();
    auto all{bus.subscribe("all")};
    IndexMaintainer maintainer{*store, decoder, &bus};
    OperationContext ctx;

    const auto height{sample_height(0)};
    maintainer.ingest(ctx, height.block, height.receipts);

    // block, two transactions, two logs
    REQUIRE(wait_for_pending(*all, 5));
    const auto first{all->try_next()};
    REQUIRE(first);
    CHECK((*first)->type() == events::EventType::kBlock);
    const auto& block_event{std::get<events::BlockEvent>((*first)->payload)};
    CHECK(block_event.hash == height.block.header.hash);
    CHECK(block_event.tx_count == 2);

    const auto tx{all->try_next()};
    REQUIRE(tx);
    const auto& tx_event{std::get<events::TransactionEvent>((*tx)->payload)};
    REQUIRE(tx_event.receipt);
    CHECK(tx_event.receipt->effective_gas_price == 120);

    SECTION("nothing is published when the height fails") {
        auto mismatched{height.receipts};
        mismatched.pop_back();
        CHECK_THROWS_AS(maintainer.ingest(ctx, height.block, mismatched), Error);
        std::this_thread::sleep_for(20ms);
        CHECK(all->pending() == 3);
    }
}

TEST_CASE("IndexMaintainer publishes governance parameter changes", "[index][maintainer]") {
    db::test_util::TempStore store;
    LogDecoder decoder{SignatureRegistry::defaults()};
    events::EventBus bus{events::BusSettings{.poll_interval = 5ms}};
    bus.start();
    auto config{bus.subscribe("config", {.types = {events::EventType::kChainConfig}})};
    IndexMaintainer maintainer{*store, decoder, &bus};
    OperationContext ctx;

    auto height{sample_height(0)};
    height.receipts[0].logs.push_back(sample_log(height.receipts[0], 2, kGovCouncil,
                                                 {event_topic("QuorumUpdated(uint32,uint32)")},
                                                 uint256_word(2) + uint256_word(3)));
    maintainer.ingest(ctx, height.block, height.receipts);

    REQUIRE(wait_for_pending(*config, 1));
    const auto event{config->try_next()};
    REQUIRE(event);
    const auto& change{std::get<events::ChainConfigEvent>((*event)->payload)};
    CHECK(change.parameter == "quorum");
    CHECK(change.old_value == "2");
    CHECK(change.new_value == "3");
    CHECK(change.block_hash == height.block.header.hash);

    const auto& system{*store.capabilities().system_contracts.reader};
    CHECK(system.count_system_events(ctx, db::SystemEventKind::kQuorumUpdated, {0, 0}) == 1);
}

}  // namespace quarry::index
