// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "query_engine.hpp"

#include <chrono>
#include <functional>

#include <catch2/catch_test_macros.hpp>

#include <quarry/core/common/error.hpp>
#include <quarry/core/test_util/sample_blocks.hpp>
#include <quarry/core/types/evmc_bytes32.hpp>
#include <quarry/db/test_util/temp_store.hpp>
#include <quarry/index/maintainer.hpp>
#include <quarry/infra/test_util/log.hpp>

namespace quarry::query {

using namespace quarry::test_util;

namespace {

    constexpr evmc::address kSampleNft{0x00000000000000000000000000000000000000ee_address};
    constexpr BlockNum kChainHead{24};

    //! \brief Indexes heights [0, kChainHead], each one with two transfers moving ERC20 tokens and NFT #7
    void populate(db::DataStore& store) {
        index::LogDecoder decoder{index::SignatureRegistry::defaults()};
        index::IndexMaintainer maintainer{store, decoder};
        OperationContext ctx;
        for (BlockNum n{0}; n <= kChainHead; ++n) {
            const Block block{sample_block(n)};
            auto receipts{sample_receipts(block)};
            receipts[0].logs = {
                erc20_transfer_log(receipts[0], 0, kSampleToken, kSampleSender, kSampleRecipient, 500)};
            receipts[1].logs = {
                erc721_transfer_log(receipts[1], 1, kSampleNft, kSampleSender, kSampleRecipient, 7)};
            maintainer.ingest(ctx, block, std::move(receipts));
        }
    }

    std::vector<BlockNum> block_numbers(const Connection<Block>& connection) {
        std::vector<BlockNum> numbers;
        for (const auto& block : connection.nodes) {
            numbers.push_back(block.header.number);
        }
        return numbers;
    }

    ErrorCode error_code_of(const std::function<void()>& func) {
        try {
            func();
        } catch (const Error& ex) {
            return ex.code();
        }
        FAIL("expected Error");
        return ErrorCode::kNotFound;
    }

}  // namespace

TEST_CASE("QueryEngine on an empty chain", "[query][engine]") {
    db::test_util::TempStore store;
    const QueryEngine engine{*store};
    OperationContext ctx;

    const auto blocks{engine.blocks(ctx, {}, {})};
    CHECK(blocks.nodes.empty());
    CHECK(blocks.total_count == 0);
    CHECK_FALSE(blocks.page_info.has_next_page);
    CHECK_FALSE(blocks.page_info.has_previous_page);
    CHECK_FALSE(blocks.page_info.start_cursor);

    CHECK(engine.transactions(ctx, {}, {}).nodes.empty());
    CHECK(engine.logs(ctx, {}, {}).nodes.empty());

    const auto range{engine.blocks_range(ctx, 0, 10)};
    CHECK(range.blocks.empty());
    CHECK_FALSE(range.latest_height);
}

TEST_CASE("QueryEngine blocks latest first", "[query][engine]") {
    db::test_util::TempStore store;
    populate(*store);
    const QueryEngine engine{*store};
    OperationContext ctx;

    SECTION("first page") {
        const auto page{engine.blocks(ctx, {}, Pagination{.limit = 10})};
        CHECK(block_numbers(page) == std::vector<BlockNum>{24, 23, 22, 21, 20, 19, 18, 17, 16, 15});
        CHECK(page.total_count == 25);
        CHECK(page.total_count_exact);
        CHECK(page.page_info.has_next_page);
        CHECK_FALSE(page.page_info.has_previous_page);
        CHECK(page.page_info.start_cursor == "24");
        CHECK(page.page_info.end_cursor == "15");
    }
    SECTION("last page") {
        const auto page{engine.blocks(ctx, {}, Pagination{.limit = 10, .offset = 20})};
        CHECK(block_numbers(page) == std::vector<BlockNum>{4, 3, 2, 1, 0});
        CHECK_FALSE(page.page_info.has_next_page);
        CHECK(page.page_info.has_previous_page);
    }
    SECTION("past genesis") {
        const auto page{engine.blocks(ctx, {}, Pagination{.limit = 10, .offset = 30})};
        CHECK(page.nodes.empty());
        CHECK_FALSE(page.page_info.has_next_page);
        CHECK(page.page_info.has_previous_page);
    }
    SECTION("default and capped page sizes") {
        CHECK(engine.blocks(ctx, {}, {}).nodes.size() == 10);
        const QueryEngine small{*store, QueryLimits{.default_limit = 3, .max_limit = 4}};
        CHECK(small.blocks(ctx, {}, {}).nodes.size() == 3);
        CHECK(small.blocks(ctx, {}, Pagination{.limit = 50}).nodes.size() == 4);
    }
    SECTION("content filters only apply to the page") {
        BlockFilter filter{.timestamp_from = sample_block(20).header.timestamp};
        const auto page{engine.blocks(ctx, filter, Pagination{.limit = 10})};
        CHECK(block_numbers(page) == std::vector<BlockNum>{24, 23, 22, 21, 20});
        CHECK(page.total_count == 5);
        CHECK_FALSE(page.total_count_exact);
        CHECK(page.page_info.has_next_page);

        filter = BlockFilter{.miner = kSampleSender};
        const auto none{engine.blocks(ctx, filter, {})};
        CHECK(none.nodes.empty());
        CHECK(none.total_count == 0);
    }
}

TEST_CASE("QueryEngine blocks over an explicit range", "[query][engine]") {
    db::test_util::TempStore store;
    populate(*store);
    const QueryEngine engine{*store};
    OperationContext ctx;

    const BlockFilter filter{.number_from = 5, .number_to = 12};

    SECTION("ascending pages") {
        const auto first{engine.blocks(ctx, filter, Pagination{.limit = 5})};
        CHECK(block_numbers(first) == std::vector<BlockNum>{5, 6, 7, 8, 9});
        CHECK(first.total_count == 8);
        CHECK(first.total_count_exact);
        CHECK(first.page_info.has_next_page);
        CHECK(first.page_info.start_cursor == "5");
        CHECK(first.page_info.end_cursor == "9");

        const auto second{engine.blocks(ctx, filter, Pagination{.limit = 5, .offset = 5})};
        CHECK(block_numbers(second) == std::vector<BlockNum>{10, 11, 12});
        CHECK_FALSE(second.page_info.has_next_page);
        CHECK(second.page_info.has_previous_page);

        const auto past{engine.blocks(ctx, filter, Pagination{.limit = 5, .offset = 8})};
        CHECK(past.nodes.empty());
        CHECK(past.page_info.has_previous_page);
    }
    SECTION("open upper bound ends at the latest height") {
        const auto page{engine.blocks(ctx, BlockFilter{.number_from = 20}, {})};
        CHECK(block_numbers(page) == std::vector<BlockNum>{20, 21, 22, 23, 24});
        CHECK(page.total_count == 5);
        CHECK_FALSE(page.page_info.has_next_page);
    }
    SECTION("open range starting past the latest height is empty") {
        const auto page{engine.blocks(ctx, BlockFilter{.number_from = kChainHead + 1}, {})};
        CHECK(page.nodes.empty());
        CHECK(page.total_count == 0);
        CHECK(page.total_count_exact);
        CHECK_FALSE(page.page_info.has_next_page);
        CHECK_FALSE(page.page_info.start_cursor);

        const auto far{engine.blocks(ctx, BlockFilter{.number_from = 1'000}, Pagination{.offset = 10})};
        CHECK(far.nodes.empty());
        CHECK(far.page_info.has_previous_page);
    }
    SECTION("upper bound only") {
        const auto page{engine.blocks(ctx, BlockFilter{.number_to = 3}, {})};
        CHECK(block_numbers(page) == std::vector<BlockNum>{0, 1, 2, 3});
    }
    SECTION("upper bound past the latest height") {
        const auto page{engine.blocks(ctx, BlockFilter{.number_from = 22, .number_to = 40}, {})};
        CHECK(block_numbers(page) == std::vector<BlockNum>{22, 23, 24});
        CHECK(page.total_count == 3);
    }
    SECTION("inverted range") {
        CHECK(error_code_of([&] { (void)engine.blocks(ctx, BlockFilter{.number_from = 9, .number_to = 3}, {}); }) ==
              ErrorCode::kInvalidInput);
    }
}

TEST_CASE("QueryEngine blocks_range", "[query][engine]") {
    SetLogVerbosityGuard log_guard{log::Level::kNone};
    db::test_util::TempStore store;
    populate(*store);
    OperationContext ctx;

    const QueryEngine engine{*store, QueryLimits{.max_blocks_range = 5}};

    const auto capped{engine.blocks_range(ctx, 3, 100)};
    CHECK(capped.start_block == 3);
    CHECK(capped.end_block == 7);
    CHECK(capped.blocks.size() == 5);
    CHECK(capped.blocks.front().header.number == 3);
    CHECK(capped.has_more);
    CHECK(capped.latest_height == kChainHead);

    const auto tail{engine.blocks_range(ctx, 22, 26)};
    CHECK(tail.end_block == 24);
    CHECK(tail.blocks.size() == 3);
    CHECK_FALSE(tail.has_more);

    const auto ahead{engine.blocks_range(ctx, 30, 31)};
    CHECK(ahead.blocks.empty());
    CHECK(ahead.end_block == 30);

    CHECK(error_code_of([&] { (void)engine.blocks_range(ctx, 5, 4); }) == ErrorCode::kInvalidInput);
}

TEST_CASE("QueryEngine transactions", "[query][engine]") {
    SetLogVerbosityGuard log_guard{log::Level::kNone};
    db::test_util::TempStore store;
    populate(*store);
    const QueryEngine engine{*store};
    OperationContext ctx;

    SECTION("newest first without filters") {
        const auto page{engine.transactions(ctx, {}, Pagination{.limit = 3})};
        REQUIRE(page.nodes.size() == 3);
        CHECK(page.nodes[0].location.block_num == 24);
        CHECK(page.nodes[0].location.tx_index == 1);
        CHECK(page.nodes[0].location.block_hash == sample_block_hash(24));
        CHECK(page.nodes[0].block_timestamp == sample_block(24).header.timestamp);
        CHECK(page.nodes[1].location.block_num == 24);
        CHECK(page.nodes[1].location.tx_index == 0);
        CHECK(page.nodes[2].location.block_num == 23);
        CHECK(page.nodes[2].location.tx_index == 1);
        CHECK(page.total_count == 50);
        CHECK(page.total_count_exact);
        CHECK(page.page_info.has_next_page);
        CHECK(page.page_info.start_cursor == to_hex(sample_tx_hash(24, 1), true));
        CHECK(page.page_info.end_cursor == to_hex(sample_tx_hash(23, 1), true));
    }
    SECTION("block range") {
        const auto page{engine.transactions(ctx, TransactionFilter{.from_block = 10, .to_block = 11}, {})};
        REQUIRE(page.nodes.size() == 4);
        CHECK(page.nodes.front().transaction.hash == sample_tx_hash(11, 1));
        CHECK(page.nodes.back().transaction.hash == sample_tx_hash(10, 0));
        CHECK(page.total_count == 4);
        CHECK(page.total_count_exact);
        CHECK_FALSE(page.page_info.has_next_page);
    }
    SECTION("content filters") {
        CHECK(engine.transactions(ctx, TransactionFilter{.from = kSampleSender}, {}).total_count == 50);
        CHECK(engine.transactions(ctx, TransactionFilter{.to = kSampleSender}, {}).total_count == 0);
        CHECK(engine.transactions(ctx, TransactionFilter{.type = TransactionType::kLegacy}, {}).total_count == 0);

        const auto page{engine.transactions(ctx, TransactionFilter{.to = kSampleRecipient}, Pagination{.offset = 45})};
        CHECK(page.nodes.size() == 5);
        CHECK(page.nodes.back().transaction.hash == sample_tx_hash(0, 0));
        CHECK_FALSE(page.page_info.has_next_page);
        CHECK(page.page_info.has_previous_page);
    }
    SECTION("scan span is clamped") {
        const QueryEngine narrow{*store, QueryLimits{.max_range = 4}};

        // anchored on the latest height, counted by the aggregate counter
        const auto latest{narrow.transactions(ctx, {}, Pagination{.limit = 100})};
        CHECK(latest.nodes.size() == 10);
        CHECK(latest.nodes.back().location.block_num == 20);
        CHECK(latest.total_count == 50);

        const auto oldest{narrow.transactions(ctx, TransactionFilter{.from_block = 0}, Pagination{.limit = 100})};
        CHECK(oldest.nodes.size() == 10);
        CHECK(oldest.nodes.front().location.block_num == 4);
        CHECK(oldest.total_count == 10);
        CHECK_FALSE(oldest.total_count_exact);
    }
    SECTION("inverted range") {
        const TransactionFilter filter{.from_block = 8, .to_block = 2};
        CHECK(error_code_of([&] { (void)engine.transactions(ctx, filter, {}); }) == ErrorCode::kInvalidInput);
    }
}

TEST_CASE("QueryEngine logs", "[query][engine]") {
    db::test_util::TempStore store;
    populate(*store);
    const QueryEngine engine{*store};
    OperationContext ctx;

    SECTION("by emitter") {
        const auto page{engine.logs(ctx, LogFilter{.addresses = {kSampleToken}}, Pagination{.limit = 2})};
        REQUIRE(page.nodes.size() == 2);
        CHECK(page.nodes[0].block_num == 24);
        CHECK(page.nodes[1].block_num == 23);
        CHECK(page.total_count == 25);
        CHECK(page.total_count_exact);
        CHECK(page.page_info.has_next_page);
        CHECK(page.page_info.start_cursor == "0");
        CHECK(page.page_info.end_cursor == "1");
    }
    SECTION("by positional topics") {
        const evmc::bytes32 nft_id{uint256_to_bytes32(7)};
        LogFilter filter{.topics = {{kTransferTopic}, {}, {}, {nft_id}}};
        const auto nfts{engine.logs(ctx, filter, {})};
        CHECK(nfts.total_count == 25);
        CHECK(nfts.nodes.front().address == kSampleNft);

        filter.topics = {{}, {}, {address_topic(kSampleRecipient)}};
        CHECK(engine.logs(ctx, filter, {}).total_count == 50);

        filter.topics = {{}, {address_topic(kSampleRecipient), address_topic(kSampleMiner)}};
        CHECK(engine.logs(ctx, filter, {}).total_count == 0);
    }
    SECTION("block range") {
        const auto page{engine.logs(ctx, LogFilter{.from_block = 3, .to_block = 3}, {})};
        REQUIRE(page.nodes.size() == 2);
        CHECK(page.nodes[0].index == 1);
        CHECK(page.nodes[1].index == 0);
    }
}

TEST_CASE("QueryEngine index queries", "[query][engine]") {
    db::test_util::TempStore store;
    populate(*store);
    const QueryEngine engine{*store};
    OperationContext ctx;

    const auto activity{engine.transactions_by_address(ctx, kSampleSender, Pagination{.limit = 5})};
    REQUIRE(activity.nodes.size() == 5);
    CHECK(activity.nodes.front().block_num == kChainHead);
    CHECK(activity.total_count == 50);
    CHECK(activity.page_info.has_next_page);
    CHECK(activity.page_info.end_cursor == "4");

    const auto transfers{engine.erc20_transfers_by_token(ctx, kSampleToken, Pagination{.offset = 20})};
    CHECK(transfers.nodes.size() == 5);
    CHECK(transfers.total_count == 25);
    CHECK_FALSE(transfers.page_info.has_next_page);
    CHECK(transfers.nodes.back().block_num == 0);

    CHECK(engine.erc20_transfers_by_address(ctx, kSampleRecipient, {}).total_count == 25);
    CHECK(engine.erc721_transfers_by_token(ctx, kSampleNft, {}).total_count == 25);
    CHECK(engine.erc721_transfers_by_address(ctx, kSampleSender, {}).total_count == 25);

    const auto nfts{engine.nfts_by_owner(ctx, kSampleRecipient, {})};
    REQUIRE(nfts.nodes.size() == 1);
    CHECK(nfts.nodes[0].block_num == kChainHead);

    CHECK(engine.contracts_by_creator(ctx, kSampleSender, {}).total_count == 0);
    CHECK(engine.set_code_authorizations_by_target(ctx, kSampleRecipient, {}).nodes.empty());
    CHECK(engine.system_events_by_account(ctx, kSampleSender, {}).total_count == 0);
    CHECK(engine.validator_activity(ctx, kSampleMiner, std::nullopt, {}).nodes.empty());
    CHECK_FALSE(engine.validator_stats(ctx, kSampleMiner));

    const auto history{engine.balance_history(ctx, kSampleRecipient, BlockNumRange{10, 14}, {})};
    CHECK(history.total_count > 0);
    CHECK(history.nodes.front().block_num <= 14);
    CHECK(history.nodes.back().block_num >= 10);
}

TEST_CASE("QueryEngine proposals", "[query][engine]") {
    db::test_util::TempStore store;
    const QueryEngine engine{*store};
    OperationContext ctx;

    const auto created = [](const Receipt& receipt, uint32_t log_index, uint64_t proposal_id) {
        Bytes data{uint256_word(0)};
        data += uint256_word(1);
        data += uint256_word(2);
        data += uint256_word(4 * kHashLength);
        data += uint256_word(0);
        return sample_log(receipt, log_index, index::kGovCouncil,
                          {index::event_topic("ProposalCreated(uint256,address,bytes32,bytes,uint256,uint256,uint256)"),
                           uint256_to_bytes32(proposal_id), address_topic(kSampleSender)},
                          data);
    };
    {
        index::LogDecoder decoder{index::SignatureRegistry::defaults()};
        index::IndexMaintainer maintainer{*store, decoder};
        for (BlockNum n{0}; n <= 2; ++n) {
            const Block block{sample_block(n)};
            auto receipts{sample_receipts(block)};
            if (n == 0) {
                receipts[0].logs = {created(receipts[0], 0, 1)};
                receipts[1].logs = {created(receipts[1], 1, 2)};
            } else if (n == 1) {
                receipts[0].logs = {created(receipts[0], 0, 3)};
            } else {
                receipts[0].logs = {sample_log(receipts[0], 0, index::kGovCouncil,
                                               {index::event_topic("ProposalCancelled(uint256,address)"),
                                                uint256_to_bytes32(2), address_topic(kSampleSender)})};
            }
            maintainer.ingest(ctx, block, std::move(receipts));
        }
    }

    const auto all{engine.proposals(ctx, index::kGovCouncil, std::nullopt, {})};
    CHECK(all.total_count == 3);
    REQUIRE(all.nodes.size() == 3);
    CHECK(all.nodes[0].proposal_id == 3);
    CHECK(all.nodes[2].proposal_id == 1);
    CHECK(all.nodes[1].status == db::ProposalStatus::kCancelled);

    const auto voting{engine.proposals(ctx, index::kGovCouncil, db::ProposalStatus::kVoting, {.limit = 1})};
    CHECK(voting.total_count == 2);
    REQUIRE(voting.nodes.size() == 1);
    CHECK(voting.nodes[0].proposal_id == 3);
    CHECK(voting.page_info.has_next_page);

    CHECK(engine.proposals(ctx, index::kGovCouncil, db::ProposalStatus::kCancelled, {}).total_count == 1);
    CHECK(engine.proposals(ctx, kSampleToken, std::nullopt, {}).nodes.empty());
}

TEST_CASE("QueryEngine disabled index families", "[query][engine]") {
    db::test_util::TempStore store{db::IndexFeatures{.tokens = false, .wbft = false}};
    const QueryEngine engine{*store};
    OperationContext ctx;

    CHECK(error_code_of([&] { (void)engine.erc20_transfers_by_token(ctx, kSampleToken, {}); }) ==
          ErrorCode::kInvalidInput);
    CHECK(error_code_of([&] { (void)engine.all_validator_stats(ctx); }) == ErrorCode::kInvalidInput);
    CHECK(engine.transactions_by_address(ctx, kSampleSender, {}).nodes.empty());
}

TEST_CASE("QueryEngine honours cancellation", "[query][engine]") {
    db::test_util::TempStore store;
    populate(*store);
    const QueryEngine engine{*store};

    OperationContext cancelled;
    cancelled.cancel();
    CHECK(error_code_of([&] { (void)engine.blocks(cancelled, {}, {}); }) == ErrorCode::kCancelled);

    OperationContext expired{std::chrono::nanoseconds{0}};
    CHECK(error_code_of([&] { (void)engine.logs(expired, {}, {}); }) == ErrorCode::kCancelled);
}

}  // namespace quarry::query
