// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "filter.hpp"

#include <catch2/catch_test_macros.hpp>

#include <quarry/core/common/error.hpp>
#include <quarry/core/test_util/sample_blocks.hpp>

namespace quarry::events {

using namespace quarry::test_util;

namespace {

    TransactionEvent transaction_event(BlockNum block_num, intx::uint256 value,
                                       std::optional<evmc::address> to = kSampleRecipient) {
        return TransactionEvent{
            .hash = sample_tx_hash(block_num, 0),
            .block_num = block_num,
            .block_hash = sample_block_hash(block_num),
            .from = kSampleSender,
            .to = to,
            .value = value,
        };
    }

    Event log_event(BlockNum block_num) {
        const auto receipt{sample_receipts(sample_block(block_num, 1))[0]};
        return Event{.payload = LogEvent{erc20_transfer_log(receipt, 0, kSampleToken, kSampleSender,
                                                            kSampleRecipient, 10)}};
    }

}  // namespace

TEST_CASE("Filter validation", "[events][filter]") {
    Filter filter;
    CHECK(filter.empty());
    CHECK_NOTHROW(filter.validate());

    filter.min_value = 10;
    filter.max_value = 5;
    CHECK_FALSE(filter.empty());
    CHECK_THROWS_AS(filter.validate(), Error);

    filter.max_value = 10;
    CHECK_NOTHROW(filter.validate());

    filter.from_block = 20;
    filter.to_block = 10;
    try {
        filter.validate();
        FAIL("expected InvalidInput");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::kInvalidInput);
    }

    // an open upper bound never conflicts
    filter.to_block = 0;
    CHECK_NOTHROW(filter.validate());
}

TEST_CASE("Filter on transactions", "[events][filter]") {
    const Event event{.payload = transaction_event(5, 1'000)};
    Filter filter;
    CHECK(filter.matches(event));

    SECTION("addresses match either side") {
        filter.addresses = {kSampleRecipient};
        CHECK(filter.matches(event));
        filter.addresses = {kSampleSender};
        CHECK(filter.matches(event));
        filter.addresses = {kSampleToken};
        CHECK_FALSE(filter.matches(event));
    }

    SECTION("directional addresses") {
        filter.from_addresses = {kSampleRecipient};
        CHECK_FALSE(filter.matches(event));
        filter.from_addresses = {kSampleSender};
        filter.to_addresses = {kSampleRecipient};
        CHECK(filter.matches(event));

        const Event creation{.payload = transaction_event(5, 1'000, std::nullopt)};
        CHECK_FALSE(filter.matches(creation));
        filter.to_addresses.clear();
        CHECK(filter.matches(creation));
    }

    SECTION("value bounds are inclusive") {
        filter.min_value = 1'000;
        filter.max_value = 1'000;
        CHECK(filter.matches(event));
        filter.min_value = 1'001;
        filter.max_value.reset();
        CHECK_FALSE(filter.matches(event));
        filter.min_value.reset();
        filter.max_value = 999;
        CHECK_FALSE(filter.matches(event));
    }

    SECTION("block range") {
        filter.from_block = 5;
        filter.to_block = 5;
        CHECK(filter.matches(event));
        filter.from_block = 6;
        filter.to_block = 0;
        CHECK_FALSE(filter.matches(event));
        filter.from_block = 0;
        filter.to_block = 4;
        CHECK_FALSE(filter.matches(event));
    }
}

TEST_CASE("Filter on logs", "[events][filter]") {
    const Event event{log_event(7)};
    Filter filter;

    SECTION("emitter") {
        filter.addresses = {kSampleToken};
        CHECK(filter.matches(event));
        filter.addresses = {kSampleSender};
        CHECK_FALSE(filter.matches(event));
    }

    SECTION("positional topics with wildcards") {
        filter.topics = {{kTransferTopic}};
        CHECK(filter.matches(event));
        filter.topics = {{}, {address_topic(kSampleRecipient), address_topic(kSampleSender)}};
        CHECK(filter.matches(event));
        filter.topics = {{}, {address_topic(kSampleRecipient)}};
        CHECK_FALSE(filter.matches(event));
        // the log carries three topics only
        filter.topics = {{}, {}, {}, {address_topic(kSampleSender)}};
        CHECK_FALSE(filter.matches(event));
        filter.topics = {{}, {}, {}, {}};
        CHECK(filter.matches(event));
    }

    SECTION("value bounds do not apply to logs") {
        filter.min_value = 1'000'000;
        CHECK(filter.matches(event));
    }
}

TEST_CASE("Filter on system contract events", "[events][filter]") {
    db::SystemContractEvent record;
    record.kind = db::SystemEventKind::kMint;
    record.contract = kSampleToken;
    record.block_num = 3;
    const Event event{.payload = SystemContractEvent{record}};

    Filter filter;
    filter.system_event_kinds = {db::SystemEventKind::kBurn};
    CHECK_FALSE(filter.matches(event));
    filter.system_event_kinds.push_back(db::SystemEventKind::kMint);
    CHECK(filter.matches(event));
    filter.addresses = {kSampleSender};
    CHECK_FALSE(filter.matches(event));
}

TEST_CASE("Filter on block events", "[events][filter]") {
    const Event event{.payload = BlockEvent{.number = 12, .hash = sample_block_hash(12), .miner = kSampleMiner}};
    Filter filter;
    CHECK(filter.matches(event));

    SECTION("addresses match the miner") {
        filter.addresses = {kSampleMiner};
        CHECK(filter.matches(event));
        filter.addresses = {kSampleSender};
        CHECK_FALSE(filter.matches(event));
    }

    SECTION("sender and topic criteria never match") {
        filter.from_addresses = {kSampleMiner};
        CHECK_FALSE(filter.matches(event));
        filter.from_addresses.clear();
        filter.topics = {{kTransferTopic}};
        CHECK_FALSE(filter.matches(event));
    }

    SECTION("block range") {
        filter.from_block = 13;
        CHECK_FALSE(filter.matches(event));
        filter.from_block = 12;
        CHECK(filter.matches(event));
    }
}

TEST_CASE("Filter on consensus and configuration events", "[events][filter]") {
    const Event validator{.payload = ValidatorSetEvent{.block_num = 20, .validator = kSampleRecipient}};
    const Event config{.payload = ChainConfigEvent{.block_num = 20, .parameter = "gasTip"}};
    Filter filter;
    CHECK(filter.matches(validator));
    CHECK(filter.matches(config));

    filter.addresses = {kSampleRecipient};
    CHECK(filter.matches(validator));
    CHECK_FALSE(filter.matches(config));

    filter.addresses.clear();
    filter.topics = {{kTransferTopic}};
    CHECK_FALSE(filter.matches(validator));
    CHECK_FALSE(filter.matches(config));
}

}  // namespace quarry::events
