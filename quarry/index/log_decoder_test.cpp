// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log_decoder.hpp"

#include <catch2/catch_test_macros.hpp>

#include <quarry/core/common/error.hpp>
#include <quarry/core/test_util/sample_blocks.hpp>
#include <quarry/core/types/evmc_bytes32.hpp>

namespace quarry::index {

using namespace quarry::test_util;

namespace {

    Receipt sample_receipt() {
        return sample_receipts(sample_block(9, 1))[0];
    }

    Log system_log(const evmc::address& emitter, std::string_view signature, std::vector<evmc::bytes32> topics,
                   Bytes data = {}) {
        topics.insert(topics.begin(), event_topic(signature));
        return sample_log(sample_receipt(), 3, emitter, std::move(topics), std::move(data));
    }

    //! ABI tail of a dynamic bytes value: its length word then the content padded to whole words
    Bytes abi_bytes(ByteView content) {
        Bytes tail{uint256_word(content.size())};
        tail += content;
        tail.resize(tail.size() + (kHashLength - content.size() % kHashLength) % kHashLength, 0);
        return tail;
    }

    ByteView ascii(std::string_view text) {
        return ByteView{reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

}  // namespace

TEST_CASE("event_topic", "[index][log_decoder]") {
    CHECK(event_topic("Transfer(address,address,uint256)") == kTransferTopic);
}

TEST_CASE("LogDecoder initialization", "[index][log_decoder]") {
    LogDecoder decoder;
    CHECK_FALSE(decoder.is_initialized());

    const Log log{erc20_transfer_log(sample_receipt(), 0, kSampleToken, kSampleSender, kSampleRecipient, 5)};
    try {
        (void)decoder.decode(log, 0);
        FAIL("expected InvalidInput");
    } catch (const Error& e) {
        CHECK(e.code() == ErrorCode::kInvalidInput);
    }

    decoder.init(SignatureRegistry::defaults());
    CHECK(decoder.is_initialized());
    CHECK_THROWS_AS(decoder.init(SignatureRegistry::defaults()), Error);

    SECTION("duplicate signatures are rejected") {
        SignatureRegistry registry{SignatureRegistry::defaults()};
        registry.system_events.emplace_back("Mint(address,address,uint256)", db::SystemEventKind::kBurn);
        CHECK_THROWS_AS(decoder.reload(registry), Error);
        // the previous tables stay in place
        CHECK(decoder.system_event_kind(event_topic("Mint(address,address,uint256)")) == db::SystemEventKind::kMint);
    }

    SECTION("reload replaces the tables") {
        SignatureRegistry registry;
        registry.system_contracts = {kSampleToken};
        decoder.reload(registry);
        CHECK_FALSE(decoder.is_system_contract(kNativeCoinAdapter));
        CHECK(decoder.is_system_contract(kSampleToken));
        CHECK_FALSE(decoder.system_event_kind(event_topic("Burn(address,uint256)")));
    }
}

TEST_CASE("LogDecoder token transfers", "[index][log_decoder]") {
    const LogDecoder decoder{SignatureRegistry::defaults()};
    const Receipt receipt{sample_receipt()};

    SECTION("ERC20") {
        const Log log{erc20_transfer_log(receipt, 4, kSampleToken, kSampleSender, kSampleRecipient, 777)};
        const auto decoded{decoder.decode(log, 1234)};
        const auto* transfer{std::get_if<db::Erc20Transfer>(&decoded)};
        REQUIRE(transfer);
        CHECK(transfer->contract == kSampleToken);
        CHECK(transfer->from == kSampleSender);
        CHECK(transfer->to == kSampleRecipient);
        CHECK(transfer->value == 777);
        CHECK(transfer->tx_hash == receipt.tx_hash);
        CHECK(transfer->block_num == 9);
        CHECK(transfer->log_index == 4);
        CHECK(transfer->timestamp == 1234);
    }

    SECTION("ERC20 uses the first data word") {
        Log log{erc20_transfer_log(receipt, 0, kSampleToken, kSampleSender, kSampleRecipient, 12)};
        log.data += uint256_word(99);
        const auto decoded{decoder.decode(log, 0)};
        REQUIRE(std::holds_alternative<db::Erc20Transfer>(decoded));
        CHECK(std::get<db::Erc20Transfer>(decoded).value == 12);
    }

    SECTION("ERC20 with short data") {
        Log log{erc20_transfer_log(receipt, 0, kSampleToken, kSampleSender, kSampleRecipient, 12)};
        log.data.resize(31);
        try {
            (void)decoder.decode(log, 0);
            FAIL("expected DecodeFailure");
        } catch (const Error& e) {
            CHECK(e.code() == ErrorCode::kDecodeFailure);
        }
    }

    SECTION("ERC721") {
        const Log log{erc721_transfer_log(receipt, 1, kSampleToken, kSampleSender, kSampleRecipient, 42)};
        const auto decoded{decoder.decode(log, 0)};
        const auto* transfer{std::get_if<db::Erc721Transfer>(&decoded)};
        REQUIRE(transfer);
        CHECK(transfer->token_id == 42);
        CHECK(transfer->to == kSampleRecipient);
    }

    SECTION("unknown shapes") {
        CHECK(std::holds_alternative<std::monostate>(
            decoder.decode(sample_log(receipt, 0, kSampleToken, {kTransferTopic}), 0)));
        CHECK(std::holds_alternative<std::monostate>(
            decoder.decode(sample_log(receipt, 0, kSampleToken, {sample_hash(0x01, 0)}, uint256_word(1)), 0)));
        CHECK(std::holds_alternative<std::monostate>(decoder.decode(sample_log(receipt, 0, kSampleToken, {}), 0)));
    }
}

TEST_CASE("LogDecoder system contract events", "[index][log_decoder]") {
    const LogDecoder decoder{SignatureRegistry::defaults()};

    SECTION("Mint") {
        const Log log{system_log(kNativeCoinAdapter, "Mint(address,address,uint256)",
                                 {address_topic(kSampleSender), address_topic(kSampleRecipient)}, uint256_word(500))};
        const auto decoded{decoder.decode(log, 77)};
        const auto* event{std::get_if<db::SystemContractEvent>(&decoded)};
        REQUIRE(event);
        CHECK(event->kind == db::SystemEventKind::kMint);
        CHECK(event->contract == kNativeCoinAdapter);
        CHECK(event->account == kSampleSender);
        CHECK(event->counterparty == kSampleRecipient);
        CHECK(event->amount == 500);
        CHECK(event->log_index == 3);
        CHECK(event->timestamp == 77);
    }

    SECTION("ProposalVoted") {
        Bytes data{uint256_word(1)};
        data += uint256_word(3);
        data += uint256_word(1);
        const Log log{system_log(kGovCouncil, "ProposalVoted(uint256,address,bool,uint256,uint256)",
                                 {uint256_to_bytes32(8), address_topic(kSampleSender)}, data)};
        const auto event{std::get<db::SystemContractEvent>(decoder.decode(log, 0))};
        CHECK(event.proposal_id == 8);
        CHECK(event.account == kSampleSender);
        CHECK(event.approval);
        CHECK(event.amount == 3);
        CHECK(event.previous_amount == 1);
    }

    SECTION("GasTipUpdated") {
        Bytes data{uint256_word(25)};
        data += uint256_word(30);
        const Log log{system_log(kGovValidator, "GasTipUpdated(uint256,uint256,address)",
                                 {address_topic(kSampleSender)}, data)};
        const auto event{std::get<db::SystemContractEvent>(decoder.decode(log, 0))};
        CHECK(event.previous_amount == 25);
        CHECK(event.amount == 30);
    }

    SECTION("MemberAdded") {
        Bytes data{uint256_word(4)};
        data += uint256_word(3);
        const Log log{system_log(kGovValidator, "MemberAdded(address,uint256,uint32)",
                                 {address_topic(kSampleRecipient)}, data)};
        const auto event{std::get<db::SystemContractEvent>(decoder.decode(log, 0))};
        CHECK(event.account == kSampleRecipient);
        CHECK(event.amount == 4);
        CHECK(event.quorum == 3);
    }

    SECTION("AddressBlacklisted") {
        const Log log{system_log(kGovCouncil, "AddressBlacklisted(address,uint256)",
                                 {address_topic(kSampleRecipient), uint256_to_bytes32(2)})};
        const auto event{std::get<db::SystemContractEvent>(decoder.decode(log, 0))};
        CHECK(event.kind == db::SystemEventKind::kAddressBlacklisted);
        CHECK(event.account == kSampleRecipient);
        CHECK(event.proposal_id == 2);
    }

    SECTION("layout mismatch") {
        const Log log{system_log(kNativeCoinAdapter, "Burn(address,uint256)", {address_topic(kSampleSender)},
                                 uint256_word(1) + uint256_word(2))};
        try {
            (void)decoder.decode(log, 0);
            FAIL("expected DecodeFailure");
        } catch (const Error& e) {
            CHECK(e.code() == ErrorCode::kDecodeFailure);
        }
    }

    SECTION("ProposalCreated") {
        const evmc::bytes32 action_type{event_topic("ACTION_MINT")};
        const Bytes call_data{0xa9, 0x05, 0x9c, 0xbb, 0x01, 0x02};
        Bytes data{action_type.bytes, kHashLength};
        data += uint256_word(2);
        data += uint256_word(3);
        data += uint256_word(4 * kHashLength);
        data += abi_bytes(call_data);
        const Log log{system_log(kGovMinter, "ProposalCreated(uint256,address,bytes32,bytes,uint256,uint256,uint256)",
                                 {uint256_to_bytes32(12), address_topic(kSampleSender)}, data)};
        const auto event{std::get<db::SystemContractEvent>(decoder.decode(log, 0))};
        CHECK(event.kind == db::SystemEventKind::kProposalCreated);
        CHECK(event.proposal_id == 12);
        CHECK(event.account == kSampleSender);
        CHECK(event.tag == action_type);
        CHECK(event.amount == 2);
        CHECK(event.quorum == 3);
        CHECK(event.payload == call_data);
    }

    SECTION("ProposalCreated with an out of bounds call data offset") {
        Bytes data{uint256_word(0)};
        data += uint256_word(1);
        data += uint256_word(1);
        data += uint256_word(10 * kHashLength);
        const Log log{system_log(kGovMinter, "ProposalCreated(uint256,address,bytes32,bytes,uint256,uint256,uint256)",
                                 {uint256_to_bytes32(12), address_topic(kSampleSender)}, data)};
        try {
            (void)decoder.decode(log, 0);
            FAIL("expected DecodeFailure");
        } catch (const Error& e) {
            CHECK(e.code() == ErrorCode::kDecodeFailure);
        }
    }

    SECTION("ProposalExecutionSkipped with a truncated reason") {
        Bytes data{uint256_word(kHashLength)};
        data += uint256_word(64);
        data += uint256_word(0);
        const Log log{system_log(kGovCouncil, "ProposalExecutionSkipped(address,uint256,string)",
                                 {address_topic(kSampleRecipient), uint256_to_bytes32(5)}, data)};
        CHECK_THROWS_AS(decoder.decode(log, 0), Error);
    }

    SECTION("ProposalApproved") {
        const Log log{system_log(kGovMinter, "ProposalApproved(uint256,address,uint256,uint256)",
                                 {uint256_to_bytes32(12), address_topic(kSampleRecipient)},
                                 uint256_word(3) + uint256_word(1))};
        const auto event{std::get<db::SystemContractEvent>(decoder.decode(log, 0))};
        CHECK(event.kind == db::SystemEventKind::kProposalApproved);
        CHECK(event.proposal_id == 12);
        CHECK(event.account == kSampleRecipient);
        CHECK(event.amount == 3);
        CHECK(event.previous_amount == 1);
    }

    SECTION("ProposalExecuted") {
        const Log log{system_log(kGovMinter, "ProposalExecuted(uint256,address,bool)",
                                 {uint256_to_bytes32(12), address_topic(kSampleRecipient)}, uint256_word(1))};
        const auto event{std::get<db::SystemContractEvent>(decoder.decode(log, 0))};
        CHECK(event.kind == db::SystemEventKind::kProposalExecuted);
        CHECK(event.approval);
    }

    SECTION("MemberChanged") {
        const Log log{system_log(kGovValidator, "MemberChanged(address,address)",
                                 {address_topic(kSampleSender), address_topic(kSampleRecipient)})};
        const auto event{std::get<db::SystemContractEvent>(decoder.decode(log, 0))};
        CHECK(event.kind == db::SystemEventKind::kMemberChanged);
        CHECK(event.account == kSampleRecipient);
        CHECK(event.counterparty == kSampleSender);
    }

    SECTION("QuorumUpdated") {
        const Log log{system_log(kGovCouncil, "QuorumUpdated(uint32,uint32)", {}, uint256_word(2) + uint256_word(3))};
        const auto event{std::get<db::SystemContractEvent>(decoder.decode(log, 0))};
        CHECK(event.kind == db::SystemEventKind::kQuorumUpdated);
        CHECK(event.previous_amount == 2);
        CHECK(event.amount == 3);
        CHECK(event.quorum == 3);
    }

    SECTION("MasterMinterChanged") {
        const Log log{system_log(kGovMasterMinter, "MasterMinterChanged(address)", {address_topic(kSampleSender)})};
        const auto event{std::get<db::SystemContractEvent>(decoder.decode(log, 0))};
        CHECK(event.kind == db::SystemEventKind::kMasterMinterChanged);
        CHECK(event.account == kSampleSender);
    }

    SECTION("EmergencyPaused") {
        const Log log{system_log(kGovMinter, "EmergencyPaused(uint256)", {uint256_to_bytes32(40)})};
        const auto event{std::get<db::SystemContractEvent>(decoder.decode(log, 0))};
        CHECK(event.kind == db::SystemEventKind::kEmergencyPaused);
        CHECK(event.proposal_id == 40);
    }

    SECTION("DepositMintProposed") {
        const evmc::bytes32 deposit_id{event_topic("DEP-2024-0042")};
        Bytes data{address_topic(kSampleRecipient).bytes, kHashLength};
        data += uint256_word(1'000'000);
        data += uint256_word(3 * kHashLength);
        data += abi_bytes(ascii("BANK-REF-7"));
        const Log log{system_log(kGovMinter, "DepositMintProposed(uint256,address,uint256,string)",
                                 {uint256_to_bytes32(6), deposit_id, address_topic(kSampleSender)}, data)};
        const auto event{std::get<db::SystemContractEvent>(decoder.decode(log, 0))};
        CHECK(event.kind == db::SystemEventKind::kDepositMintProposed);
        CHECK(event.proposal_id == 6);
        CHECK(event.tag == deposit_id);
        CHECK(event.account == kSampleSender);
        CHECK(event.counterparty == kSampleRecipient);
        CHECK(event.amount == 1'000'000);
        CHECK(event.payload == Bytes{ascii("BANK-REF-7")});
    }

    SECTION("BurnPrepaid and BurnExecuted") {
        const Log prepaid{system_log(kGovMinter, "BurnPrepaid(address,uint256)", {address_topic(kSampleSender)},
                                     uint256_word(90))};
        const auto prepaid_event{std::get<db::SystemContractEvent>(decoder.decode(prepaid, 0))};
        CHECK(prepaid_event.kind == db::SystemEventKind::kBurnPrepaid);
        CHECK(prepaid_event.account == kSampleSender);
        CHECK(prepaid_event.amount == 90);

        const Log executed{system_log(kGovMinter, "BurnExecuted(address,uint256,string)",
                                      {address_topic(kSampleSender), uint256_to_bytes32(90)},
                                      uint256_word(kHashLength) + abi_bytes(ascii("WD-1")))};
        const auto executed_event{std::get<db::SystemContractEvent>(decoder.decode(executed, 0))};
        CHECK(executed_event.kind == db::SystemEventKind::kBurnExecuted);
        CHECK(executed_event.amount == 90);
        CHECK(executed_event.payload == Bytes{ascii("WD-1")});
    }

    SECTION("AuthorizedAccountAdded") {
        const Log log{system_log(kGovCouncil, "AuthorizedAccountAdded(address,uint256)",
                                 {address_topic(kSampleRecipient), uint256_to_bytes32(4)})};
        const auto event{std::get<db::SystemContractEvent>(decoder.decode(log, 0))};
        CHECK(event.kind == db::SystemEventKind::kAuthorizedAccountAdded);
        CHECK(event.account == kSampleRecipient);
        CHECK(event.proposal_id == 4);
    }

    SECTION("known signature from another emitter is ignored") {
        const Log log{system_log(kSampleToken, "Burn(address,uint256)", {address_topic(kSampleSender)},
                                 uint256_word(1))};
        CHECK(std::holds_alternative<std::monostate>(decoder.decode(log, 0)));
    }
}

}  // namespace quarry::index
