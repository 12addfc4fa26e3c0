// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log_decoder.hpp"

#include <string>

#include <magic_enum.hpp>

#include <quarry/core/common/error.hpp>
#include <quarry/core/common/util.hpp>
#include <quarry/core/types/address.hpp>
#include <quarry/core/types/evmc_bytes32.hpp>

namespace quarry::index {

namespace {

    struct Layout {
        size_t topics{0};
        size_t data_words{0};
        bool exact_data{true};
    };

    Layout layout_of(db::SystemEventKind kind) {
        using enum db::SystemEventKind;
        switch (kind) {
            case kMint:
                return {3, 1};
            case kBurn:
            case kMinterConfigured:
                return {2, 1};
            case kMinterRemoved:
                return {2, 0};
            case kProposalVoted:
                return {3, 3};
            case kGasTipUpdated:
            case kMemberAdded:
            case kMemberRemoved:
                return {2, 2};
            case kAddressBlacklisted:
            case kAddressUnblacklisted:
            case kAuthorizedAccountAdded:
            case kAuthorizedAccountRemoved:
                return {3, 0, false};
            case kProposalCreated:
                return {3, 4, false};
            case kProposalApproved:
            case kProposalRejected:
                return {3, 2};
            case kProposalExecuted:
                return {3, 1};
            case kProposalFailed:
            case kBurnExecuted:
            case kProposalExecutionSkipped:
                return {3, 2, false};
            case kProposalExpired:
            case kProposalCancelled:
            case kMemberChanged:
                return {3, 0};
            case kQuorumUpdated:
            case kMaxMinterAllowanceUpdated:
            case kMaxProposalsPerMemberUpdated:
                return {1, 2};
            case kMasterMinterChanged:
            case kEmergencyPaused:
            case kEmergencyUnpaused:
                return {2, 0};
            case kDepositMintProposed:
                return {4, 3, false};
            case kBurnPrepaid:
                return {2, 1};
        }
        return {};
    }

    intx::uint256 data_word(const Log& log, size_t index) {
        return intx::be::unsafe::load<intx::uint256>(log.data.data() + index * kHashLength);
    }

    [[noreturn]] void throw_layout_mismatch(std::string_view event, const Log& log) {
        throw Error{ErrorCode::kDecodeFailure,
                    std::string{event} + " log with " + std::to_string(log.topics.size()) + " topics and " +
                        std::to_string(log.data.size()) + " data bytes in tx " + to_hex(log.tx_hash, true)};
    }

    //! \brief ABI encoded dynamic bytes whose offset is held by data word index
    Bytes dynamic_bytes(const Log& log, size_t index, std::string_view event) {
        const size_t size{log.data.size()};
        const intx::uint256 offset{data_word(log, index)};
        if (size < kHashLength || offset > intx::uint256{size - kHashLength}) {
            throw_layout_mismatch(event, log);
        }
        const auto start{static_cast<size_t>(offset) + kHashLength};
        const auto length{intx::be::unsafe::load<intx::uint256>(log.data.data() + start - kHashLength)};
        if (length > intx::uint256{size - start}) {
            throw_layout_mismatch(event, log);
        }
        return log.data.substr(start, static_cast<size_t>(length));
    }

    db::SystemContractEvent decode_system_event(db::SystemEventKind kind, const Log& log, BlockTime timestamp) {
        const Layout layout{layout_of(kind)};
        const size_t data_size{layout.data_words * kHashLength};
        const bool data_ok{layout.exact_data ? log.data.size() == data_size : log.data.size() >= data_size};
        if (log.topics.size() != layout.topics || !data_ok) {
            throw_layout_mismatch(magic_enum::enum_name(kind), log);
        }

        db::SystemContractEvent event{
            .kind = kind,
            .contract = log.address,
            .block_num = log.block_num,
            .tx_hash = log.tx_hash,
            .log_index = log.index,
            .timestamp = timestamp,
        };

        using enum db::SystemEventKind;
        switch (kind) {
            case kMint:
                event.account = bytes_to_address(ByteView{log.topics[1].bytes});
                event.counterparty = bytes_to_address(ByteView{log.topics[2].bytes});
                event.amount = data_word(log, 0);
                break;
            case kBurn:
            case kMinterConfigured:
                event.account = bytes_to_address(ByteView{log.topics[1].bytes});
                event.amount = data_word(log, 0);
                break;
            case kMinterRemoved:
                event.account = bytes_to_address(ByteView{log.topics[1].bytes});
                break;
            case kProposalVoted:
                event.proposal_id = bytes32_to_uint256(log.topics[1]);
                event.account = bytes_to_address(ByteView{log.topics[2].bytes});
                event.approval = data_word(log, 0) != 0;
                event.amount = data_word(log, 1);
                event.previous_amount = data_word(log, 2);
                break;
            case kGasTipUpdated:
                event.account = bytes_to_address(ByteView{log.topics[1].bytes});
                event.previous_amount = data_word(log, 0);
                event.amount = data_word(log, 1);
                break;
            case kAddressBlacklisted:
            case kAddressUnblacklisted:
                event.account = bytes_to_address(ByteView{log.topics[1].bytes});
                event.proposal_id = bytes32_to_uint256(log.topics[2]);
                break;
            case kMemberAdded:
            case kMemberRemoved:
                event.account = bytes_to_address(ByteView{log.topics[1].bytes});
                event.amount = data_word(log, 0);
                event.quorum = static_cast<uint32_t>(data_word(log, 1));
                break;
            case kProposalCreated:
                event.proposal_id = bytes32_to_uint256(log.topics[1]);
                event.account = bytes_to_address(ByteView{log.topics[2].bytes});
                event.tag = to_bytes32(ByteView{log.data.data(), kHashLength});
                event.amount = data_word(log, 1);
                event.quorum = static_cast<uint32_t>(data_word(log, 2));
                event.payload = dynamic_bytes(log, 3, "ProposalCreated");
                break;
            case kProposalApproved:
            case kProposalRejected:
                event.proposal_id = bytes32_to_uint256(log.topics[1]);
                event.account = bytes_to_address(ByteView{log.topics[2].bytes});
                event.amount = data_word(log, 0);
                event.previous_amount = data_word(log, 1);
                break;
            case kProposalExecuted:
                event.proposal_id = bytes32_to_uint256(log.topics[1]);
                event.account = bytes_to_address(ByteView{log.topics[2].bytes});
                event.approval = data_word(log, 0) != 0;
                break;
            case kProposalFailed:
                event.proposal_id = bytes32_to_uint256(log.topics[1]);
                event.account = bytes_to_address(ByteView{log.topics[2].bytes});
                event.payload = dynamic_bytes(log, 0, "ProposalFailed");
                break;
            case kProposalExpired:
            case kProposalCancelled:
                event.proposal_id = bytes32_to_uint256(log.topics[1]);
                event.account = bytes_to_address(ByteView{log.topics[2].bytes});
                break;
            case kMemberChanged:
                event.counterparty = bytes_to_address(ByteView{log.topics[1].bytes});
                event.account = bytes_to_address(ByteView{log.topics[2].bytes});
                break;
            case kQuorumUpdated:
                event.previous_amount = data_word(log, 0);
                event.amount = data_word(log, 1);
                event.quorum = static_cast<uint32_t>(event.amount);
                break;
            case kMaxMinterAllowanceUpdated:
            case kMaxProposalsPerMemberUpdated:
                event.previous_amount = data_word(log, 0);
                event.amount = data_word(log, 1);
                break;
            case kMasterMinterChanged:
                event.account = bytes_to_address(ByteView{log.topics[1].bytes});
                break;
            case kEmergencyPaused:
            case kEmergencyUnpaused:
                event.proposal_id = bytes32_to_uint256(log.topics[1]);
                break;
            case kDepositMintProposed:
                event.proposal_id = bytes32_to_uint256(log.topics[1]);
                event.tag = log.topics[2];
                event.account = bytes_to_address(ByteView{log.topics[3].bytes});
                event.counterparty = bytes_to_address(ByteView{log.data.data(), kHashLength});
                event.amount = data_word(log, 1);
                event.payload = dynamic_bytes(log, 2, "DepositMintProposed");
                break;
            case kBurnPrepaid:
                event.account = bytes_to_address(ByteView{log.topics[1].bytes});
                event.amount = data_word(log, 0);
                break;
            case kBurnExecuted:
                event.account = bytes_to_address(ByteView{log.topics[1].bytes});
                event.amount = bytes32_to_uint256(log.topics[2]);
                event.payload = dynamic_bytes(log, 0, "BurnExecuted");
                break;
            case kAuthorizedAccountAdded:
            case kAuthorizedAccountRemoved:
            case kProposalExecutionSkipped:
                event.account = bytes_to_address(ByteView{log.topics[1].bytes});
                event.proposal_id = bytes32_to_uint256(log.topics[2]);
                if (kind == kProposalExecutionSkipped) {
                    event.payload = dynamic_bytes(log, 0, "ProposalExecutionSkipped");
                }
                break;
        }
        return event;
    }

}  // namespace

evmc::bytes32 event_topic(std::string_view signature) {
    const auto hash{keccak256(ByteView{reinterpret_cast<const uint8_t*>(signature.data()), signature.size()})};
    return to_bytes32(ByteView{hash.bytes});
}

SignatureRegistry SignatureRegistry::defaults() {
    using enum db::SystemEventKind;
    SignatureRegistry registry;
    registry.system_events = {
        {"Mint(address,address,uint256)", kMint},
        {"Burn(address,uint256)", kBurn},
        {"MinterConfigured(address,uint256)", kMinterConfigured},
        {"MinterRemoved(address)", kMinterRemoved},
        {"ProposalVoted(uint256,address,bool,uint256,uint256)", kProposalVoted},
        {"GasTipUpdated(uint256,uint256,address)", kGasTipUpdated},
        {"AddressBlacklisted(address,uint256)", kAddressBlacklisted},
        {"AddressUnblacklisted(address,uint256)", kAddressUnblacklisted},
        {"MemberAdded(address,uint256,uint32)", kMemberAdded},
        {"MemberRemoved(address,uint256,uint32)", kMemberRemoved},
        {"ProposalCreated(uint256,address,bytes32,bytes,uint256,uint256,uint256)", kProposalCreated},
        {"ProposalApproved(uint256,address,uint256,uint256)", kProposalApproved},
        {"ProposalRejected(uint256,address,uint256,uint256)", kProposalRejected},
        {"ProposalExecuted(uint256,address,bool)", kProposalExecuted},
        {"ProposalFailed(uint256,address,bytes)", kProposalFailed},
        {"ProposalExpired(uint256,address)", kProposalExpired},
        {"ProposalCancelled(uint256,address)", kProposalCancelled},
        {"MemberChanged(address,address)", kMemberChanged},
        {"QuorumUpdated(uint32,uint32)", kQuorumUpdated},
        {"MasterMinterChanged(address)", kMasterMinterChanged},
        {"MaxMinterAllowanceUpdated(uint256,uint256)", kMaxMinterAllowanceUpdated},
        {"EmergencyPaused(uint256)", kEmergencyPaused},
        {"EmergencyUnpaused(uint256)", kEmergencyUnpaused},
        {"DepositMintProposed(uint256,address,uint256,string)", kDepositMintProposed},
        {"BurnPrepaid(address,uint256)", kBurnPrepaid},
        {"BurnExecuted(address,uint256,string)", kBurnExecuted},
        {"AuthorizedAccountAdded(address,uint256)", kAuthorizedAccountAdded},
        {"AuthorizedAccountRemoved(address,uint256)", kAuthorizedAccountRemoved},
        {"MaxProposalsPerMemberUpdated(uint256,uint256)", kMaxProposalsPerMemberUpdated},
        {"ProposalExecutionSkipped(address,uint256,string)", kProposalExecutionSkipped},
    };
    registry.system_contracts = {kNativeCoinAdapter, kGovValidator, kGovMasterMinter, kGovMinter, kGovCouncil};
    return registry;
}

std::shared_ptr<const LogDecoder::Tables> LogDecoder::build_tables(const SignatureRegistry& registry) {
    ensure_input(!registry.transfer_signature.empty(), "empty transfer event signature");
    auto tables{std::make_shared<Tables>()};
    tables->transfer_topic = event_topic(registry.transfer_signature);
    for (const auto& [signature, kind] : registry.system_events) {
        ensure_input(!signature.empty(), "empty system event signature");
        const auto [_, inserted]{tables->system_events.emplace(event_topic(signature), kind)};
        ensure_input(inserted, "duplicate event signature " + signature);
    }
    tables->system_contracts.insert(registry.system_contracts.begin(), registry.system_contracts.end());
    return tables;
}

void LogDecoder::init(const SignatureRegistry& registry) {
    auto tables{build_tables(registry)};
    std::scoped_lock lock{mutex_};
    ensure_input(tables_ == nullptr, "log decoder already initialized");
    tables_ = std::move(tables);
}

void LogDecoder::reload(const SignatureRegistry& registry) {
    auto tables{build_tables(registry)};
    std::scoped_lock lock{mutex_};
    tables_ = std::move(tables);
}

bool LogDecoder::is_initialized() const {
    std::scoped_lock lock{mutex_};
    return tables_ != nullptr;
}

std::shared_ptr<const LogDecoder::Tables> LogDecoder::tables() const {
    std::scoped_lock lock{mutex_};
    ensure_input(tables_ != nullptr, "log decoder not initialized");
    return tables_;
}

DecodedLog LogDecoder::decode(const Log& log, BlockTime timestamp) const {
    const auto tables{this->tables()};
    if (log.topics.empty()) {
        return std::monostate{};
    }
    const evmc::bytes32& topic0{log.topics[0]};

    if (tables->system_contracts.contains(log.address)) {
        if (const auto it{tables->system_events.find(topic0)}; it != tables->system_events.end()) {
            return decode_system_event(it->second, log, timestamp);
        }
    }

    if (topic0 != tables->transfer_topic) {
        return std::monostate{};
    }
    if (log.topics.size() == 3) {
        if (log.data.size() < kHashLength) {
            throw_layout_mismatch("ERC20 Transfer", log);
        }
        return db::Erc20Transfer{
            .contract = log.address,
            .from = bytes_to_address(ByteView{log.topics[1].bytes}),
            .to = bytes_to_address(ByteView{log.topics[2].bytes}),
            .value = data_word(log, 0),
            .tx_hash = log.tx_hash,
            .block_num = log.block_num,
            .log_index = log.index,
            .timestamp = timestamp,
        };
    }
    if (log.topics.size() == 4) {
        return db::Erc721Transfer{
            .contract = log.address,
            .from = bytes_to_address(ByteView{log.topics[1].bytes}),
            .to = bytes_to_address(ByteView{log.topics[2].bytes}),
            .token_id = bytes32_to_uint256(log.topics[3]),
            .tx_hash = log.tx_hash,
            .block_num = log.block_num,
            .log_index = log.index,
            .timestamp = timestamp,
        };
    }
    return std::monostate{};
}

std::optional<db::SystemEventKind> LogDecoder::system_event_kind(const evmc::bytes32& topic0) const {
    const auto tables{this->tables()};
    if (const auto it{tables->system_events.find(topic0)}; it != tables->system_events.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool LogDecoder::is_system_contract(const evmc::address& address) const {
    return tables()->system_contracts.contains(address);
}

}  // namespace quarry::index
