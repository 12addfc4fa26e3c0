// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <quarry/core/common/base.hpp>
#include <quarry/core/common/error.hpp>
#include <quarry/core/rlp/decode.hpp>

namespace quarry::db {

//! \brief One transaction touching an address, as kept by the address activity index
struct AddressTransaction {
    evmc::address address;
    BlockNum block_num{0};
    uint32_t tx_index{0};
    evmc::bytes32 tx_hash;

    friend bool operator==(const AddressTransaction&, const AddressTransaction&) = default;
};

struct ContractCreation {
    evmc::address contract_address;
    evmc::address creator;
    evmc::bytes32 tx_hash;
    BlockNum block_num{0};
    uint32_t tx_index{0};
    BlockTime timestamp{0};
    uint64_t bytecode_size{0};

    friend bool operator==(const ContractCreation&, const ContractCreation&) = default;
};

//! \brief Verification outcome supplied by an external verifier, updated in place
struct ContractVerification {
    evmc::address address;
    bool is_verified{false};
    std::string name;
    std::string compiler_version;
    bool optimization_enabled{false};
    uint64_t optimization_runs{0};
    std::string source_code;
    std::string abi;
    BlockTime verified_at{0};

    friend bool operator==(const ContractVerification&, const ContractVerification&) = default;
};

//! \brief A call frame reported by an external tracer
struct InternalTransaction {
    evmc::bytes32 tx_hash;
    BlockNum block_num{0};
    uint32_t tx_index{0};
    uint32_t index{0};  // call index within the transaction
    std::string type;   // CALL, DELEGATECALL, STATICCALL, CREATE...
    evmc::address from;
    evmc::address to;
    intx::uint256 value{0};
    uint64_t gas{0};
    uint64_t gas_used{0};
    Bytes input;
    Bytes output;
    std::string error;
    uint32_t depth{0};

    friend bool operator==(const InternalTransaction&, const InternalTransaction&) = default;
};

struct Erc20Transfer {
    evmc::address contract;
    evmc::address from;
    evmc::address to;
    intx::uint256 value{0};
    evmc::bytes32 tx_hash;
    BlockNum block_num{0};
    uint32_t log_index{0};
    BlockTime timestamp{0};

    friend bool operator==(const Erc20Transfer&, const Erc20Transfer&) = default;
};

struct Erc721Transfer {
    evmc::address contract;
    evmc::address from;
    evmc::address to;
    intx::uint256 token_id{0};
    evmc::bytes32 tx_hash;
    BlockNum block_num{0};
    uint32_t log_index{0};
    BlockTime timestamp{0};

    friend bool operator==(const Erc721Transfer&, const Erc721Transfer&) = default;
};

//! \brief Current holder of an NFT, the (block_num, log_index) pair orders competing updates
struct NftOwnership {
    evmc::address contract;
    intx::uint256 token_id{0};
    evmc::address owner;
    BlockNum block_num{0};
    uint32_t log_index{0};
    evmc::bytes32 tx_hash;

    friend bool operator==(const NftOwnership&, const NftOwnership&) = default;
};

struct SetCodeAuthorizationRecord {
    evmc::bytes32 tx_hash;
    BlockNum block_num{0};
    evmc::bytes32 block_hash;
    uint32_t tx_index{0};
    uint32_t auth_index{0};

    evmc::address target;
    std::optional<evmc::address> authority;  // unset when signature recovery failed
    intx::uint256 chain_id{0};
    uint64_t nonce{0};
    uint8_t y_parity{0};
    intx::uint256 r{0};
    intx::uint256 s{0};

    bool applied{false};
    std::string error;
    BlockTime timestamp{0};

    friend bool operator==(const SetCodeAuthorizationRecord&, const SetCodeAuthorizationRecord&) = default;
};

struct AddressDelegationState {
    evmc::address address;
    std::optional<evmc::address> target;  // unset when the delegation has been cleared
    BlockNum last_updated_block{0};
    evmc::bytes32 last_updated_tx_hash;

    bool has_delegation() const noexcept { return target.has_value(); }

    friend bool operator==(const AddressDelegationState&, const AddressDelegationState&) = default;
};

struct AddressSetCodeStats {
    evmc::address address;
    uint64_t as_target_count{0};
    uint64_t as_authority_count{0};
    std::optional<evmc::address> current_delegation;
    BlockNum last_activity_block{0};
};

//! \brief Aggregated BLS seal of one consensus phase
struct WbftAggregatedSeal {
    Bytes sealers;  // bitmap of participating validators, LSB first
    Bytes signature;

    friend bool operator==(const WbftAggregatedSeal&, const WbftAggregatedSeal&) = default;
};

struct Candidate {
    evmc::address address;
    uint64_t diligence{0};  // unit: 10^-6

    friend bool operator==(const Candidate&, const Candidate&) = default;
};

//! \brief Validator set of an epoch as announced by its boundary block
struct EpochInfo {
    uint64_t epoch_num{0};
    BlockNum block_num{0};
    std::vector<Candidate> candidates;
    std::vector<uint32_t> validators;  // indices into candidates
    std::vector<Bytes> bls_public_keys;

    friend bool operator==(const EpochInfo&, const EpochInfo&) = default;
};

struct WbftBlockRecord {
    BlockNum block_num{0};
    evmc::bytes32 block_hash;
    Bytes randao_reveal;
    uint32_t prev_round{0};
    std::optional<WbftAggregatedSeal> prev_prepared_seal;
    std::optional<WbftAggregatedSeal> prev_committed_seal;
    uint32_t round{0};
    std::optional<WbftAggregatedSeal> prepared_seal;
    std::optional<WbftAggregatedSeal> committed_seal;
    intx::uint256 gas_tip{0};
    std::optional<EpochInfo> epoch_info;
    BlockTime timestamp{0};

    // Resolved against the validator set in force
    std::vector<evmc::address> prepared_signers;
    std::vector<evmc::address> committed_signers;

    friend bool operator==(const WbftBlockRecord&, const WbftBlockRecord&) = default;
};

struct ValidatorSigningStats {
    evmc::address validator;
    uint32_t validator_index{0};
    uint64_t prepare_sign_count{0};
    uint64_t prepare_miss_count{0};
    uint64_t commit_sign_count{0};
    uint64_t commit_miss_count{0};
    BlockNum from_block{0};
    BlockNum to_block{0};

    //! \brief Percentage of commit phases signed
    double signing_rate() const noexcept;

    friend bool operator==(const ValidatorSigningStats&, const ValidatorSigningStats&) = default;
};

struct ValidatorSigningActivity {
    BlockNum block_num{0};
    evmc::bytes32 block_hash;
    evmc::address validator;
    uint32_t validator_index{0};
    bool signed_prepare{false};
    bool signed_commit{false};
    uint32_t round{0};
    BlockTime timestamp{0};

    friend bool operator==(const ValidatorSigningActivity&, const ValidatorSigningActivity&) = default;
};

//! \brief A balance change of an address (kDelta) or its absolute balance at a block (kSnapshot)
struct BalanceEntry {
    enum class Kind : uint8_t {
        kDelta = 0,
        kSnapshot = 1,
    };

    evmc::address address;
    BlockNum block_num{0};
    uint32_t sequence{0};
    Kind kind{Kind::kDelta};
    bool negative{false};
    intx::uint256 amount{0};  // magnitude of the delta or the snapshot balance
    evmc::bytes32 tx_hash;

    friend bool operator==(const BalanceEntry&, const BalanceEntry&) = default;
};

//! \brief Balance history item: the change applied at a block and the resulting balance
struct BalanceSnapshot {
    BlockNum block_num{0};
    intx::uint256 balance{0};
    bool negative_delta{false};
    intx::uint256 delta{0};
    evmc::bytes32 tx_hash;
};

enum class SystemEventKind : uint8_t {
    kMint = 1,
    kBurn = 2,
    kMinterConfigured = 3,
    kMinterRemoved = 4,
    kProposalVoted = 5,
    kGasTipUpdated = 6,
    kAddressBlacklisted = 7,
    kAddressUnblacklisted = 8,
    kMemberAdded = 9,
    kMemberRemoved = 10,
    kProposalCreated = 11,
    kProposalApproved = 12,
    kProposalRejected = 13,
    kProposalExecuted = 14,
    kProposalFailed = 15,
    kProposalExpired = 16,
    kProposalCancelled = 17,
    kMemberChanged = 18,
    kQuorumUpdated = 19,
    kMasterMinterChanged = 20,
    kMaxMinterAllowanceUpdated = 21,
    kEmergencyPaused = 22,
    kEmergencyUnpaused = 23,
    kDepositMintProposed = 24,
    kBurnPrepaid = 25,
    kBurnExecuted = 26,
    kAuthorizedAccountAdded = 27,
    kAuthorizedAccountRemoved = 28,
    kMaxProposalsPerMemberUpdated = 29,
    kProposalExecutionSkipped = 30,
};

//! \brief Whether the kind belongs to the lifecycle of a governance proposal
bool is_proposal_lifecycle(SystemEventKind kind) noexcept;

//! \brief An event emitted by one of the system contracts
//! \details Field usage by kind:
//! - Mint: account = minter, counterparty = recipient, amount
//! - Burn: account = burner, amount
//! - MinterConfigured: account = minter, amount = allowance
//! - MinterRemoved: account = minter
//! - ProposalCreated: account = proposer, proposal_id, tag = action type, payload = call data,
//!   amount = member version, quorum = required approvals
//! - ProposalVoted: account = voter, proposal_id, approval, amount = approvals, previous_amount = rejections
//! - ProposalApproved/ProposalRejected: account = sender, proposal_id, amount = approvals,
//!   previous_amount = rejections
//! - ProposalExecuted: account = executor, proposal_id, approval = call succeeded
//! - ProposalFailed: account = executor, proposal_id, payload = revert reason
//! - ProposalExpired/ProposalCancelled: account = sender, proposal_id
//! - GasTipUpdated: account = updater, amount = new tip, previous_amount = old tip
//! - AddressBlacklisted/AddressUnblacklisted: account, proposal_id
//! - AuthorizedAccountAdded/AuthorizedAccountRemoved: account, proposal_id
//! - MemberAdded/MemberRemoved: account = member, amount = total members, quorum
//! - MemberChanged: account = new member, counterparty = old member
//! - QuorumUpdated: amount = quorum = new quorum, previous_amount = old quorum
//! - MasterMinterChanged: account = new master minter
//! - MaxMinterAllowanceUpdated/MaxProposalsPerMemberUpdated: amount = new limit, previous_amount = old limit
//! - EmergencyPaused/EmergencyUnpaused: proposal_id
//! - DepositMintProposed: account = requester, counterparty = beneficiary, proposal_id, amount,
//!   tag = hash of the deposit id, payload = bank reference
//! - BurnPrepaid: account = user, amount
//! - BurnExecuted: account = burner, amount, payload = withdrawal id
//! - ProposalExecutionSkipped: account, proposal_id, payload = reason
struct SystemContractEvent {
    SystemEventKind kind{SystemEventKind::kMint};
    evmc::address contract;
    BlockNum block_num{0};
    evmc::bytes32 tx_hash;
    uint32_t log_index{0};
    BlockTime timestamp{0};

    evmc::address account;
    std::optional<evmc::address> counterparty;
    std::optional<intx::uint256> proposal_id;
    intx::uint256 amount{0};
    intx::uint256 previous_amount{0};
    bool approval{false};
    uint32_t quorum{0};
    evmc::bytes32 tag;
    Bytes payload;

    friend bool operator==(const SystemContractEvent&, const SystemContractEvent&) = default;
};

enum class ProposalStatus : uint8_t {
    kNone = 0,
    kVoting = 1,
    kApproved = 2,
    kExecuted = 3,
    kCancelled = 4,
    kExpired = 5,
    kFailed = 6,
    kRejected = 7,
};

//! \brief A governance proposal of a system contract as folded from its lifecycle events
struct Proposal {
    evmc::address contract;
    intx::uint256 proposal_id{0};
    evmc::address proposer;
    evmc::bytes32 action_type;
    Bytes call_data;
    intx::uint256 member_version{0};
    uint32_t required_approvals{0};
    uint32_t approved{0};
    uint32_t rejected{0};
    ProposalStatus status{ProposalStatus::kVoting};
    BlockTime created_at{0};
    std::optional<BlockNum> executed_at;
    BlockNum block_num{0};
    evmc::bytes32 tx_hash;

    friend bool operator==(const Proposal&, const Proposal&) = default;
};

struct BlacklistStatus {
    evmc::address account;
    bool blacklisted{false};
    BlockNum block_num{0};
    std::optional<intx::uint256> proposal_id;

    friend bool operator==(const BlacklistStatus&, const BlacklistStatus&) = default;
};

struct MinterInfo {
    evmc::address minter;
    intx::uint256 allowance{0};

    friend bool operator==(const MinterInfo&, const MinterInfo&) = default;
};

}  // namespace quarry::db

namespace quarry::rlp {

void encode(Bytes& to, const db::ContractCreation&);
void encode(Bytes& to, const db::ContractVerification&);
void encode(Bytes& to, const db::InternalTransaction&);
void encode(Bytes& to, const db::Erc20Transfer&);
void encode(Bytes& to, const db::Erc721Transfer&);
void encode(Bytes& to, const db::NftOwnership&);
void encode(Bytes& to, const db::SetCodeAuthorizationRecord&);
void encode(Bytes& to, const db::AddressDelegationState&);
void encode(Bytes& to, const db::WbftAggregatedSeal&);
void encode(Bytes& to, const db::Candidate&);
void encode(Bytes& to, const db::EpochInfo&);
void encode(Bytes& to, const db::WbftBlockRecord&);
void encode(Bytes& to, const db::ValidatorSigningStats&);
void encode(Bytes& to, const db::ValidatorSigningActivity&);
void encode(Bytes& to, const db::BalanceEntry&);
void encode(Bytes& to, const db::SystemContractEvent&);
void encode(Bytes& to, const db::BlacklistStatus&);
void encode(Bytes& to, const db::Proposal&);

DecodingResult decode(ByteView& from, db::ContractCreation& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, db::ContractVerification& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, db::InternalTransaction& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, db::Erc20Transfer& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, db::Erc721Transfer& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, db::NftOwnership& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, db::SetCodeAuthorizationRecord& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, db::AddressDelegationState& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, db::WbftAggregatedSeal& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, db::Candidate& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, db::EpochInfo& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, db::WbftBlockRecord& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, db::ValidatorSigningStats& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, db::ValidatorSigningActivity& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, db::BalanceEntry& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, db::SystemContractEvent& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, db::BlacklistStatus& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, db::Proposal& to, Leftover mode = Leftover::kProhibit) noexcept;

}  // namespace quarry::rlp

namespace quarry::db {

//! \brief Decodes a stored record, throwing Error{kDecodeFailure} on malformed data
template <class T>
T decode_record(ByteView data, const char* table_name) {
    T record;
    const auto res{rlp::decode(data, record)};
    if (!res) {
        throw Error{ErrorCode::kDecodeFailure,
                    std::string{"malformed record in table "} + table_name + ": " + to_string(res.error())};
    }
    return record;
}

template <class T>
Bytes encode_record(const T& record) {
    Bytes encoded;
    rlp::encode(encoded, record);
    return encoded;
}

}  // namespace quarry::db
