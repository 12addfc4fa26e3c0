// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// Reader/writer interfaces of the optional index families.
// Readers open their own read transaction per call. Writers run inside the write transaction of the
// height being indexed, so primary and secondary data become visible together.

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <quarry/core/common/base.hpp>
#include <quarry/db/index/records.hpp>
#include <quarry/db/kv/mdbx.hpp>
#include <quarry/db/util.hpp>
#include <quarry/infra/concurrency/operation_context.hpp>

namespace quarry::db {

//! \brief Optional index families to be maintained by a data store
struct IndexFeatures {
    bool address{true};
    bool tokens{true};
    bool contracts{true};
    bool internal_transactions{true};
    bool wbft{true};
    bool set_code{true};
    bool balance_history{true};
    bool system_contracts{true};
};

/* Address activity */

class AddressIndexReader {
  public:
    virtual ~AddressIndexReader() = default;

    //! \brief Transactions sent, received or sponsored by address in (block, tx index) order
    virtual std::vector<AddressTransaction> get_address_transactions(const OperationContext& ctx,
                                                                     const evmc::address& address,
                                                                     const PageRequest& page) const = 0;
    virtual uint64_t count_address_transactions(const OperationContext& ctx, const evmc::address& address) const = 0;
};

class AddressIndexWriter {
  public:
    virtual ~AddressIndexWriter() = default;

    virtual void put_address_transaction(RWTxn& txn, const AddressTransaction& entry) = 0;
    virtual void erase_address_transaction(RWTxn& txn, const AddressTransaction& entry) = 0;
};

/* Token transfers */

class TokenIndexReader {
  public:
    virtual ~TokenIndexReader() = default;

    virtual std::optional<Erc20Transfer> get_erc20_transfer(const OperationContext& ctx, const evmc::bytes32& tx_hash,
                                                            uint32_t log_index) const = 0;
    virtual std::vector<Erc20Transfer> get_erc20_transfers_by_address(const OperationContext& ctx,
                                                                      const evmc::address& address,
                                                                      const PageRequest& page) const = 0;
    virtual std::vector<Erc20Transfer> get_erc20_transfers_by_token(const OperationContext& ctx,
                                                                    const evmc::address& token,
                                                                    const PageRequest& page) const = 0;
    virtual uint64_t count_erc20_transfers_by_address(const OperationContext& ctx,
                                                      const evmc::address& address) const = 0;
    virtual uint64_t count_erc20_transfers_by_token(const OperationContext& ctx,
                                                    const evmc::address& token) const = 0;

    virtual std::optional<Erc721Transfer> get_erc721_transfer(const OperationContext& ctx,
                                                              const evmc::bytes32& tx_hash,
                                                              uint32_t log_index) const = 0;
    virtual std::vector<Erc721Transfer> get_erc721_transfers_by_address(const OperationContext& ctx,
                                                                        const evmc::address& address,
                                                                        const PageRequest& page) const = 0;
    virtual std::vector<Erc721Transfer> get_erc721_transfers_by_token(const OperationContext& ctx,
                                                                      const evmc::address& token,
                                                                      const PageRequest& page) const = 0;
    virtual uint64_t count_erc721_transfers_by_address(const OperationContext& ctx,
                                                       const evmc::address& address) const = 0;
    virtual uint64_t count_erc721_transfers_by_token(const OperationContext& ctx,
                                                     const evmc::address& token) const = 0;

    virtual std::optional<NftOwnership> get_nft_owner(const OperationContext& ctx, const evmc::address& contract,
                                                      const intx::uint256& token_id) const = 0;
    virtual std::vector<NftOwnership> get_nfts_by_owner(const OperationContext& ctx, const evmc::address& owner,
                                                        const PageRequest& page) const = 0;
    virtual uint64_t count_nfts_by_owner(const OperationContext& ctx, const evmc::address& owner) const = 0;
};

class TokenIndexWriter {
  public:
    virtual ~TokenIndexWriter() = default;

    virtual void put_erc20_transfer(RWTxn& txn, const Erc20Transfer& transfer) = 0;
    virtual void erase_erc20_transfer(RWTxn& txn, const Erc20Transfer& transfer) = 0;

    //! \brief Stores the transfer and moves ownership of the token unless a newer transfer is already applied
    virtual void put_erc721_transfer(RWTxn& txn, const Erc721Transfer& transfer) = 0;

    //! \brief Removes the transfer, handing ownership back to the previous transfer if it was the current one
    virtual void erase_erc721_transfer(RWTxn& txn, const Erc721Transfer& transfer) = 0;
};

/* Contracts */

class ContractIndexReader {
  public:
    virtual ~ContractIndexReader() = default;

    virtual std::optional<ContractCreation> get_contract_creation(const OperationContext& ctx,
                                                                  const evmc::address& contract) const = 0;
    virtual std::vector<ContractCreation> get_contracts_by_creator(const OperationContext& ctx,
                                                                   const evmc::address& creator,
                                                                   const PageRequest& page) const = 0;
    virtual uint64_t count_contracts_by_creator(const OperationContext& ctx, const evmc::address& creator) const = 0;

    //! \return std::nullopt if the contract has never been submitted for verification
    virtual std::optional<ContractVerification> get_contract_verification(const OperationContext& ctx,
                                                                          const evmc::address& contract) const = 0;
};

class ContractIndexWriter {
  public:
    virtual ~ContractIndexWriter() = default;

    virtual void put_contract_creation(RWTxn& txn, const ContractCreation& creation) = 0;
    virtual void erase_contract_creation(RWTxn& txn, const ContractCreation& creation) = 0;

    //! \brief Upserts the verification record of a contract, last write wins
    virtual void set_contract_verification(const OperationContext& ctx, const ContractVerification& verification) = 0;

    //! \return false if no verification record existed
    virtual bool delete_contract_verification(const OperationContext& ctx, const evmc::address& contract) = 0;
};

/* Internal transactions */

class InternalTransactionIndexReader {
  public:
    virtual ~InternalTransactionIndexReader() = default;

    virtual std::vector<InternalTransaction> get_internal_transactions(const OperationContext& ctx,
                                                                       const evmc::bytes32& tx_hash) const = 0;
    virtual std::vector<InternalTransaction> get_internal_transactions_by_address(const OperationContext& ctx,
                                                                                  const evmc::address& address,
                                                                                  const PageRequest& page) const = 0;

    //! \brief Counted at query time by scanning the address index
    virtual uint64_t count_internal_transactions_by_address(const OperationContext& ctx,
                                                            const evmc::address& address) const = 0;
};

class InternalTransactionIndexWriter {
  public:
    virtual ~InternalTransactionIndexWriter() = default;

    //! \brief Replaces the call frames of a stored transaction with the ones reported by a tracer
    //! \remarks Throws Error{kNotFound} if the transaction is not stored
    virtual void save_internal_transactions(const OperationContext& ctx, const evmc::bytes32& tx_hash,
                                            std::vector<InternalTransaction> traces) = 0;
    virtual void erase_internal_transactions(RWTxn& txn, const evmc::bytes32& tx_hash) = 0;
};

/* WBFT consensus */

class WbftIndexReader {
  public:
    virtual ~WbftIndexReader() = default;

    virtual std::optional<WbftBlockRecord> get_wbft_block(const OperationContext& ctx, BlockNum block_num) const = 0;
    virtual std::optional<EpochInfo> get_epoch_info(const OperationContext& ctx, uint64_t epoch_num) const = 0;
    virtual std::optional<EpochInfo> get_latest_epoch_info(const OperationContext& ctx) const = 0;
    virtual std::optional<ValidatorSigningStats> get_validator_stats(const OperationContext& ctx,
                                                                     const evmc::address& validator) const = 0;
    virtual std::vector<ValidatorSigningStats> get_all_validator_stats(const OperationContext& ctx) const = 0;
    virtual std::vector<ValidatorSigningActivity> get_validator_activity(const OperationContext& ctx,
                                                                         const evmc::address& validator,
                                                                         BlockNumRange range,
                                                                         const PageRequest& page) const = 0;
    virtual uint64_t count_validator_activity(const OperationContext& ctx, const evmc::address& validator,
                                              BlockNumRange range) const = 0;
};

class WbftIndexWriter {
  public:
    virtual ~WbftIndexWriter() = default;

    //! \brief The validator set governing block_num: the latest epoch info stored for an epoch up to the block's one
    virtual std::optional<EpochInfo> find_epoch_in_force(ROTxn& txn, BlockNum block_num,
                                                         uint64_t epoch_length) const = 0;

    virtual void put_wbft_block(RWTxn& txn, const WbftBlockRecord& record) = 0;
    virtual void put_epoch_info(RWTxn& txn, const EpochInfo& info) = 0;

    //! \brief Records the activity of a validator at a block adjusting the validator counters
    //! \details Writing the same (validator, block) twice only applies the difference with the stored activity
    virtual void put_signing_activity(RWTxn& txn, const ValidatorSigningActivity& activity) = 0;

    //! \brief Removes the block record, the epoch info it announced and every signing activity at the block
    virtual void erase_wbft_block(RWTxn& txn, BlockNum block_num, uint64_t epoch_length) = 0;
};

/* EIP-7702 set-code authorizations */

class SetCodeIndexReader {
  public:
    virtual ~SetCodeIndexReader() = default;

    virtual std::optional<SetCodeAuthorizationRecord> get_set_code_authorization(const OperationContext& ctx,
                                                                                 const evmc::bytes32& tx_hash,
                                                                                 uint32_t auth_index) const = 0;
    virtual std::vector<SetCodeAuthorizationRecord> get_set_code_authorizations(
        const OperationContext& ctx, const evmc::bytes32& tx_hash) const = 0;
    virtual std::vector<SetCodeAuthorizationRecord> get_set_code_authorizations_by_target(
        const OperationContext& ctx, const evmc::address& target, const PageRequest& page) const = 0;
    virtual std::vector<SetCodeAuthorizationRecord> get_set_code_authorizations_by_authority(
        const OperationContext& ctx, const evmc::address& authority, const PageRequest& page) const = 0;
    virtual uint64_t count_set_code_authorizations_by_target(const OperationContext& ctx,
                                                             const evmc::address& target) const = 0;
    virtual uint64_t count_set_code_authorizations_by_authority(const OperationContext& ctx,
                                                                const evmc::address& authority) const = 0;
    virtual std::optional<AddressDelegationState> get_delegation_state(const OperationContext& ctx,
                                                                       const evmc::address& address) const = 0;

    //! \brief Computed at query time from the target and authority indexes
    virtual AddressSetCodeStats get_set_code_stats(const OperationContext& ctx,
                                                   const evmc::address& address) const = 0;
};

class SetCodeIndexWriter {
  public:
    virtual ~SetCodeIndexWriter() = default;

    //! \brief Stores the record and, when applied, updates the delegation state of its authority
    virtual void put_set_code_authorization(RWTxn& txn, const SetCodeAuthorizationRecord& record) = 0;

    //! \brief Removes the record, restoring the delegation state from the authority's remaining records
    virtual void erase_set_code_authorization(RWTxn& txn, const SetCodeAuthorizationRecord& record) = 0;
};

/* Balance history */

class BalanceIndexReader {
  public:
    virtual ~BalanceIndexReader() = default;

    //! \brief Balance of address after block_num: nearest snapshot at or below it plus the later deltas
    virtual intx::uint256 get_balance(const OperationContext& ctx, const evmc::address& address,
                                      BlockNum block_num) const = 0;
    virtual std::vector<BalanceSnapshot> get_balance_history(const OperationContext& ctx,
                                                             const evmc::address& address, BlockNumRange range,
                                                             const PageRequest& page) const = 0;
    virtual uint64_t count_balance_history(const OperationContext& ctx, const evmc::address& address,
                                           BlockNumRange range) const = 0;
};

class BalanceIndexWriter {
  public:
    virtual ~BalanceIndexWriter() = default;

    virtual bool has_balance_history(ROTxn& txn, const evmc::address& address) const = 0;
    virtual void put_balance_entry(RWTxn& txn, const BalanceEntry& entry) = 0;

    //! \brief Removes the snapshot and every delta of address at block_num
    virtual void erase_balance_entries(RWTxn& txn, const evmc::address& address, BlockNum block_num) = 0;
};

/* System contracts */

class SystemContractIndexReader {
  public:
    virtual ~SystemContractIndexReader() = default;

    virtual intx::uint256 get_total_supply(const OperationContext& ctx) const = 0;
    virtual std::vector<MinterInfo> get_active_minters(const OperationContext& ctx) const = 0;
    virtual std::optional<intx::uint256> get_minter_allowance(const OperationContext& ctx,
                                                              const evmc::address& minter) const = 0;
    virtual std::optional<BlacklistStatus> get_blacklist_status(const OperationContext& ctx,
                                                                const evmc::address& account) const = 0;
    virtual std::vector<SystemContractEvent> get_system_events(const OperationContext& ctx, SystemEventKind kind,
                                                               BlockNumRange range, const PageRequest& page) const = 0;
    virtual std::vector<SystemContractEvent> get_system_events_by_account(const OperationContext& ctx,
                                                                          const evmc::address& account,
                                                                          const PageRequest& page) const = 0;
    virtual uint64_t count_system_events(const OperationContext& ctx, SystemEventKind kind,
                                         BlockNumRange range) const = 0;
    virtual uint64_t count_system_events_by_account(const OperationContext& ctx,
                                                    const evmc::address& account) const = 0;

    //! \brief The proposal folded from its lifecycle events, std::nullopt until its creation is indexed
    virtual std::optional<Proposal> get_proposal(const OperationContext& ctx, const evmc::address& contract,
                                                 const intx::uint256& proposal_id) const = 0;

    //! \brief Proposals of contract ordered by id, restricted to status when one is given
    virtual std::vector<Proposal> get_proposals(const OperationContext& ctx, const evmc::address& contract,
                                                std::optional<ProposalStatus> status,
                                                const PageRequest& page) const = 0;
    virtual uint64_t count_proposals(const OperationContext& ctx, const evmc::address& contract,
                                     std::optional<ProposalStatus> status) const = 0;
};

class SystemContractIndexWriter {
  public:
    virtual ~SystemContractIndexWriter() = default;

    //! \brief Stores the event and applies it to total supply, minter allowances, blacklist and proposals
    virtual void put_system_event(RWTxn& txn, const SystemContractEvent& event) = 0;

    //! \brief Removes the event and reverts its effect on the derived state
    virtual void erase_system_event(RWTxn& txn, const SystemContractEvent& event) = 0;
};

//! \brief Reader/writer pair of one index family, both null when the family is disabled
template <class Reader, class Writer>
struct Capability {
    Reader* reader{nullptr};
    Writer* writer{nullptr};

    explicit operator bool() const noexcept { return reader != nullptr && writer != nullptr; }
};

//! \brief The index families a data store actually provides, to be checked before use
struct IndexCapabilities {
    Capability<AddressIndexReader, AddressIndexWriter> address;
    Capability<TokenIndexReader, TokenIndexWriter> tokens;
    Capability<ContractIndexReader, ContractIndexWriter> contracts;
    Capability<InternalTransactionIndexReader, InternalTransactionIndexWriter> internal_transactions;
    Capability<WbftIndexReader, WbftIndexWriter> wbft;
    Capability<SetCodeIndexReader, SetCodeIndexWriter> set_code;
    Capability<BalanceIndexReader, BalanceIndexWriter> balance_history;
    Capability<SystemContractIndexReader, SystemContractIndexWriter> system_contracts;
};

}  // namespace quarry::db
