// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <utility>
#include <vector>

#include <evmc/evmc.hpp>

#include <quarry/core/types/block.hpp>
#include <quarry/core/types/log.hpp>
#include <quarry/core/types/transaction.hpp>
#include <quarry/db/data_store.hpp>
#include <quarry/db/index/records.hpp>
#include <quarry/infra/concurrency/operation_context.hpp>
#include <quarry/query/pagination.hpp>

namespace quarry::query {

//! \brief Block selection: a non-zero number_from or number_to switches to ascending paging over that interval,
//! number_to equal to 0 then meaning the latest height
struct BlockFilter {
    BlockNum number_from{0};
    BlockNum number_to{0};
    std::optional<BlockTime> timestamp_from;
    std::optional<BlockTime> timestamp_to;
    std::optional<evmc::address> miner;

    bool has_number_range() const noexcept { return number_from != 0 || number_to != 0; }
    bool has_content_filter() const noexcept { return timestamp_from || timestamp_to || miner; }
    bool matches(const BlockHeader& header) const;
};

struct BlocksRange {
    std::vector<Block> blocks;
    BlockNum start_block{0};
    BlockNum end_block{0};
    bool has_more{false};
    std::optional<BlockNum> latest_height;
};

//! \brief Transaction selection over [from_block, to_block], the bounds defaulting to genesis and the latest height
struct TransactionFilter {
    std::optional<BlockNum> from_block;
    std::optional<BlockNum> to_block;
    std::optional<evmc::address> from;
    std::optional<evmc::address> to;  // never matches a contract creation
    std::optional<TransactionType> type;

    bool has_block_range() const noexcept { return from_block || to_block; }
    bool has_content_filter() const noexcept { return from || to || type; }
    bool matches(const Transaction& txn) const;
};

struct TransactionNode {
    Transaction transaction;
    TransactionLocation location;
    BlockTime block_timestamp{0};
};

//! \brief Log selection over [from_block, to_block] by emitter and positional topics
struct LogFilter {
    std::optional<BlockNum> from_block;
    std::optional<BlockNum> to_block;
    std::vector<evmc::address> addresses;
    std::vector<std::vector<evmc::bytes32>> topics;

    bool matches(const Log& log) const;
};

//! \brief Read side of the store: paginated connections over blocks, transactions, logs and the index families
//! \details Every query captures the latest height once and performs all of its range math against it.
//! Queries over a disabled index family throw Error{kInvalidInput}
class QueryEngine {
  public:
    explicit QueryEngine(const db::DataStore& store, QueryLimits limits = {});

    const QueryLimits& limits() const { return limits_; }

    //! \brief Latest first pages by default, ascending pages when the filter carries a number range
    //! \details Timestamp and miner criteria only filter the blocks of the selected page: in that case total_count
    //! counts the page matches and is reported as inexact
    Connection<Block> blocks(const OperationContext& ctx, const BlockFilter& filter,
                             const Pagination& pagination) const;

    //! \brief Ascending blocks in [start, end], at most max_blocks_range of them and none past the latest height
    BlocksRange blocks_range(const OperationContext& ctx, BlockNum start, BlockNum end) const;

    //! \brief Matching transactions newest first, scanning at most max_range + 1 blocks
    Connection<TransactionNode> transactions(const OperationContext& ctx, const TransactionFilter& filter,
                                             const Pagination& pagination) const;

    //! \brief Matching logs newest first, scanning at most max_range + 1 blocks
    Connection<Log> logs(const OperationContext& ctx, const LogFilter& filter, const Pagination& pagination) const;

    Connection<db::AddressTransaction> transactions_by_address(const OperationContext& ctx,
                                                               const evmc::address& address,
                                                               const Pagination& pagination) const;

    Connection<db::Erc20Transfer> erc20_transfers_by_address(const OperationContext& ctx,
                                                             const evmc::address& address,
                                                             const Pagination& pagination) const;
    Connection<db::Erc20Transfer> erc20_transfers_by_token(const OperationContext& ctx, const evmc::address& token,
                                                           const Pagination& pagination) const;
    Connection<db::Erc721Transfer> erc721_transfers_by_address(const OperationContext& ctx,
                                                               const evmc::address& address,
                                                               const Pagination& pagination) const;
    Connection<db::Erc721Transfer> erc721_transfers_by_token(const OperationContext& ctx,
                                                             const evmc::address& token,
                                                             const Pagination& pagination) const;
    Connection<db::NftOwnership> nfts_by_owner(const OperationContext& ctx, const evmc::address& owner,
                                               const Pagination& pagination) const;

    Connection<db::ContractCreation> contracts_by_creator(const OperationContext& ctx,
                                                          const evmc::address& creator,
                                                          const Pagination& pagination) const;

    Connection<db::InternalTransaction> internal_transactions_by_address(const OperationContext& ctx,
                                                                         const evmc::address& address,
                                                                         const Pagination& pagination) const;

    Connection<db::SetCodeAuthorizationRecord> set_code_authorizations_by_target(
        const OperationContext& ctx, const evmc::address& target, const Pagination& pagination) const;
    Connection<db::SetCodeAuthorizationRecord> set_code_authorizations_by_authority(
        const OperationContext& ctx, const evmc::address& authority, const Pagination& pagination) const;

    //! \param range blocks to consider, the whole chain when unset
    Connection<db::ValidatorSigningActivity> validator_activity(const OperationContext& ctx,
                                                                const evmc::address& validator,
                                                                std::optional<BlockNumRange> range,
                                                                const Pagination& pagination) const;
    std::optional<db::ValidatorSigningStats> validator_stats(const OperationContext& ctx,
                                                             const evmc::address& validator) const;
    std::vector<db::ValidatorSigningStats> all_validator_stats(const OperationContext& ctx) const;

    //! \param range blocks to consider, the whole chain when unset
    Connection<db::BalanceSnapshot> balance_history(const OperationContext& ctx, const evmc::address& address,
                                                    std::optional<BlockNumRange> range,
                                                    const Pagination& pagination) const;

    Connection<db::SystemContractEvent> system_events_by_account(const OperationContext& ctx,
                                                                 const evmc::address& account,
                                                                 const Pagination& pagination) const;

    //! \brief Governance proposals of contract, highest id first
    //! \param status restricts the page to proposals in that status, all statuses when unset
    Connection<db::Proposal> proposals(const OperationContext& ctx, const evmc::address& contract,
                                       std::optional<db::ProposalStatus> status, const Pagination& pagination) const;

  private:
    //! \brief The block scan of a transaction or log query with the flag telling whether it has been clamped
    std::pair<BlockNumRange, bool> scan_range(std::optional<BlockNum> from_block, std::optional<BlockNum> to_block,
                                              BlockNum latest) const;

    const db::DataStore& store_;
    QueryLimits limits_;
};

}  // namespace quarry::query
