// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "query_engine.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>

#include <quarry/core/common/error.hpp>
#include <quarry/core/types/evmc_bytes32.hpp>
#include <quarry/infra/common/log.hpp>

namespace quarry::query {

namespace {

    template <class Reader, class Writer>
    const Reader& require(const db::Capability<Reader, Writer>& capability, std::string_view family) {
        ensure_input(capability.reader != nullptr, std::string{family} + " index is disabled");
        return *capability.reader;
    }

    //! Offset-paginated connection over an index whose matches can be counted exactly
    template <class T, class List, class Count>
    Connection<T> index_page(const db::PageRequest& page, List&& list, Count&& count) {
        Connection<T> connection;
        connection.total_count = count();
        connection.nodes = list(page);
        connection.page_info = positional_page_info(page.offset, connection.nodes.size(), connection.total_count);
        return connection;
    }

    BlockNumRange range_or_all(std::optional<BlockNumRange> range) {
        if (!range) {
            return BlockNumRange{0, kMaxBlockNum};
        }
        ensure_input(range->start <= range->end, "invalid block range " + range->to_string());
        return *range;
    }

}  // namespace

bool BlockFilter::matches(const BlockHeader& header) const {
    if (timestamp_from && header.timestamp < *timestamp_from) {
        return false;
    }
    if (timestamp_to && header.timestamp > *timestamp_to) {
        return false;
    }
    return !miner || header.beneficiary == *miner;
}

bool TransactionFilter::matches(const Transaction& txn) const {
    if (type && txn.type != *type) {
        return false;
    }
    if (from && txn.from != *from) {
        return false;
    }
    return !to || (txn.to && *txn.to == *to);
}

bool LogFilter::matches(const Log& log) const {
    if (!addresses.empty() && std::find(addresses.begin(), addresses.end(), log.address) == addresses.end()) {
        return false;
    }
    return matches_topics(log, topics);
}

QueryEngine::QueryEngine(const db::DataStore& store, QueryLimits limits) : store_{store}, limits_{limits} {
    ensure_input(limits_.max_limit > 0, "max page size must be positive");
    ensure_input(limits_.max_blocks_range > 0, "max blocks per range request must be positive");
}

Connection<Block> QueryEngine::blocks(const OperationContext& ctx, const BlockFilter& filter,
                                      const Pagination& pagination) const {
    const auto& chain{store_.chain()};
    const auto latest{chain.get_latest_height(ctx)};
    if (!latest) {
        return {};
    }

    // The regime follows the filter as supplied by the caller, before number_to defaults to the latest height
    const bool forward{filter.has_number_range()};
    const size_t limit{effective_limit(pagination, limits_)};
    BlockWindow window;
    BlockNum number_to{*latest};
    if (forward) {
        if (filter.number_to != 0) {
            number_to = filter.number_to;
        } else if (filter.number_from > *latest) {
            // Open range starting past the chain head
            Connection<Block> connection;
            connection.page_info.has_previous_page = pagination.offset > 0;
            return connection;
        }
        window = calculate_block_range_forward(filter.number_from, number_to, pagination.offset, limit);
    } else {
        window = calculate_block_range_reverse(*latest, pagination.offset, limit);
    }

    Connection<Block> connection;
    connection.page_info.has_previous_page = window.has_previous_page;
    connection.page_info.has_next_page = window.has_next_page;
    if (window.range) {
        for (auto& block : chain.get_blocks(ctx, window.range->start, window.range->end)) {
            if (filter.matches(block.header)) {
                connection.nodes.push_back(std::move(block));
            }
        }
    }
    if (!forward) {
        std::reverse(connection.nodes.begin(), connection.nodes.end());
    }

    if (filter.has_content_filter()) {
        connection.total_count = connection.nodes.size();
        connection.total_count_exact = false;
    } else if (forward) {
        // Every height up to the latest one is stored, so the stored part of [from, to] is known
        const BlockNum stored_to{std::min(number_to, *latest)};
        connection.total_count = filter.number_from <= stored_to ? stored_to - filter.number_from + 1 : 0;
    } else {
        connection.total_count = chain.get_block_count(ctx);
    }

    if (!connection.nodes.empty()) {
        connection.page_info.start_cursor = std::to_string(connection.nodes.front().header.number);
        connection.page_info.end_cursor = std::to_string(connection.nodes.back().header.number);
    }
    return connection;
}

BlocksRange QueryEngine::blocks_range(const OperationContext& ctx, BlockNum start, BlockNum end) const {
    ensure_input(start <= end, "invalid block range: start " + std::to_string(start) + " > end " +
                                   std::to_string(end));
    const auto& chain{store_.chain()};

    BlocksRange result{.start_block = start, .end_block = end, .latest_height = chain.get_latest_height(ctx)};
    if (end - start >= limits_.max_blocks_range) {
        result.end_block = start + (limits_.max_blocks_range - 1);
        QUARRY_DEBUG_M("Blocks range request limited", {"start", std::to_string(start),
                                                        "requested_end", std::to_string(end),
                                                        "end", std::to_string(result.end_block)});
    }
    if (!result.latest_height || start > *result.latest_height) {
        result.end_block = start;
        return result;
    }
    result.end_block = std::min(result.end_block, *result.latest_height);
    result.blocks = chain.get_blocks(ctx, start, result.end_block);
    result.has_more = result.end_block < *result.latest_height;
    return result;
}

std::pair<BlockNumRange, bool> QueryEngine::scan_range(std::optional<BlockNum> from_block,
                                                       std::optional<BlockNum> to_block, BlockNum latest) const {
    BlockNumRange range{from_block.value_or(0), to_block.value_or(latest)};
    ensure_input(range.start <= range.end, "invalid block range " + range.to_string());
    // Without an explicit lower bound the scan stays anchored on the newest blocks
    const bool clamped{clamp_block_range(range, limits_.max_range, /*keep_end=*/!from_block)};
    if (clamped) {
        QUARRY_DEBUG_M("Block scan clamped", {"range", range.to_string()});
    }
    return {range, clamped};
}

Connection<TransactionNode> QueryEngine::transactions(const OperationContext& ctx, const TransactionFilter& filter,
                                                      const Pagination& pagination) const {
    const auto& chain{store_.chain()};
    const auto latest{chain.get_latest_height(ctx)};
    if (!latest) {
        return {};
    }
    const auto [range, clamped]{scan_range(filter.from_block, filter.to_block, *latest)};

    std::vector<TransactionNode> matches;
    for (auto& block : chain.get_blocks(ctx, range.start, range.end)) {
        for (uint32_t i{0}; i < block.transactions.size(); ++i) {
            if (!filter.matches(block.transactions[i])) {
                continue;
            }
            matches.push_back(TransactionNode{
                .transaction = std::move(block.transactions[i]),
                .location = TransactionLocation{block.header.number, block.header.hash, i},
                .block_timestamp = block.header.timestamp,
            });
        }
    }
    std::reverse(matches.begin(), matches.end());

    Connection<TransactionNode> connection;
    if (filter.has_content_filter() || filter.has_block_range()) {
        connection.total_count = matches.size();
        connection.total_count_exact = !clamped;
    } else {
        connection.total_count = chain.get_transaction_count(ctx);
    }

    const size_t limit{effective_limit(pagination, limits_)};
    const size_t match_count{matches.size()};
    connection.nodes = slice_page(std::move(matches), pagination.offset, limit);
    connection.page_info.has_next_page = pagination.offset + connection.nodes.size() < match_count;
    connection.page_info.has_previous_page = pagination.offset > 0;
    if (!connection.nodes.empty()) {
        connection.page_info.start_cursor = to_hex(connection.nodes.front().transaction.hash, /*with_prefix=*/true);
        connection.page_info.end_cursor = to_hex(connection.nodes.back().transaction.hash, /*with_prefix=*/true);
    }
    return connection;
}

Connection<Log> QueryEngine::logs(const OperationContext& ctx, const LogFilter& filter,
                                  const Pagination& pagination) const {
    const auto& chain{store_.chain()};
    const auto latest{chain.get_latest_height(ctx)};
    if (!latest) {
        return {};
    }
    const auto [range, clamped]{scan_range(filter.from_block, filter.to_block, *latest)};

    std::vector<Log> matches;
    for (BlockNum block_num{range.start}; block_num <= range.end; ++block_num) {
        ctx.throw_if_cancelled();
        for (auto& receipt : chain.get_receipts_by_block_number(ctx, block_num)) {
            for (auto& log : receipt.logs) {
                if (filter.matches(log)) {
                    matches.push_back(std::move(log));
                }
            }
        }
        if (block_num == kMaxBlockNum) {
            break;
        }
    }
    std::reverse(matches.begin(), matches.end());

    Connection<Log> connection;
    connection.total_count = matches.size();
    connection.total_count_exact = !clamped;
    connection.nodes = slice_page(std::move(matches), pagination.offset, effective_limit(pagination, limits_));
    connection.page_info = positional_page_info(pagination.offset, connection.nodes.size(), connection.total_count);
    return connection;
}

Connection<db::AddressTransaction> QueryEngine::transactions_by_address(const OperationContext& ctx,
                                                                        const evmc::address& address,
                                                                        const Pagination& pagination) const {
    const auto& reader{require(store_.capabilities().address, "address")};
    return index_page<db::AddressTransaction>(
        to_page_request(pagination, limits_),
        [&](const db::PageRequest& page) { return reader.get_address_transactions(ctx, address, page); },
        [&] { return reader.count_address_transactions(ctx, address); });
}

Connection<db::Erc20Transfer> QueryEngine::erc20_transfers_by_address(const OperationContext& ctx,
                                                                      const evmc::address& address,
                                                                      const Pagination& pagination) const {
    const auto& reader{require(store_.capabilities().tokens, "token")};
    return index_page<db::Erc20Transfer>(
        to_page_request(pagination, limits_),
        [&](const db::PageRequest& page) { return reader.get_erc20_transfers_by_address(ctx, address, page); },
        [&] { return reader.count_erc20_transfers_by_address(ctx, address); });
}

Connection<db::Erc20Transfer> QueryEngine::erc20_transfers_by_token(const OperationContext& ctx,
                                                                    const evmc::address& token,
                                                                    const Pagination& pagination) const {
    const auto& reader{require(store_.capabilities().tokens, "token")};
    return index_page<db::Erc20Transfer>(
        to_page_request(pagination, limits_),
        [&](const db::PageRequest& page) { return reader.get_erc20_transfers_by_token(ctx, token, page); },
        [&] { return reader.count_erc20_transfers_by_token(ctx, token); });
}

Connection<db::Erc721Transfer> QueryEngine::erc721_transfers_by_address(const OperationContext& ctx,
                                                                        const evmc::address& address,
                                                                        const Pagination& pagination) const {
    const auto& reader{require(store_.capabilities().tokens, "token")};
    return index_page<db::Erc721Transfer>(
        to_page_request(pagination, limits_),
        [&](const db::PageRequest& page) { return reader.get_erc721_transfers_by_address(ctx, address, page); },
        [&] { return reader.count_erc721_transfers_by_address(ctx, address); });
}

Connection<db::Erc721Transfer> QueryEngine::erc721_transfers_by_token(const OperationContext& ctx,
                                                                      const evmc::address& token,
                                                                      const Pagination& pagination) const {
    const auto& reader{require(store_.capabilities().tokens, "token")};
    return index_page<db::Erc721Transfer>(
        to_page_request(pagination, limits_),
        [&](const db::PageRequest& page) { return reader.get_erc721_transfers_by_token(ctx, token, page); },
        [&] { return reader.count_erc721_transfers_by_token(ctx, token); });
}

Connection<db::NftOwnership> QueryEngine::nfts_by_owner(const OperationContext& ctx, const evmc::address& owner,
                                                        const Pagination& pagination) const {
    const auto& reader{require(store_.capabilities().tokens, "token")};
    return index_page<db::NftOwnership>(
        to_page_request(pagination, limits_),
        [&](const db::PageRequest& page) { return reader.get_nfts_by_owner(ctx, owner, page); },
        [&] { return reader.count_nfts_by_owner(ctx, owner); });
}

Connection<db::ContractCreation> QueryEngine::contracts_by_creator(const OperationContext& ctx,
                                                                   const evmc::address& creator,
                                                                   const Pagination& pagination) const {
    const auto& reader{require(store_.capabilities().contracts, "contract")};
    return index_page<db::ContractCreation>(
        to_page_request(pagination, limits_),
        [&](const db::PageRequest& page) { return reader.get_contracts_by_creator(ctx, creator, page); },
        [&] { return reader.count_contracts_by_creator(ctx, creator); });
}

Connection<db::InternalTransaction> QueryEngine::internal_transactions_by_address(
    const OperationContext& ctx, const evmc::address& address, const Pagination& pagination) const {
    const auto& reader{require(store_.capabilities().internal_transactions, "internal transaction")};
    return index_page<db::InternalTransaction>(
        to_page_request(pagination, limits_),
        [&](const db::PageRequest& page) { return reader.get_internal_transactions_by_address(ctx, address, page); },
        [&] { return reader.count_internal_transactions_by_address(ctx, address); });
}

Connection<db::SetCodeAuthorizationRecord> QueryEngine::set_code_authorizations_by_target(
    const OperationContext& ctx, const evmc::address& target, const Pagination& pagination) const {
    const auto& reader{require(store_.capabilities().set_code, "set-code")};
    return index_page<db::SetCodeAuthorizationRecord>(
        to_page_request(pagination, limits_),
        [&](const db::PageRequest& page) { return reader.get_set_code_authorizations_by_target(ctx, target, page); },
        [&] { return reader.count_set_code_authorizations_by_target(ctx, target); });
}

Connection<db::SetCodeAuthorizationRecord> QueryEngine::set_code_authorizations_by_authority(
    const OperationContext& ctx, const evmc::address& authority, const Pagination& pagination) const {
    const auto& reader{require(store_.capabilities().set_code, "set-code")};
    return index_page<db::SetCodeAuthorizationRecord>(
        to_page_request(pagination, limits_),
        [&](const db::PageRequest& page) {
            return reader.get_set_code_authorizations_by_authority(ctx, authority, page);
        },
        [&] { return reader.count_set_code_authorizations_by_authority(ctx, authority); });
}

Connection<db::ValidatorSigningActivity> QueryEngine::validator_activity(const OperationContext& ctx,
                                                                         const evmc::address& validator,
                                                                         std::optional<BlockNumRange> range,
                                                                         const Pagination& pagination) const {
    const auto& reader{require(store_.capabilities().wbft, "WBFT")};
    const BlockNumRange blocks{range_or_all(range)};
    return index_page<db::ValidatorSigningActivity>(
        to_page_request(pagination, limits_),
        [&](const db::PageRequest& page) { return reader.get_validator_activity(ctx, validator, blocks, page); },
        [&] { return reader.count_validator_activity(ctx, validator, blocks); });
}

std::optional<db::ValidatorSigningStats> QueryEngine::validator_stats(const OperationContext& ctx,
                                                                      const evmc::address& validator) const {
    return require(store_.capabilities().wbft, "WBFT").get_validator_stats(ctx, validator);
}

std::vector<db::ValidatorSigningStats> QueryEngine::all_validator_stats(const OperationContext& ctx) const {
    return require(store_.capabilities().wbft, "WBFT").get_all_validator_stats(ctx);
}

Connection<db::BalanceSnapshot> QueryEngine::balance_history(const OperationContext& ctx,
                                                             const evmc::address& address,
                                                             std::optional<BlockNumRange> range,
                                                             const Pagination& pagination) const {
    const auto& reader{require(store_.capabilities().balance_history, "balance history")};
    const BlockNumRange blocks{range_or_all(range)};
    return index_page<db::BalanceSnapshot>(
        to_page_request(pagination, limits_),
        [&](const db::PageRequest& page) { return reader.get_balance_history(ctx, address, blocks, page); },
        [&] { return reader.count_balance_history(ctx, address, blocks); });
}

Connection<db::SystemContractEvent> QueryEngine::system_events_by_account(const OperationContext& ctx,
                                                                          const evmc::address& account,
                                                                          const Pagination& pagination) const {
    const auto& reader{require(store_.capabilities().system_contracts, "system contract")};
    return index_page<db::SystemContractEvent>(
        to_page_request(pagination, limits_),
        [&](const db::PageRequest& page) { return reader.get_system_events_by_account(ctx, account, page); },
        [&] { return reader.count_system_events_by_account(ctx, account); });
}

Connection<db::Proposal> QueryEngine::proposals(const OperationContext& ctx, const evmc::address& contract,
                                                std::optional<db::ProposalStatus> status,
                                                const Pagination& pagination) const {
    const auto& reader{require(store_.capabilities().system_contracts, "system contract")};
    return index_page<db::Proposal>(
        to_page_request(pagination, limits_),
        [&](const db::PageRequest& page) { return reader.get_proposals(ctx, contract, status, page); },
        [&] { return reader.count_proposals(ctx, contract, status); });
}

}  // namespace quarry::query
