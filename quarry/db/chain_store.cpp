// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "chain_store.hpp"

#include <algorithm>
#include <future>
#include <memory>

#include <boost/asio/post.hpp>

#include <quarry/db/util.hpp>

namespace quarry::db {

namespace {

    std::vector<evmc::bytes32> transaction_hashes_at(ROTxn& txn, BlockNum block_num) {
        const auto block{read_block(txn, block_num)};
        return block ? block->transaction_hashes() : std::vector<evmc::bytes32>{};
    }

}  // namespace

ChainStore::ChainStore(::mdbx::env env, size_t read_workers)
    : env_{env}, read_pool_{std::max<size_t>(read_workers, 1)}, read_workers_{std::max<size_t>(read_workers, 1)} {}

ChainStore::~ChainStore() {
    read_pool_.join();
}

std::optional<Block> ChainStore::get_block(const OperationContext& ctx, BlockNum block_num) const {
    ctx.throw_if_cancelled();
    return storage_guard("get_block", [&] {
        ROTxn txn{env_};
        return read_block(txn, block_num);
    });
}

std::optional<Block> ChainStore::get_block_by_hash(const OperationContext& ctx, const evmc::bytes32& hash) const {
    ctx.throw_if_cancelled();
    return storage_guard("get_block_by_hash", [&]() -> std::optional<Block> {
        ROTxn txn{env_};
        const auto block_num{read_block_num(txn, hash)};
        if (!block_num) {
            return std::nullopt;
        }
        return read_block(txn, *block_num);
    });
}

std::vector<Block> ChainStore::get_blocks(const OperationContext& ctx, BlockNum start, BlockNum end) const {
    ensure_input(start <= end, "invalid block range " + BlockNumRange{start, end}.to_string());
    return storage_guard("get_blocks", [&] {
        ROTxn txn{env_};
        std::vector<Block> blocks;
        for (BlockNum block_num{start};; ++block_num) {
            ctx.throw_if_cancelled();
            auto block{read_block(txn, block_num)};
            if (block) {
                blocks.push_back(std::move(*block));
            }
            if (block_num == end) {
                break;
            }
        }
        return blocks;
    });
}

std::optional<TransactionWithLocation> ChainStore::get_transaction(const OperationContext& ctx,
                                                                   const evmc::bytes32& hash) const {
    ctx.throw_if_cancelled();
    return storage_guard("get_transaction", [&] {
        ROTxn txn{env_};
        return read_transaction(txn, hash);
    });
}

std::vector<std::optional<TransactionWithLocation>> ChainStore::get_transactions(
    const OperationContext& ctx, std::span<const evmc::bytes32> hashes) const {
    ctx.throw_if_cancelled();
    std::vector<std::optional<TransactionWithLocation>> results(hashes.size());
    if (hashes.empty()) {
        return results;
    }

    // Each chunk owns a disjoint slice of results and its own read transaction
    const size_t chunk_size{(hashes.size() + read_workers_ - 1) / read_workers_};
    std::vector<std::future<void>> pending;
    for (size_t begin{0}; begin < hashes.size(); begin += chunk_size) {
        const size_t end{std::min(begin + chunk_size, hashes.size())};
        auto task{std::make_shared<std::packaged_task<void()>>([this, &ctx, &hashes, &results, begin, end] {
            storage_guard("get_transactions", [&] {
                ROTxn txn{env_};
                for (size_t i{begin}; i < end; ++i) {
                    ctx.throw_if_cancelled();
                    results[i] = read_transaction(txn, hashes[i]);
                }
            });
        })};
        pending.push_back(task->get_future());
        boost::asio::post(read_pool_, [task] { (*task)(); });
    }

    // Wait for every chunk before rethrowing, tasks reference local state
    for (auto& future : pending) {
        future.wait();
    }
    for (auto& future : pending) {
        future.get();
    }
    return results;
}

std::optional<Receipt> ChainStore::get_receipt(const OperationContext& ctx, const evmc::bytes32& tx_hash) const {
    ctx.throw_if_cancelled();
    return storage_guard("get_receipt", [&] {
        ROTxn txn{env_};
        return read_receipt(txn, tx_hash);
    });
}

std::vector<Receipt> ChainStore::get_receipts_by_block_number(const OperationContext& ctx,
                                                              BlockNum block_num) const {
    ctx.throw_if_cancelled();
    return storage_guard("get_receipts_by_block_number", [&] {
        ROTxn txn{env_};
        return read_receipts(txn, block_num);
    });
}

void ChainStore::set_block(const OperationContext& ctx, const Block& block) {
    set_blocks(ctx, std::span<const Block>{&block, 1});
}

void ChainStore::set_blocks(const OperationContext& ctx, std::span<const Block> blocks) {
    ctx.throw_if_cancelled();
    storage_guard("set_blocks", [&] {
        RWTxn txn{env_};
        for (const auto& block : blocks) {
            ctx.throw_if_cancelled();
            release_indexed_height(txn, block.header.number, block.transaction_hashes());
            write_block(txn, block);
        }
        txn.commit();
    });
}

void ChainStore::set_transaction(const OperationContext& ctx, const Transaction& transaction,
                                 const TransactionLocation& location) {
    ctx.throw_if_cancelled();
    storage_guard("set_transaction", [&] {
        RWTxn txn{env_};
        if (read_indexed_block_hash(txn, location.block_num)) {
            release_indexed_height(txn, location.block_num, transaction_hashes_at(txn, location.block_num));
        }
        write_transaction(txn, transaction, location);
        txn.commit();
    });
}

void ChainStore::set_receipt(const OperationContext& ctx, const Receipt& receipt) {
    set_receipts(ctx, std::span<const Receipt>{&receipt, 1});
}

void ChainStore::set_receipts(const OperationContext& ctx, std::span<const Receipt> receipts) {
    ctx.throw_if_cancelled();
    storage_guard("set_receipts", [&] {
        RWTxn txn{env_};
        for (const auto& receipt : receipts) {
            ctx.throw_if_cancelled();
            const auto stored{read_transaction(txn, receipt.tx_hash)};
            if (stored && read_indexed_block_hash(txn, stored->second.block_num)) {
                const BlockNum block_num{stored->second.block_num};
                release_indexed_height(txn, block_num, transaction_hashes_at(txn, block_num));
            }
            write_receipt(txn, receipt);
        }
        txn.commit();
    });
}

bool ChainStore::has_block(const OperationContext& ctx, BlockNum block_num) const {
    ctx.throw_if_cancelled();
    return storage_guard("has_block", [&] {
        ROTxn txn{env_};
        return db::has_block(txn, block_num);
    });
}

bool ChainStore::has_transaction(const OperationContext& ctx, const evmc::bytes32& hash) const {
    ctx.throw_if_cancelled();
    return storage_guard("has_transaction", [&] {
        ROTxn txn{env_};
        return db::has_transaction(txn, hash);
    });
}

bool ChainStore::has_receipt(const OperationContext& ctx, const evmc::bytes32& tx_hash) const {
    ctx.throw_if_cancelled();
    return storage_guard("has_receipt", [&] {
        ROTxn txn{env_};
        return db::has_receipt(txn, tx_hash);
    });
}

void ChainStore::delete_block(const OperationContext& ctx, BlockNum block_num) {
    ctx.throw_if_cancelled();
    storage_guard("delete_block", [&] {
        RWTxn txn{env_};
        release_indexed_height(txn, block_num, /*kept_tx_hashes=*/{});
        if (!db::delete_block(txn, block_num)) {
            throw Error{ErrorCode::kNotFound, "no block at height " + std::to_string(block_num)};
        }
        txn.commit();
    });
}

void ChainStore::attach_index_eraser(IndexEraser* eraser) {
    IndexEraser* expected{nullptr};
    if (!index_eraser_.compare_exchange_strong(expected, eraser) && expected != eraser) {
        throw Error{ErrorCode::kInvalidInput, "another index eraser is already attached"};
    }
}

void ChainStore::detach_index_eraser(IndexEraser* eraser) {
    IndexEraser* expected{eraser};
    index_eraser_.compare_exchange_strong(expected, nullptr);
}

void ChainStore::release_indexed_height(RWTxn& txn, BlockNum block_num,
                                        const std::vector<evmc::bytes32>& kept_tx_hashes) {
    if (!read_indexed_block_hash(txn, block_num)) {
        return;
    }
    IndexEraser* eraser{index_eraser_.load()};
    if (!eraser) {
        throw Error{ErrorCode::kInvalidInput, "height " + std::to_string(block_num) +
                                                  " is indexed, change it through the index maintainer"};
    }
    eraser->erase_height(txn, block_num, kept_tx_hashes);
    unmark_block_indexed(txn, block_num);
}

std::optional<BlockNum> ChainStore::get_latest_height(const OperationContext& ctx) const {
    ctx.throw_if_cancelled();
    return storage_guard("get_latest_height", [&] {
        ROTxn txn{env_};
        return read_latest_height(txn);
    });
}

std::optional<BlockNum> ChainStore::get_indexed_height(const OperationContext& ctx) const {
    ctx.throw_if_cancelled();
    return storage_guard("get_indexed_height", [&] {
        ROTxn txn{env_};
        return read_indexed_height(txn);
    });
}

uint64_t ChainStore::get_block_count(const OperationContext& ctx) const {
    ctx.throw_if_cancelled();
    return storage_guard("get_block_count", [&] {
        ROTxn txn{env_};
        return read_block_count(txn);
    });
}

uint64_t ChainStore::get_transaction_count(const OperationContext& ctx) const {
    ctx.throw_if_cancelled();
    return storage_guard("get_transaction_count", [&] {
        ROTxn txn{env_};
        return read_transaction_count(txn);
    });
}

}  // namespace quarry::db
