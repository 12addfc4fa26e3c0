// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <optional>
#include <span>
#include <vector>

#include <boost/asio/thread_pool.hpp>
#include <evmc/evmc.hpp>

#include <quarry/core/types/block.hpp>
#include <quarry/core/types/receipt.hpp>
#include <quarry/db/access_layer.hpp>
#include <quarry/db/kv/mdbx.hpp>
#include <quarry/infra/concurrency/operation_context.hpp>

namespace quarry::db {

//! \brief Removes the secondary records derived from an indexed height
class IndexEraser {
  public:
    virtual ~IndexEraser() = default;

    //! \brief Erases the records derived from the block and receipts currently stored at block_num
    //! \param kept_tx_hashes transactions whose per-transaction records survive the change
    virtual void erase_height(RWTxn& txn, BlockNum block_num, const std::vector<evmc::bytes32>& kept_tx_hashes) = 0;
};

//! \brief Primary chain data: blocks by height and hash, transactions and receipts by tx hash
//! \details Every read opens its own MVCC read transaction, so reads can run concurrently with the writer.
//! Every write is committed atomically. MDBX failures surface as Error{kStorageUnavailable}
//! Deleting or replacing primary data of an indexed height erases its secondary records in the same write
//! transaction through the attached IndexEraser and clears the indexed mark, so the height must be reindexed.
//! With no eraser attached such writes throw Error{kInvalidInput} and leave the store untouched.
class ChainStore {
  public:
    //! \param env an open environment whose tables exist, owned by the caller
    //! \param read_workers the number of threads serving batched transaction reads
    ChainStore(::mdbx::env env, size_t read_workers);
    ~ChainStore();

    ChainStore(const ChainStore&) = delete;
    ChainStore& operator=(const ChainStore&) = delete;

    std::optional<Block> get_block(const OperationContext& ctx, BlockNum block_num) const;
    std::optional<Block> get_block_by_hash(const OperationContext& ctx, const evmc::bytes32& hash) const;

    //! \brief Blocks in [start, end] ascending, heights without a block are skipped
    std::vector<Block> get_blocks(const OperationContext& ctx, BlockNum start, BlockNum end) const;

    std::optional<TransactionWithLocation> get_transaction(const OperationContext& ctx,
                                                           const evmc::bytes32& hash) const;

    //! \brief Looks up hashes in parallel chunks
    //! \return One slot per hash in input order, std::nullopt for unknown hashes
    std::vector<std::optional<TransactionWithLocation>> get_transactions(
        const OperationContext& ctx, std::span<const evmc::bytes32> hashes) const;

    //! \brief Receipt with gas used and effective gas price derived from its block
    std::optional<Receipt> get_receipt(const OperationContext& ctx, const evmc::bytes32& tx_hash) const;
    std::vector<Receipt> get_receipts_by_block_number(const OperationContext& ctx, BlockNum block_num) const;

    void set_block(const OperationContext& ctx, const Block& block);
    void set_blocks(const OperationContext& ctx, std::span<const Block> blocks);
    void set_transaction(const OperationContext& ctx, const Transaction& transaction,
                         const TransactionLocation& location);
    void set_receipt(const OperationContext& ctx, const Receipt& receipt);
    void set_receipts(const OperationContext& ctx, std::span<const Receipt> receipts);

    bool has_block(const OperationContext& ctx, BlockNum block_num) const;
    bool has_transaction(const OperationContext& ctx, const evmc::bytes32& hash) const;
    bool has_receipt(const OperationContext& ctx, const evmc::bytes32& tx_hash) const;

    //! \brief Removes the block at block_num with its hash binding, transactions and receipts
    //! \remarks Throws Error{kNotFound} if no block is stored at block_num
    void delete_block(const OperationContext& ctx, BlockNum block_num);

    //! \brief Attaches the eraser of secondary records, at most one at a time
    //! \remarks Throws Error{kInvalidInput} if another eraser is attached
    void attach_index_eraser(IndexEraser* eraser);
    void detach_index_eraser(IndexEraser* eraser);

    //! \brief The highest contiguous height written, std::nullopt for an empty chain
    std::optional<BlockNum> get_latest_height(const OperationContext& ctx) const;

    //! \brief The highest height whose secondary indexes are complete
    std::optional<BlockNum> get_indexed_height(const OperationContext& ctx) const;

    uint64_t get_block_count(const OperationContext& ctx) const;
    uint64_t get_transaction_count(const OperationContext& ctx) const;

  private:
    //! \brief Erases the secondary records of block_num if it is indexed, must precede the overwrite
    void release_indexed_height(RWTxn& txn, BlockNum block_num, const std::vector<evmc::bytes32>& kept_tx_hashes);

    mutable ::mdbx::env env_;
    mutable boost::asio::thread_pool read_pool_;
    size_t read_workers_;
    std::atomic<IndexEraser*> index_eraser_{nullptr};
};

}  // namespace quarry::db
