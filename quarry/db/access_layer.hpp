// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// Database Access Layer for primary chain data

#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <quarry/core/types/block.hpp>
#include <quarry/core/types/receipt.hpp>
#include <quarry/core/types/transaction.hpp>
#include <quarry/db/kv/mdbx.hpp>

namespace quarry::db {

using TransactionWithLocation = std::pair<Transaction, TransactionLocation>;

//! \brief Reads the stored form of the block at the specified height
std::optional<BlockForStorage> read_block_for_storage(ROTxn& txn, BlockNum block_num);

//! \brief Reads the block at the specified height along with its transactions
//! \remarks Throws Error{kDecodeFailure} if a referenced transaction is missing
std::optional<Block> read_block(ROTxn& txn, BlockNum block_num);

//! \brief Reads the block number bound to the specified block hash
std::optional<BlockNum> read_block_num(ROTxn& txn, const evmc::bytes32& hash);

bool has_block(ROTxn& txn, BlockNum block_num);

//! \brief Upserts the block, its hash binding and its transactions
//! \details Overwriting a height removes the transactions and receipts of the replaced block, and the previous
//! hash binding. Keeps block and transaction counters and the latest height up to date
void write_block(RWTxn& txn, const Block& block);

//! \brief Removes the block at the specified height with its hash binding, transactions and receipts
//! \return false if no block is stored at the height
bool delete_block(RWTxn& txn, BlockNum block_num);

std::optional<TransactionWithLocation> read_transaction(ROTxn& txn, const evmc::bytes32& hash);

bool has_transaction(ROTxn& txn, const evmc::bytes32& hash);

//! \brief Upserts a transaction keyed by its hash
void write_transaction(RWTxn& txn, const Transaction& transaction, const TransactionLocation& location);

//! \brief Reads a receipt as stored, without derived fields
std::optional<Receipt> read_raw_receipt(ROTxn& txn, const evmc::bytes32& tx_hash);

//! \brief Reads a receipt filling gas used and effective gas price
std::optional<Receipt> read_receipt(ROTxn& txn, const evmc::bytes32& tx_hash);

//! \brief Reads the receipts of the block at the specified height ordered by tx index, with derived fields
std::vector<Receipt> read_receipts(ROTxn& txn, BlockNum block_num);

bool has_receipt(ROTxn& txn, const evmc::bytes32& tx_hash);

//! \brief Upserts a receipt keyed by its tx hash
void write_receipt(RWTxn& txn, const Receipt& receipt);

//! \brief Fills gas used and effective gas price of receipts sorted by tx index
//! \param transactions the transactions matching receipts one by one
void derive_receipt_fields(std::vector<Receipt>& receipts, const std::vector<Transaction>& transactions,
                           const std::optional<intx::uint256>& base_fee_per_gas);

/* Meta */

std::optional<uint64_t> read_meta_u64(ROTxn& txn, std::string_view key);
void write_meta_u64(RWTxn& txn, std::string_view key, uint64_t value);
void erase_meta(RWTxn& txn, std::string_view key);

std::optional<intx::uint256> read_meta_u256(ROTxn& txn, std::string_view key);
void write_meta_u256(RWTxn& txn, std::string_view key, const intx::uint256& value);

//! \brief The highest contiguous height written, std::nullopt if the store is empty
std::optional<BlockNum> read_latest_height(ROTxn& txn);

//! \brief The highest height whose secondary indexes are complete
std::optional<BlockNum> read_indexed_height(ROTxn& txn);
void write_indexed_height(RWTxn& txn, BlockNum block_num);

//! \brief The hash of the block the secondary indexes at block_num were derived from
std::optional<evmc::bytes32> read_indexed_block_hash(ROTxn& txn, BlockNum block_num);

//! \brief Marks block_num as indexed moving the indexed height forward over contiguous marked heights
void mark_block_indexed(RWTxn& txn, BlockNum block_num, const evmc::bytes32& block_hash);

//! \brief Clears the indexed mark of block_num, lowering the indexed height below it if needed
void unmark_block_indexed(RWTxn& txn, BlockNum block_num);

uint64_t read_block_count(ROTxn& txn);
uint64_t read_transaction_count(ROTxn& txn);

}  // namespace quarry::db
