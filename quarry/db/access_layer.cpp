// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "access_layer.hpp"

#include <algorithm>
#include <string>

#include <quarry/core/common/endian.hpp>
#include <quarry/core/common/error.hpp>
#include <quarry/core/rlp/encode.hpp>
#include <quarry/db/tables.hpp>
#include <quarry/db/util.hpp>

namespace quarry::db {

namespace {

    Bytes encode_stored_transaction(const Transaction& transaction, const TransactionLocation& location) {
        Bytes payload;
        rlp::encode(payload, transaction);
        rlp::encode(payload, location);
        Bytes encoded;
        rlp::encode_list(encoded, payload);
        return encoded;
    }

    TransactionWithLocation decode_stored_transaction(ByteView data) {
        auto payload{rlp::decode_list(data)};
        success_or_throw(payload, "malformed record in table Transaction");
        TransactionWithLocation decoded;
        success_or_throw(rlp::decode(*payload, decoded.first, rlp::Leftover::kAllow),
                         "malformed transaction in table Transaction");
        success_or_throw(rlp::decode(*payload, decoded.second), "malformed location in table Transaction");
        return decoded;
    }

    void erase_transaction(RWTxn& txn, const evmc::bytes32& hash) {
        auto transactions{open_cursor(txn, table::kTransactions)};
        if (transactions.erase(to_slice(hash))) {
            const uint64_t count{read_transaction_count(txn)};
            write_meta_u64(txn, table::kTransactionCountKey, count > 0 ? count - 1 : 0);
        }
        auto receipts{open_cursor(txn, table::kReceipts)};
        (void)receipts.erase(to_slice(hash));
    }

    //! \brief Moves the latest height forward after writing block_num, skipping over heights already stored
    void advance_latest_height(RWTxn& txn, BlockNum block_num) {
        const auto latest{read_latest_height(txn)};
        if (latest && block_num != *latest + 1) {
            return;
        }
        BlockNum height{block_num};
        while (height < kMaxBlockNum && has_block(txn, height + 1)) {
            ++height;
        }
        write_meta_u64(txn, table::kLatestHeightKey, height);
    }

}  // namespace

std::optional<BlockForStorage> read_block_for_storage(ROTxn& txn, BlockNum block_num) {
    auto cursor{open_cursor(txn, table::kBlocks)};
    const auto key{block_key(block_num)};
    auto data{cursor.find(to_slice(key), /*throw_notfound=*/false)};
    if (!data.done) {
        return std::nullopt;
    }
    ByteView data_view{from_slice(data.value)};
    BlockForStorage stored;
    success_or_throw(rlp::decode(data_view, stored),
                     "malformed record in table Block at " + std::to_string(block_num));
    return stored;
}

std::optional<Block> read_block(ROTxn& txn, BlockNum block_num) {
    auto stored{read_block_for_storage(txn, block_num)};
    if (!stored) {
        return std::nullopt;
    }
    Block block;
    block.header = std::move(stored->header);
    block.ommer_hashes = std::move(stored->ommer_hashes);
    block.transactions.reserve(stored->transaction_hashes.size());
    for (const auto& tx_hash : stored->transaction_hashes) {
        auto transaction{read_transaction(txn, tx_hash)};
        if (!transaction) {
            throw Error{ErrorCode::kDecodeFailure,
                        "block " + std::to_string(block_num) + " references a missing transaction"};
        }
        block.transactions.push_back(std::move(transaction->first));
    }
    return block;
}

std::optional<BlockNum> read_block_num(ROTxn& txn, const evmc::bytes32& hash) {
    auto cursor{open_cursor(txn, table::kBlockHashes)};
    auto data{cursor.find(to_slice(hash), /*throw_notfound=*/false)};
    if (!data.done) {
        return std::nullopt;
    }
    if (data.value.length() != sizeof(BlockNum)) {
        throw Error{ErrorCode::kDecodeFailure,
                    "Bad block number size " + std::to_string(data.value.length()) + " in db"};
    }
    return endian::load_big_u64(static_cast<const uint8_t*>(data.value.data()));
}

bool has_block(ROTxn& txn, BlockNum block_num) {
    auto cursor{open_cursor(txn, table::kBlocks)};
    const auto key{block_key(block_num)};
    return cursor.seek(to_slice(key));
}

void write_block(RWTxn& txn, const Block& block) {
    const BlockNum block_num{block.header.number};
    const auto tx_hashes{block.transaction_hashes()};

    const auto previous{read_block_for_storage(txn, block_num)};
    if (previous) {
        if (previous->header.hash != block.header.hash) {
            auto hashes{open_cursor(txn, table::kBlockHashes)};
            (void)hashes.erase(to_slice(previous->header.hash));
        }
        for (const auto& old_hash : previous->transaction_hashes) {
            if (std::find(tx_hashes.begin(), tx_hashes.end(), old_hash) == tx_hashes.end()) {
                erase_transaction(txn, old_hash);
            }
        }
    } else {
        write_meta_u64(txn, table::kBlockCountKey, read_block_count(txn) + 1);
    }

    BlockForStorage stored{block.header, tx_hashes, block.ommer_hashes};
    Bytes value;
    rlp::encode(value, stored);
    const auto key{block_key(block_num)};
    auto blocks{open_cursor(txn, table::kBlocks)};
    blocks.upsert(to_slice(key), to_slice(value));

    auto hashes{open_cursor(txn, table::kBlockHashes)};
    hashes.upsert(to_slice(block.header.hash), to_slice(key));

    for (uint32_t i{0}; i < block.transactions.size(); ++i) {
        write_transaction(txn, block.transactions[i], {block_num, block.header.hash, i});
    }

    advance_latest_height(txn, block_num);
}

bool delete_block(RWTxn& txn, BlockNum block_num) {
    const auto stored{read_block_for_storage(txn, block_num)};
    if (!stored) {
        return false;
    }
    for (const auto& tx_hash : stored->transaction_hashes) {
        const auto transaction{read_transaction(txn, tx_hash)};
        if (transaction && transaction->second.block_num != block_num) {
            continue;  // relocated by a later write
        }
        erase_transaction(txn, tx_hash);
    }

    auto hashes{open_cursor(txn, table::kBlockHashes)};
    const auto bound{read_block_num(txn, stored->header.hash)};
    if (bound && *bound == block_num) {
        (void)hashes.erase(to_slice(stored->header.hash));
    }

    auto blocks{open_cursor(txn, table::kBlocks)};
    const auto key{block_key(block_num)};
    (void)blocks.erase(to_slice(key));

    const uint64_t block_count{read_block_count(txn)};
    write_meta_u64(txn, table::kBlockCountKey, block_count > 0 ? block_count - 1 : 0);

    const auto latest{read_latest_height(txn)};
    if (latest && block_num <= *latest) {
        if (block_num > 0 && has_block(txn, block_num - 1)) {
            write_meta_u64(txn, table::kLatestHeightKey, block_num - 1);
        } else {
            erase_meta(txn, table::kLatestHeightKey);
        }
    }
    unmark_block_indexed(txn, block_num);
    return true;
}

std::optional<TransactionWithLocation> read_transaction(ROTxn& txn, const evmc::bytes32& hash) {
    auto cursor{open_cursor(txn, table::kTransactions)};
    auto data{cursor.find(to_slice(hash), /*throw_notfound=*/false)};
    if (!data.done) {
        return std::nullopt;
    }
    return decode_stored_transaction(from_slice(data.value));
}

bool has_transaction(ROTxn& txn, const evmc::bytes32& hash) {
    auto cursor{open_cursor(txn, table::kTransactions)};
    return cursor.seek(to_slice(hash));
}

void write_transaction(RWTxn& txn, const Transaction& transaction, const TransactionLocation& location) {
    auto cursor{open_cursor(txn, table::kTransactions)};
    if (!cursor.seek(to_slice(transaction.hash))) {
        write_meta_u64(txn, table::kTransactionCountKey, read_transaction_count(txn) + 1);
    }
    const Bytes value{encode_stored_transaction(transaction, location)};
    cursor.upsert(to_slice(transaction.hash), to_slice(value));
}

std::optional<Receipt> read_raw_receipt(ROTxn& txn, const evmc::bytes32& tx_hash) {
    auto cursor{open_cursor(txn, table::kReceipts)};
    auto data{cursor.find(to_slice(tx_hash), /*throw_notfound=*/false)};
    if (!data.done) {
        return std::nullopt;
    }
    ByteView data_view{from_slice(data.value)};
    Receipt receipt;
    success_or_throw(rlp::decode(data_view, receipt), "malformed record in table Receipt");
    return receipt;
}

std::optional<Receipt> read_receipt(ROTxn& txn, const evmc::bytes32& tx_hash) {
    auto receipt{read_raw_receipt(txn, tx_hash)};
    if (!receipt) {
        return std::nullopt;
    }

    uint64_t previous_cumulative{0};
    std::optional<intx::uint256> base_fee;
    if (const auto stored{read_block_for_storage(txn, receipt->block_num)}) {
        base_fee = stored->header.base_fee_per_gas;
        if (receipt->tx_index > 0 && receipt->tx_index <= stored->transaction_hashes.size()) {
            const auto previous{read_raw_receipt(txn, stored->transaction_hashes[receipt->tx_index - 1])};
            if (previous) {
                previous_cumulative = previous->cumulative_gas_used;
            }
        }
    }
    receipt->gas_used = receipt->cumulative_gas_used >= previous_cumulative
                            ? receipt->cumulative_gas_used - previous_cumulative
                            : 0;

    if (const auto transaction{read_transaction(txn, tx_hash)}) {
        receipt->effective_gas_price = transaction->first.effective_gas_price(base_fee);
    }
    return receipt;
}

std::vector<Receipt> read_receipts(ROTxn& txn, BlockNum block_num) {
    std::vector<Receipt> receipts;
    const auto stored{read_block_for_storage(txn, block_num)};
    if (!stored) {
        return receipts;
    }

    std::vector<Transaction> transactions;
    for (const auto& tx_hash : stored->transaction_hashes) {
        auto receipt{read_raw_receipt(txn, tx_hash)};
        if (!receipt) {
            continue;
        }
        auto transaction{read_transaction(txn, tx_hash)};
        if (!transaction) {
            continue;
        }
        receipts.push_back(std::move(*receipt));
        transactions.push_back(std::move(transaction->first));
    }
    derive_receipt_fields(receipts, transactions, stored->header.base_fee_per_gas);
    return receipts;
}

bool has_receipt(ROTxn& txn, const evmc::bytes32& tx_hash) {
    auto cursor{open_cursor(txn, table::kReceipts)};
    return cursor.seek(to_slice(tx_hash));
}

void write_receipt(RWTxn& txn, const Receipt& receipt) {
    Bytes value;
    rlp::encode(value, receipt);
    auto cursor{open_cursor(txn, table::kReceipts)};
    cursor.upsert(to_slice(receipt.tx_hash), to_slice(value));
}

void derive_receipt_fields(std::vector<Receipt>& receipts, const std::vector<Transaction>& transactions,
                           const std::optional<intx::uint256>& base_fee_per_gas) {
    derive_gas_used(receipts);
    const size_t count{std::min(receipts.size(), transactions.size())};
    for (size_t i{0}; i < count; ++i) {
        receipts[i].effective_gas_price = transactions[i].effective_gas_price(base_fee_per_gas);
    }
}

std::optional<uint64_t> read_meta_u64(ROTxn& txn, std::string_view key) {
    auto cursor{open_cursor(txn, table::kMeta)};
    const auto meta{meta_key(key)};
    auto data{cursor.find(to_slice(meta), /*throw_notfound=*/false)};
    if (!data.done) {
        return std::nullopt;
    }
    if (data.value.length() != sizeof(uint64_t)) {
        throw Error{ErrorCode::kDecodeFailure, "Bad size of meta value " + std::string{key}};
    }
    return endian::load_big_u64(static_cast<const uint8_t*>(data.value.data()));
}

void write_meta_u64(RWTxn& txn, std::string_view key, uint64_t value) {
    auto cursor{open_cursor(txn, table::kMeta)};
    Bytes data(sizeof(uint64_t), '\0');
    endian::store_big_u64(data.data(), value);
    const auto meta{meta_key(key)};
    cursor.upsert(to_slice(meta), to_slice(data));
}

void erase_meta(RWTxn& txn, std::string_view key) {
    auto cursor{open_cursor(txn, table::kMeta)};
    const auto meta{meta_key(key)};
    (void)cursor.erase(to_slice(meta));
}

std::optional<intx::uint256> read_meta_u256(ROTxn& txn, std::string_view key) {
    auto cursor{open_cursor(txn, table::kMeta)};
    const auto meta{meta_key(key)};
    auto data{cursor.find(to_slice(meta), /*throw_notfound=*/false)};
    if (!data.done) {
        return std::nullopt;
    }
    if (data.value.length() != kHashLength) {
        throw Error{ErrorCode::kDecodeFailure, "Bad size of meta value " + std::string{key}};
    }
    return intx::be::unsafe::load<intx::uint256>(static_cast<const uint8_t*>(data.value.data()));
}

void write_meta_u256(RWTxn& txn, std::string_view key, const intx::uint256& value) {
    auto cursor{open_cursor(txn, table::kMeta)};
    Bytes data(kHashLength, '\0');
    intx::be::unsafe::store(data.data(), value);
    const auto meta{meta_key(key)};
    cursor.upsert(to_slice(meta), to_slice(data));
}

std::optional<BlockNum> read_latest_height(ROTxn& txn) {
    return read_meta_u64(txn, table::kLatestHeightKey);
}

std::optional<BlockNum> read_indexed_height(ROTxn& txn) {
    return read_meta_u64(txn, table::kIndexedHeightKey);
}

void write_indexed_height(RWTxn& txn, BlockNum block_num) {
    write_meta_u64(txn, table::kIndexedHeightKey, block_num);
}

std::optional<evmc::bytes32> read_indexed_block_hash(ROTxn& txn, BlockNum block_num) {
    auto cursor{open_cursor(txn, table::kIndexedBlocks)};
    const auto key{block_key(block_num)};
    auto data{cursor.find(to_slice(key), /*throw_notfound=*/false)};
    if (!data.done) {
        return std::nullopt;
    }
    if (data.value.length() != kHashLength) {
        throw Error{ErrorCode::kDecodeFailure, "Bad indexed block hash size " + std::to_string(data.value.length())};
    }
    return hash_from_view(from_slice(data.value));
}

void mark_block_indexed(RWTxn& txn, BlockNum block_num, const evmc::bytes32& block_hash) {
    auto cursor{open_cursor(txn, table::kIndexedBlocks)};
    const auto key{block_key(block_num)};
    cursor.upsert(to_slice(key), to_slice(block_hash));

    const auto indexed{read_indexed_height(txn)};
    if (indexed && block_num != *indexed + 1) {
        return;
    }
    BlockNum height{block_num};
    while (height < kMaxBlockNum) {
        const auto next{block_key(height + 1)};
        if (!cursor.seek(to_slice(next))) {
            break;
        }
        ++height;
    }
    write_indexed_height(txn, height);
}

void unmark_block_indexed(RWTxn& txn, BlockNum block_num) {
    auto cursor{open_cursor(txn, table::kIndexedBlocks)};
    const auto key{block_key(block_num)};
    (void)cursor.erase(to_slice(key));

    const auto indexed{read_indexed_height(txn)};
    if (indexed && block_num <= *indexed) {
        if (block_num > 0) {
            write_indexed_height(txn, block_num - 1);
        } else {
            erase_meta(txn, table::kIndexedHeightKey);
        }
    }
}

uint64_t read_block_count(ROTxn& txn) {
    return read_meta_u64(txn, table::kBlockCountKey).value_or(0);
}

uint64_t read_transaction_count(ROTxn& txn) {
    return read_meta_u64(txn, table::kTransactionCountKey).value_or(0);
}

}  // namespace quarry::db
