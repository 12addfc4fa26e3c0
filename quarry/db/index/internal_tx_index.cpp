// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "internal_tx_index.hpp"

#include <quarry/core/common/endian.hpp>
#include <quarry/core/types/address.hpp>
#include <quarry/core/types/evmc_bytes32.hpp>
#include <quarry/db/access_layer.hpp>
#include <quarry/db/tables.hpp>

namespace quarry::db {

namespace {

    ByteView hash_view(const evmc::bytes32& hash) { return {hash.bytes, kHashLength}; }

    std::vector<InternalTransaction> read_frames(const OperationContext& ctx, ROTxn& txn,
                                                 const evmc::bytes32& tx_hash) {
        auto cursor{open_cursor(txn, table::kInternalTransactions)};
        std::vector<InternalTransaction> frames;
        cursor_for_prefix(cursor, hash_view(tx_hash), [&](ByteView, ByteView value) {
            ctx.throw_if_cancelled();
            frames.push_back(decode_record<InternalTransaction>(value, table::kInternalTransactions.name));
            return true;
        });
        return frames;
    }

    void erase_address_entry(::mdbx::cursor& by_address, const evmc::address& address,
                             const InternalTransaction& frame) {
        (void)by_address.erase(
            to_slice(address_block_key(address, frame.block_num, frame.tx_index, frame.index)));
    }

}  // namespace

std::vector<InternalTransaction> MdbxInternalTransactionIndex::get_internal_transactions(
    const OperationContext& ctx, const evmc::bytes32& tx_hash) const {
    return storage_guard("get_internal_transactions", [&] {
        ROTxn txn{env_};
        return read_frames(ctx, txn, tx_hash);
    });
}

std::vector<InternalTransaction> MdbxInternalTransactionIndex::get_internal_transactions_by_address(
    const OperationContext& ctx, const evmc::address& address, const PageRequest& page) const {
    return storage_guard("get_internal_transactions_by_address", [&] {
        ROTxn txn{env_};
        auto by_address{open_cursor(txn, table::kInternalTransactionsByAddress)};
        auto frames{open_cursor(txn, table::kInternalTransactions)};
        std::vector<InternalTransaction> result;
        cursor_for_page(ctx, by_address, address_view(address), address_view(address), page,
                        [&](ByteView key, ByteView value) {
                            ensure_stored(key.size() == kAddressLength + sizeof(BlockNum) + 2 * sizeof(uint32_t),
                                         "invalid key in table InternalTransactionByAddress");
                            const uint32_t call_index{endian::load_big_u32(&key[key.size() - sizeof(uint32_t)])};
                            const auto primary_key{hash_ordinal_key(hash_from_view(value), call_index)};
                            auto data{frames.find(to_slice(primary_key), /*throw_notfound=*/false)};
                            if (data.done) {
                                result.push_back(decode_record<InternalTransaction>(
                                    from_slice(data.value), table::kInternalTransactions.name));
                            }
                            return true;
                        });
        return result;
    });
}

uint64_t MdbxInternalTransactionIndex::count_internal_transactions_by_address(const OperationContext& ctx,
                                                                              const evmc::address& address) const {
    return storage_guard("count_internal_transactions_by_address", [&] {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kInternalTransactionsByAddress)};
        return static_cast<uint64_t>(cursor_count_range(ctx, cursor, address_view(address), address_view(address)));
    });
}

void MdbxInternalTransactionIndex::save_internal_transactions(const OperationContext& ctx,
                                                              const evmc::bytes32& tx_hash,
                                                              std::vector<InternalTransaction> traces) {
    ctx.throw_if_cancelled();
    storage_guard("save_internal_transactions", [&] {
        RWTxn txn{env_};
        const auto stored{read_transaction(txn, tx_hash)};
        if (!stored) {
            throw Error{ErrorCode::kNotFound, "unknown transaction " + to_hex(tx_hash, /*with_prefix=*/true)};
        }
        const TransactionLocation& location{stored->second};

        erase_internal_transactions(txn, tx_hash);

        auto frames{open_cursor(txn, table::kInternalTransactions)};
        auto by_address{open_cursor(txn, table::kInternalTransactionsByAddress)};
        for (auto& frame : traces) {
            ctx.throw_if_cancelled();
            frame.tx_hash = tx_hash;
            frame.block_num = location.block_num;
            frame.tx_index = location.tx_index;
            frames.upsert(to_slice(hash_ordinal_key(tx_hash, frame.index)), to_slice(encode_record(frame)));

            by_address.upsert(to_slice(address_block_key(frame.from, frame.block_num, frame.tx_index, frame.index)),
                              to_slice(tx_hash));
            if (frame.to != frame.from && frame.to != kZeroAddress) {
                by_address.upsert(
                    to_slice(address_block_key(frame.to, frame.block_num, frame.tx_index, frame.index)),
                    to_slice(tx_hash));
            }
        }
        txn.commit();
    });
}

void MdbxInternalTransactionIndex::erase_internal_transactions(RWTxn& txn, const evmc::bytes32& tx_hash) {
    const OperationContext ctx;
    const auto frames{read_frames(ctx, txn, tx_hash)};
    if (frames.empty()) {
        return;
    }
    auto by_address{open_cursor(txn, table::kInternalTransactionsByAddress)};
    for (const auto& frame : frames) {
        erase_address_entry(by_address, frame.from, frame);
        erase_address_entry(by_address, frame.to, frame);
    }
    auto cursor{open_cursor(txn, table::kInternalTransactions)};
    cursor_erase_prefix(cursor, hash_view(tx_hash));
}

}  // namespace quarry::db
