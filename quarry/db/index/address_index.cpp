// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "address_index.hpp"

#include <quarry/core/common/endian.hpp>
#include <quarry/db/tables.hpp>

namespace quarry::db {

std::vector<AddressTransaction> MdbxAddressIndex::get_address_transactions(const OperationContext& ctx,
                                                                           const evmc::address& address,
                                                                           const PageRequest& page) const {
    return storage_guard("get_address_transactions", [&] {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kAddressTransactions)};
        std::vector<AddressTransaction> entries;
        cursor_for_page(ctx, cursor, address_view(address), address_view(address), page,
                        [&](ByteView key, ByteView value) {
                            ensure_stored(key.size() == kAddressLength + sizeof(BlockNum) + sizeof(uint32_t),
                                         "invalid key in table AddressTransaction");
                            entries.push_back(AddressTransaction{
                                .address = address,
                                .block_num = address_key_block_num(key),
                                .tx_index = endian::load_big_u32(&key[kAddressLength + sizeof(BlockNum)]),
                                .tx_hash = hash_from_view(value),
                            });
                            return true;
                        });
        return entries;
    });
}

uint64_t MdbxAddressIndex::count_address_transactions(const OperationContext& ctx,
                                                      const evmc::address& address) const {
    return storage_guard("count_address_transactions", [&] {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kAddressTransactions)};
        return static_cast<uint64_t>(cursor_count_range(ctx, cursor, address_view(address), address_view(address)));
    });
}

void MdbxAddressIndex::put_address_transaction(RWTxn& txn, const AddressTransaction& entry) {
    auto cursor{open_cursor(txn, table::kAddressTransactions)};
    const auto key{address_block_key(entry.address, entry.block_num, entry.tx_index)};
    cursor.upsert(to_slice(key), to_slice(entry.tx_hash));
}

void MdbxAddressIndex::erase_address_transaction(RWTxn& txn, const AddressTransaction& entry) {
    auto cursor{open_cursor(txn, table::kAddressTransactions)};
    const auto key{address_block_key(entry.address, entry.block_num, entry.tx_index)};
    (void)cursor.erase(to_slice(key));
}

}  // namespace quarry::db
