// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "token_index.hpp"

#include <tuple>

#include <quarry/core/types/address.hpp>
#include <quarry/core/types/evmc_bytes32.hpp>
#include <quarry/db/tables.hpp>
#include <quarry/infra/common/log.hpp>

namespace quarry::db {

namespace {

    //! \brief The primary table of a transfer kind and its two secondary indexes
    struct TransferTables {
        const MapConfig& primary;
        const MapConfig& by_address;
        const MapConfig& by_token;
    };

    constexpr TransferTables kErc20Tables{table::kErc20Transfers, table::kErc20TransfersByAddress,
                                          table::kErc20TransfersByToken};
    constexpr TransferTables kErc721Tables{table::kErc721Transfers, table::kErc721TransfersByAddress,
                                           table::kErc721TransfersByToken};

    template <class T>
    std::optional<T> read_transfer(::mdbx::cursor& primary, const MapConfig& config, ByteView key) {
        auto data{primary.find(to_slice(key), /*throw_notfound=*/false)};
        if (!data.done) {
            return std::nullopt;
        }
        return decode_record<T>(from_slice(data.value), config.name);
    }

    template <class T>
    void put_transfer(RWTxn& txn, const TransferTables& tables, const T& transfer) {
        const auto primary_key{hash_ordinal_key(transfer.tx_hash, transfer.log_index)};
        auto primary{open_cursor(txn, tables.primary)};
        primary.upsert(to_slice(primary_key), to_slice(encode_record(transfer)));

        auto by_address{open_cursor(txn, tables.by_address)};
        by_address.upsert(to_slice(address_block_key(transfer.from, transfer.block_num, transfer.log_index)),
                          to_slice(primary_key));
        if (transfer.to != transfer.from) {
            by_address.upsert(to_slice(address_block_key(transfer.to, transfer.block_num, transfer.log_index)),
                              to_slice(primary_key));
        }

        auto by_token{open_cursor(txn, tables.by_token)};
        by_token.upsert(to_slice(address_block_key(transfer.contract, transfer.block_num, transfer.log_index)),
                        to_slice(primary_key));
    }

    template <class T>
    void erase_transfer(RWTxn& txn, const TransferTables& tables, const T& transfer) {
        auto primary{open_cursor(txn, tables.primary)};
        (void)primary.erase(to_slice(hash_ordinal_key(transfer.tx_hash, transfer.log_index)));

        auto by_address{open_cursor(txn, tables.by_address)};
        (void)by_address.erase(to_slice(address_block_key(transfer.from, transfer.block_num, transfer.log_index)));
        (void)by_address.erase(to_slice(address_block_key(transfer.to, transfer.block_num, transfer.log_index)));

        auto by_token{open_cursor(txn, tables.by_token)};
        (void)by_token.erase(to_slice(address_block_key(transfer.contract, transfer.block_num, transfer.log_index)));
    }

    //! \brief Pages over a secondary index whose values are keys of the primary table
    template <class T>
    std::vector<T> read_transfers(const OperationContext& ctx, ROTxn& txn, const MapConfig& primary_config,
                                  const MapConfig& index_config, const evmc::address& address,
                                  const PageRequest& page) {
        auto index{open_cursor(txn, index_config)};
        auto primary{open_cursor(txn, primary_config)};
        std::vector<T> transfers;
        cursor_for_page(ctx, index, address_view(address), address_view(address), page, [&](ByteView, ByteView value) {
            auto transfer{read_transfer<T>(primary, primary_config, value)};
            if (transfer) {
                transfers.push_back(std::move(*transfer));
            } else {
                QUARRY_WARN_M("Dangling transfer index entry", {"table", index_config.name, "key", to_hex(value)});
            }
            return true;
        });
        return transfers;
    }

    uint64_t count_entries(const OperationContext& ctx, ROTxn& txn, const MapConfig& config,
                           const evmc::address& address) {
        auto cursor{open_cursor(txn, config)};
        return cursor_count_range(ctx, cursor, address_view(address), address_view(address));
    }

    std::optional<NftOwnership> read_nft_owner(ROTxn& txn, const evmc::address& contract,
                                               const intx::uint256& token_id) {
        auto cursor{open_cursor(txn, table::kNftOwners)};
        auto data{cursor.find(to_slice(token_key(contract, token_id)), /*throw_notfound=*/false)};
        if (!data.done) {
            return std::nullopt;
        }
        return decode_record<NftOwnership>(from_slice(data.value), table::kNftOwners.name);
    }

    NftOwnership ownership_from(const Erc721Transfer& transfer) {
        return NftOwnership{
            .contract = transfer.contract,
            .token_id = transfer.token_id,
            .owner = transfer.to,
            .block_num = transfer.block_num,
            .log_index = transfer.log_index,
            .tx_hash = transfer.tx_hash,
        };
    }

}  // namespace

std::optional<Erc20Transfer> MdbxTokenIndex::get_erc20_transfer(const OperationContext&, const evmc::bytes32& tx_hash,
                                                                uint32_t log_index) const {
    return storage_guard("get_erc20_transfer", [&] {
        ROTxn txn{env_};
        auto primary{open_cursor(txn, table::kErc20Transfers)};
        return read_transfer<Erc20Transfer>(primary, table::kErc20Transfers, hash_ordinal_key(tx_hash, log_index));
    });
}

std::vector<Erc20Transfer> MdbxTokenIndex::get_erc20_transfers_by_address(const OperationContext& ctx,
                                                                          const evmc::address& address,
                                                                          const PageRequest& page) const {
    return storage_guard("get_erc20_transfers_by_address", [&] {
        ROTxn txn{env_};
        return read_transfers<Erc20Transfer>(ctx, txn, kErc20Tables.primary, kErc20Tables.by_address, address, page);
    });
}

std::vector<Erc20Transfer> MdbxTokenIndex::get_erc20_transfers_by_token(const OperationContext& ctx,
                                                                        const evmc::address& token,
                                                                        const PageRequest& page) const {
    return storage_guard("get_erc20_transfers_by_token", [&] {
        ROTxn txn{env_};
        return read_transfers<Erc20Transfer>(ctx, txn, kErc20Tables.primary, kErc20Tables.by_token, token, page);
    });
}

uint64_t MdbxTokenIndex::count_erc20_transfers_by_address(const OperationContext& ctx,
                                                          const evmc::address& address) const {
    return storage_guard("count_erc20_transfers_by_address", [&] {
        ROTxn txn{env_};
        return count_entries(ctx, txn, kErc20Tables.by_address, address);
    });
}

uint64_t MdbxTokenIndex::count_erc20_transfers_by_token(const OperationContext& ctx,
                                                        const evmc::address& token) const {
    return storage_guard("count_erc20_transfers_by_token", [&] {
        ROTxn txn{env_};
        return count_entries(ctx, txn, kErc20Tables.by_token, token);
    });
}

std::optional<Erc721Transfer> MdbxTokenIndex::get_erc721_transfer(const OperationContext&,
                                                                  const evmc::bytes32& tx_hash,
                                                                  uint32_t log_index) const {
    return storage_guard("get_erc721_transfer", [&] {
        ROTxn txn{env_};
        auto primary{open_cursor(txn, table::kErc721Transfers)};
        return read_transfer<Erc721Transfer>(primary, table::kErc721Transfers, hash_ordinal_key(tx_hash, log_index));
    });
}

std::vector<Erc721Transfer> MdbxTokenIndex::get_erc721_transfers_by_address(const OperationContext& ctx,
                                                                            const evmc::address& address,
                                                                            const PageRequest& page) const {
    return storage_guard("get_erc721_transfers_by_address", [&] {
        ROTxn txn{env_};
        return read_transfers<Erc721Transfer>(ctx, txn, kErc721Tables.primary, kErc721Tables.by_address, address,
                                              page);
    });
}

std::vector<Erc721Transfer> MdbxTokenIndex::get_erc721_transfers_by_token(const OperationContext& ctx,
                                                                          const evmc::address& token,
                                                                          const PageRequest& page) const {
    return storage_guard("get_erc721_transfers_by_token", [&] {
        ROTxn txn{env_};
        return read_transfers<Erc721Transfer>(ctx, txn, kErc721Tables.primary, kErc721Tables.by_token, token, page);
    });
}

uint64_t MdbxTokenIndex::count_erc721_transfers_by_address(const OperationContext& ctx,
                                                           const evmc::address& address) const {
    return storage_guard("count_erc721_transfers_by_address", [&] {
        ROTxn txn{env_};
        return count_entries(ctx, txn, kErc721Tables.by_address, address);
    });
}

uint64_t MdbxTokenIndex::count_erc721_transfers_by_token(const OperationContext& ctx,
                                                         const evmc::address& token) const {
    return storage_guard("count_erc721_transfers_by_token", [&] {
        ROTxn txn{env_};
        return count_entries(ctx, txn, kErc721Tables.by_token, token);
    });
}

std::optional<NftOwnership> MdbxTokenIndex::get_nft_owner(const OperationContext&, const evmc::address& contract,
                                                          const intx::uint256& token_id) const {
    return storage_guard("get_nft_owner", [&] {
        ROTxn txn{env_};
        return read_nft_owner(txn, contract, token_id);
    });
}

std::vector<NftOwnership> MdbxTokenIndex::get_nfts_by_owner(const OperationContext& ctx, const evmc::address& owner,
                                                            const PageRequest& page) const {
    return storage_guard("get_nfts_by_owner", [&] {
        ROTxn txn{env_};
        auto by_owner{open_cursor(txn, table::kNftsByOwner)};
        std::vector<NftOwnership> owned;
        cursor_for_page(ctx, by_owner, address_view(owner), address_view(owner), page, [&](ByteView key, ByteView) {
            ensure_stored(key.size() == 2 * kAddressLength + kHashLength, "invalid key in table NftByOwner");
            const auto contract{address_from_view(key.substr(kAddressLength))};
            const auto token_id{intx::be::unsafe::load<intx::uint256>(&key[2 * kAddressLength])};
            auto ownership{read_nft_owner(txn, contract, token_id)};
            if (ownership && ownership->owner == owner) {
                owned.push_back(std::move(*ownership));
            } else {
                QUARRY_WARN_M("Stale NFT owner index entry", {"owner", address_to_hex(owner), "key", to_hex(key)});
            }
            return true;
        });
        return owned;
    });
}

uint64_t MdbxTokenIndex::count_nfts_by_owner(const OperationContext& ctx, const evmc::address& owner) const {
    return storage_guard("count_nfts_by_owner", [&] {
        ROTxn txn{env_};
        return count_entries(ctx, txn, table::kNftsByOwner, owner);
    });
}

void MdbxTokenIndex::put_erc20_transfer(RWTxn& txn, const Erc20Transfer& transfer) {
    put_transfer(txn, kErc20Tables, transfer);
}

void MdbxTokenIndex::erase_erc20_transfer(RWTxn& txn, const Erc20Transfer& transfer) {
    erase_transfer(txn, kErc20Tables, transfer);
}

void MdbxTokenIndex::put_erc721_transfer(RWTxn& txn, const Erc721Transfer& transfer) {
    put_transfer(txn, kErc721Tables, transfer);

    const auto stored{read_nft_owner(txn, transfer.contract, transfer.token_id)};
    if (stored && std::tie(transfer.block_num, transfer.log_index) <= std::tie(stored->block_num, stored->log_index)) {
        return;
    }
    set_nft_owner(txn, stored, ownership_from(transfer));
}

void MdbxTokenIndex::erase_erc721_transfer(RWTxn& txn, const Erc721Transfer& transfer) {
    erase_transfer(txn, kErc721Tables, transfer);

    const auto stored{read_nft_owner(txn, transfer.contract, transfer.token_id)};
    if (!stored || stored->block_num != transfer.block_num || stored->log_index != transfer.log_index) {
        return;
    }

    // Ownership goes back to the most recent remaining transfer of the token
    auto by_token{open_cursor(txn, table::kErc721TransfersByToken)};
    auto primary{open_cursor(txn, table::kErc721Transfers)};
    std::optional<Erc721Transfer> previous;
    cursor_for_range(
        by_token, address_view(transfer.contract), address_view(transfer.contract),
        [&](ByteView, ByteView value) {
            auto candidate{read_transfer<Erc721Transfer>(primary, table::kErc721Transfers, value)};
            if (candidate && candidate->token_id == transfer.token_id) {
                previous = std::move(candidate);
                return false;
            }
            return true;
        },
        CursorMoveDirection::kReverse);

    if (previous) {
        set_nft_owner(txn, stored, ownership_from(*previous));
    } else {
        clear_nft_owner(txn, *stored);
    }
}

void MdbxTokenIndex::set_nft_owner(RWTxn& txn, const std::optional<NftOwnership>& previous,
                                   const NftOwnership& current) {
    auto owners{open_cursor(txn, table::kNftOwners)};
    owners.upsert(to_slice(token_key(current.contract, current.token_id)), to_slice(encode_record(current)));

    auto by_owner{open_cursor(txn, table::kNftsByOwner)};
    if (previous) {
        (void)by_owner.erase(to_slice(owned_token_key(previous->owner, previous->contract, previous->token_id)));
    }
    // Burnt tokens keep their ownership record but leave the owner index
    if (current.owner != kZeroAddress) {
        by_owner.upsert(to_slice(owned_token_key(current.owner, current.contract, current.token_id)),
                        to_slice(block_key(current.block_num)));
    }
}

void MdbxTokenIndex::clear_nft_owner(RWTxn& txn, const NftOwnership& current) {
    auto owners{open_cursor(txn, table::kNftOwners)};
    (void)owners.erase(to_slice(token_key(current.contract, current.token_id)));
    auto by_owner{open_cursor(txn, table::kNftsByOwner)};
    (void)by_owner.erase(to_slice(owned_token_key(current.owner, current.contract, current.token_id)));
}

}  // namespace quarry::db
